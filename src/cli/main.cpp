#include <QCoreApplication>

#include <iostream>

#include <nlohmann/json.hpp>

#include "cli/state_cli.hpp"
#include "common/config.hpp"
#include "common/hoststate_version.hpp"
#include "common/logging.hpp"
#include "common/state_error.hpp"
#include "engine/state_service.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hoststate"));
    QCoreApplication::setApplicationVersion(QStringLiteral(HOSTSTATE_VERSION));

    bool trace = qEnvironmentVariableIntValue("HOSTSTATE_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    hoststate::logging::initLogging(QStringLiteral("hoststate"), trace);
    HSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    if (filteredArgs.size() < 2 || filteredArgs.at(1) == QStringLiteral("--help")) {
        std::cerr << hoststate::usageText().toStdString();
        return filteredArgs.size() < 2 ? 2 : 0;
    }
    if (filteredArgs.at(1) == QStringLiteral("--version")) {
        std::cout << "hoststate " << HOSTSTATE_VERSION << std::endl;
        return 0;
    }

    hoststate::StateConfig config;
    try {
        config = hoststate::loadConfig();
    } catch (const hoststate::StateError &error) {
        std::cerr << "hoststate: " << error.what() << std::endl;
        return 2;
    }

    hoststate::StateService service(config);
    hoststate::StateCli cli(service.handler(), std::cout, std::cerr);
    return cli.run(filteredArgs);
}
