#include <QCoreApplication>

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/hoststate_version.hpp"
#include "common/logging.hpp"
#include "common/state_error.hpp"
#include "daemon/state_api_server.hpp"
#include "engine/state_service.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hoststate-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(HOSTSTATE_VERSION));

    bool trace = qEnvironmentVariableIntValue("HOSTSTATE_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    hoststate::logging::initLogging(QStringLiteral("hoststate-daemon"), trace);
    HSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("default_config"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"version", HOSTSTATE_VERSION}}));

    hoststate::StateConfig config;
    try {
        config = hoststate::loadConfig();
    } catch (const hoststate::StateError &error) {
        std::cerr << "hoststate-daemon: " << error.what() << std::endl;
        return 2;
    }

    // Both live for the lifetime of the process.
    hoststate::StateService service(config);
    hoststate::StateApiServer server(service.handler(),
                                     QString::fromStdString(config.socketName));
    if (!server.start()) {
        std::cerr << "hoststate-daemon: cannot listen on " << config.socketName << std::endl;
        return 1;
    }

    return app.exec();
}
