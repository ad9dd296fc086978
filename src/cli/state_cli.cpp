#include "cli/state_cli.hpp"

#include <QFile>

#include <string>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/state_error.hpp"

namespace hoststate {

namespace {

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

bool hasOptionWithoutValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    return idx >= 0 && idx + 1 >= args.size();
}

StateError usageError(const std::string &message)
{
    return StateError(ErrorCode::ValidationError, message);
}

nlohmann::json readDocumentFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw usageError("Cannot read document file '" + path.toStdString() + "': "
                         + file.errorString().toStdString());
    }
    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        throw usageError("Document file '" + path.toStdString() + "' is not valid JSON");
    }
    return parsed;
}

// "--value 5" is the number 5, "--value pi" the string "pi".
nlohmann::json parseValueArg(const QString &value)
{
    const auto parsed = nlohmann::json::parse(value.toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        return value.toStdString();
    }
    return parsed;
}

} // namespace

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  hoststate load\n"
        "  hoststate save [--force-scan] [--timeout-ms N]\n"
        "  hoststate update --path PATH --value JSON\n"
        "  hoststate compare [--timeout-ms N]\n"
        "  hoststate export\n"
        "  hoststate import --document FILE\n"
        "  hoststate diff --document FILE\n"
        "  hoststate watch --path PATH\n"
        "  hoststate request '<json request>'\n"
        "Global options: --trace\n");
}

StateCli::StateCli(RequestHandler &handler, std::ostream &out, std::ostream &err)
    : m_handler(handler)
    , m_out(out)
    , m_err(err)
{
}

nlohmann::json StateCli::buildRequest(const QStringList &args)
{
    if (args.size() < 2) {
        throw usageError("Missing action");
    }

    const QString command = args.at(1);
    if (command == QStringLiteral("request")) {
        if (args.size() < 3) {
            throw usageError("request needs a JSON argument");
        }
        const auto parsed = nlohmann::json::parse(args.at(2).toStdString(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            throw usageError("request argument must be a JSON object");
        }
        return parsed;
    }

    if (!parseActionString(command.toStdString())) {
        throw usageError("Unknown action '" + command.toStdString() + "'");
    }

    for (const QString &key : {QStringLiteral("--path"), QStringLiteral("--value"),
                               QStringLiteral("--document"), QStringLiteral("--timeout-ms")}) {
        if (hasOptionWithoutValue(args, key)) {
            throw usageError(key.toStdString() + " requires a value");
        }
    }

    nlohmann::json request;
    request["action"] = command.toStdString();

    const QString path = getArgValue(args, QStringLiteral("--path"));
    if (!path.isEmpty()) {
        request["path"] = path.toStdString();
    }
    if (args.contains(QStringLiteral("--value"))) {
        request["value"] = parseValueArg(getArgValue(args, QStringLiteral("--value")));
    }
    if (args.contains(QStringLiteral("--force-scan"))) {
        request["force_scan"] = true;
    }
    const QString documentPath = getArgValue(args, QStringLiteral("--document"));
    if (!documentPath.isEmpty()) {
        request["document"] = readDocumentFile(documentPath);
    }
    const QString timeout = getArgValue(args, QStringLiteral("--timeout-ms"));
    if (!timeout.isEmpty()) {
        bool ok = false;
        const qlonglong timeoutMs = timeout.toLongLong(&ok);
        if (!ok || timeoutMs <= 0 || timeoutMs > kMaxTimeoutMs) {
            throw usageError("--timeout-ms must be an integer in 1.."
                             + std::to_string(kMaxTimeoutMs));
        }
        request["timeout_ms"] = timeoutMs;
    }
    return request;
}

int StateCli::run(const QStringList &args)
{
    nlohmann::json request;
    try {
        request = buildRequest(args);
    } catch (const StateError &error) {
        m_err << "hoststate: " << error.what() << "\n" << usageText().toStdString();
        return 2;
    }

    HSLOG_INFO(QStringLiteral("StateCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"action", request.value("action", std::string())}}));

    const nlohmann::json response = m_handler.handle(request);
    if (response.contains("error")) {
        m_err << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
        return 1;
    }

    // Export prints the bare document so that its output can be imported.
    if (request.value("action", std::string()) == "export") {
        m_out << response["result"]["document"].dump(2) << std::endl;
        return 0;
    }
    m_out << response.dump(2) << std::endl;
    return 0;
}

} // namespace hoststate
