#include "engine/request_handler.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <string>

#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/state_error.hpp"
#include "engine/state_document.hpp"

namespace hoststate {

namespace {

StateError badRequest(const std::string &message)
{
    return StateError(ErrorCode::ValidationError, message);
}

std::string requireString(const nlohmann::json &request, const char *key)
{
    if (!request.contains(key) || request.at(key).is_null()) {
        throw badRequest(std::string("Missing required field '") + key + "'");
    }
    if (!request.at(key).is_string()) {
        throw badRequest(std::string("Field '") + key + "' must be a string");
    }
    return request.at(key).get<std::string>();
}

const nlohmann::json &requireField(const nlohmann::json &request, const char *key)
{
    if (!request.contains(key) || request.at(key).is_null()) {
        throw badRequest(std::string("Missing required field '") + key + "'");
    }
    return request.at(key);
}

bool optionalBool(const nlohmann::json &request, const char *key)
{
    if (!request.contains(key) || request.at(key).is_null()) {
        return false;
    }
    if (!request.at(key).is_boolean()) {
        throw badRequest(std::string("Field '") + key + "' must be a boolean");
    }
    return request.at(key).get<bool>();
}

ScanOptions scanOptionsFor(const nlohmann::json &request,
                           ScanOptions defaults,
                           const CancellationToken *cancel)
{
    defaults.cancel = cancel;
    if (request.contains("timeout_ms") && !request.at("timeout_ms").is_null()) {
        const auto &value = request.at("timeout_ms");
        if (!value.is_number_integer() || value.get<long long>() <= 0
            || value.get<long long>() > kMaxTimeoutMs) {
            throw badRequest("Field 'timeout_ms' must be an integer in 1.."
                             + std::to_string(kMaxTimeoutMs));
        }
        defaults.timeout = std::chrono::milliseconds(value.get<long long>());
    }
    return defaults;
}

} // namespace

nlohmann::json makeErrorResponse(const nlohmann::json &error, const nlohmann::json &id)
{
    nlohmann::json response;
    response["error"] = error;
    response["id"] = id;
    return response;
}

nlohmann::json makeResultResponse(const nlohmann::json &result, const nlohmann::json &id)
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return response;
}

RequestHandler::RequestHandler(StateManager &manager)
    : m_manager(manager)
{
}

QByteArray RequestHandler::handlePayload(const QByteArray &payload,
                                         const CancellationToken *cancel)
{
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        const StateError error(ErrorCode::ValidationError, "Invalid JSON payload");
        return QByteArray::fromStdString(makeErrorResponse(error.toJson(), -1).dump());
    }
    return QByteArray::fromStdString(
        handle(parsed, cancel).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

nlohmann::json RequestHandler::handle(const nlohmann::json &request,
                                      const CancellationToken *cancel)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    hoststate::logging::CorrelationScope corrScope(corrId);

    nlohmann::json id = -1;
    if (request.is_object() && request.contains("id")
        && (request.at("id").is_number_integer() || request.at("id").is_string())) {
        id = request.at("id");
    }

    std::string actionName;
    try {
        if (!request.is_object()) {
            throw badRequest("Request must be a JSON object");
        }
        actionName = requireString(request, "action");
        const auto action = parseActionString(actionName);
        if (!action) {
            throw badRequest("Unknown action '" + actionName + "'");
        }

        HSLOG_INFO(QStringLiteral("RequestHandler"),
                   QStringLiteral("handle"),
                   QStringLiteral("request_received"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_request"),
                   hoststate::logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"action", actionName}}));

        return makeResultResponse(dispatch(*action, request, cancel), id);
    } catch (StateError &error) {
        if (!actionName.empty()) {
            error.withAction(actionName);
        }
        HSLOG_WARN(QStringLiteral("RequestHandler"),
                   QStringLiteral("handle"),
                   QStringLiteral("request_failed"),
                   QString::fromStdString(toErrorCodeString(error.code())),
                   QStringLiteral("json_request"),
                   hoststate::logging::defaultWho(),
                   corrId,
                   error.toJson());
        return makeErrorResponse(error.toJson(), id);
    } catch (const nlohmann::json::exception &ex) {
        StateError error(ErrorCode::ValidationError, ex.what());
        if (!actionName.empty()) {
            error.withAction(actionName);
        }
        HSLOG_WARN(QStringLiteral("RequestHandler"),
                   QStringLiteral("handle"),
                   QStringLiteral("request_failed"),
                   QStringLiteral("json_exception"),
                   QStringLiteral("json_request"),
                   hoststate::logging::defaultWho(),
                   corrId,
                   error.toJson());
        return makeErrorResponse(error.toJson(), id);
    } catch (const std::exception &ex) {
        // Library failures outside StateError still get a structured reply.
        StateError error(ErrorCode::IoError, ex.what());
        if (!actionName.empty()) {
            error.withAction(actionName);
        }
        HSLOG_ERROR(QStringLiteral("RequestHandler"),
                    QStringLiteral("handle"),
                    QStringLiteral("request_failed"),
                    QStringLiteral("unexpected_exception"),
                    QStringLiteral("json_request"),
                    hoststate::logging::defaultWho(),
                    corrId,
                    error.toJson());
        return makeErrorResponse(error.toJson(), id);
    }
}

nlohmann::json RequestHandler::dispatch(StateAction action,
                                        const nlohmann::json &request,
                                        const CancellationToken *cancel)
{
    switch (action) {
    case StateAction::Load: {
        const auto document = m_manager.load();
        if (!document) {
            return nlohmann::json{{"state", nullptr}, {"message", "no cached state"}};
        }
        return nlohmann::json{{"state", *document}};
    }
    case StateAction::Save: {
        const bool forceScan = optionalBool(request, "force_scan");
        const ScanOptions options =
            scanOptionsFor(request, m_manager.defaultScanOptions(), cancel);
        const StateDocument document = m_manager.save(forceScan, options);
        return nlohmann::json{{"state", document}, {"cache", m_manager.cacheStats()}};
    }
    case StateAction::Update: {
        const std::string path = requireString(request, "path");
        const nlohmann::json &value = requireField(request, "value");
        const StateDocument document = m_manager.update(path, value);
        return nlohmann::json{{"path", path}, {"value", value}, {"state", document}};
    }
    case StateAction::Compare: {
        const ScanOptions options =
            scanOptionsFor(request, m_manager.defaultScanOptions(), cancel);
        const StateDiff diff = m_manager.compare(options);
        return nlohmann::json{{"diff", diff}, {"drift", !diff.empty()}};
    }
    case StateAction::Export: {
        std::ostringstream out;
        const StateDocument document = m_manager.exportTo(out);
        return nlohmann::json{{"document", document}};
    }
    case StateAction::Import: {
        const StateDocument document = m_manager.importDocument(requireField(request, "document"));
        return nlohmann::json{{"state", document}};
    }
    case StateAction::Diff: {
        const StateDiff diff = m_manager.diffAgainst(requireField(request, "document"));
        return nlohmann::json{{"diff", diff}, {"drift", !diff.empty()}};
    }
    case StateAction::Watch: {
        const WatchResult result = m_manager.watch(requireString(request, "path"));
        return nlohmann::json(result);
    }
    }
    throw badRequest("Unsupported action");
}

} // namespace hoststate
