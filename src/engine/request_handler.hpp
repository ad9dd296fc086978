#pragma once

#include <QByteArray>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "engine/state_manager.hpp"

namespace hoststate {

/**
 * RequestHandler is the single entry point shared by the CLI and the daemon.
 *
 * Requests look like
 *   {"action": "update", "path": "system.hostname", "value": "pi", "id": 7}
 * with the optional keys path, value, force_scan, document and timeout_ms.
 * Responses are {"result": ..., "id"} or
 * {"error": {"code", "message", "retryable", "context"}, "id"}.
 */
class RequestHandler {
public:
    explicit RequestHandler(StateManager &manager);

    nlohmann::json handle(const nlohmann::json &request,
                          const CancellationToken *cancel = nullptr);

    // Parses `payload` as JSON and returns the serialized response.
    QByteArray handlePayload(const QByteArray &payload,
                             const CancellationToken *cancel = nullptr);

private:
    nlohmann::json dispatch(StateAction action,
                            const nlohmann::json &request,
                            const CancellationToken *cancel);

    StateManager &m_manager;
};

nlohmann::json makeErrorResponse(const nlohmann::json &error, const nlohmann::json &id);
nlohmann::json makeResultResponse(const nlohmann::json &result, const nlohmann::json &id);

} // namespace hoststate
