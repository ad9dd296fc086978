#include "common/state_error.hpp"

namespace hoststate {

StateError::StateError(ErrorCode code, const std::string &message)
    : std::runtime_error(message)
    , m_code(code)
{
}

StateError &StateError::withAction(const std::string &action)
{
    if (m_action.empty()) {
        m_action = action;
    }
    return *this;
}

StateError &StateError::withCategory(const std::string &category)
{
    if (m_category.empty()) {
        m_category = category;
    }
    return *this;
}

StateError &StateError::withPath(const std::string &path)
{
    if (m_path.empty()) {
        m_path = path;
    }
    return *this;
}

nlohmann::json StateError::toJson() const
{
    nlohmann::json context = nlohmann::json::object();
    if (!m_action.empty()) {
        context["action"] = m_action;
    }
    if (!m_category.empty()) {
        context["category"] = m_category;
    }
    if (!m_path.empty()) {
        context["path"] = m_path;
    }

    return nlohmann::json{
        {"code", toErrorCodeString(m_code)},
        {"message", what()},
        {"retryable", isRetryable()},
        {"context", context}
    };
}

std::string toErrorCodeString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotFound:
        return "not_found";
    case ErrorCode::SchemaError:
        return "schema_error";
    case ErrorCode::CorruptionError:
        return "corruption_error";
    case ErrorCode::ValidationError:
        return "validation_error";
    case ErrorCode::IoError:
        return "io_error";
    case ErrorCode::LockTimeout:
        return "lock_timeout";
    case ErrorCode::ObserverError:
        return "observer_error";
    case ErrorCode::Cancelled:
        return "cancelled";
    }
    return "io_error";
}

} // namespace hoststate
