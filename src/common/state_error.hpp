#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace hoststate {

// StateError is the single exception type raised by the engine. The code is
// stable across releases; the message is for display only.
class StateError : public std::runtime_error {
public:
    StateError(ErrorCode code, const std::string &message);

    ErrorCode code() const
    {
        return m_code;
    }

    const std::string &action() const
    {
        return m_action;
    }

    const std::string &category() const
    {
        return m_category;
    }

    const std::string &path() const
    {
        return m_path;
    }

    // Only lock timeouts may be retried by the caller as-is.
    bool isRetryable() const
    {
        return m_code == ErrorCode::LockTimeout;
    }

    StateError &withAction(const std::string &action);
    StateError &withCategory(const std::string &category);
    StateError &withPath(const std::string &path);

    nlohmann::json toJson() const;

private:
    ErrorCode m_code;
    std::string m_action;
    std::string m_category;
    std::string m_path;
};

std::string toErrorCodeString(ErrorCode code);

} // namespace hoststate
