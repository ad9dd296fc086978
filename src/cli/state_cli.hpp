#pragma once

#include <ostream>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "engine/request_handler.hpp"

namespace hoststate {

class StateCli
{
public:
    StateCli(RequestHandler &handler, std::ostream &out, std::ostream &err);

    // args[0] is the program name. Returns the process exit code:
    // 0 on success, 1 when the action failed, 2 on a usage error.
    int run(const QStringList &args);

    // Translates command-line arguments into a request object. Throws
    // StateError(ValidationError) for malformed arguments.
    static nlohmann::json buildRequest(const QStringList &args);

private:
    RequestHandler &m_handler;
    std::ostream &m_out;
    std::ostream &m_err;
};

QString usageText();

} // namespace hoststate
