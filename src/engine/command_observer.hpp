#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "engine/system_observer.hpp"

namespace hoststate {

/**
 * CommandObserver collects facts by running shell commands, either locally
 * ("sh -c") or on a remote host through "ssh <remote>".
 *
 * Each fact is one command; a command that exits non-zero simply leaves its
 * fact out of the payload. Failing to start, hitting the scan timeout or an
 * ssh transport failure (exit 255) aborts the scan with ObserverError.
 */
class CommandObserver : public SystemObserver {
public:
    CommandObserver(std::string remote, std::vector<std::string> sshOptions);

    nlohmann::json scan(StateCategory category, const ScanOptions &options) override;

    // Program and arguments used to run `command`; exposed for tests.
    QStringList commandLine(const QString &command) const;
    QString program() const;

private:
    struct CommandResult {
        int exitCode = -1;
        QString output;
    };

    CommandResult runCommand(const QString &command,
                             std::chrono::milliseconds timeout,
                             StateCategory category) const;

    std::string m_remote;
    std::vector<std::string> m_sshOptions;
};

} // namespace hoststate
