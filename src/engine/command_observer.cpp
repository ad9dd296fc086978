#include "engine/command_observer.hpp"

#include <algorithm>
#include <utility>

#include <QProcess>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/state_error.hpp"

namespace hoststate {

namespace {

constexpr int kSshTransportFailure = 255;

using FactParser = nlohmann::json (*)(const QString &output);

struct FactCommand {
    const char *key;
    const char *command;
    FactParser parse;
};

QStringList nonEmptyLines(const QString &output)
{
    QStringList lines;
    for (const QString &line : output.split(QChar('\n'), Qt::SkipEmptyParts)) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            lines.push_back(trimmed);
        }
    }
    return lines;
}

nlohmann::json parseText(const QString &output)
{
    return output.trimmed().toStdString();
}

nlohmann::json parseLines(const QString &output)
{
    nlohmann::json lines = nlohmann::json::array();
    for (const QString &line : nonEmptyLines(output)) {
        lines.push_back(line.toStdString());
    }
    return lines;
}

nlohmann::json parseFirstTokens(const QString &output)
{
    nlohmann::json tokens = nlohmann::json::array();
    for (const QString &line : nonEmptyLines(output)) {
        tokens.push_back(line.section(QChar(' '), 0, 0, QString::SectionSkipEmpty).toStdString());
    }
    return tokens;
}

nlohmann::json parseInteger(const QString &output)
{
    bool ok = false;
    const qlonglong value = output.trimmed().toLongLong(&ok);
    return ok ? nlohmann::json(value) : nlohmann::json();
}

nlohmann::json parseUptimeSeconds(const QString &output)
{
    bool ok = false;
    const double value = output.trimmed().section(QChar(' '), 0, 0).toDouble(&ok);
    return ok ? nlohmann::json(static_cast<qlonglong>(value)) : nlohmann::json();
}

nlohmann::json parseMilliCelsius(const QString &output)
{
    bool ok = false;
    const double value = output.trimmed().toDouble(&ok);
    return ok ? nlohmann::json(value / 1000.0) : nlohmann::json();
}

nlohmann::json parseLoadAverage(const QString &output)
{
    const QStringList parts = output.trimmed().split(QChar(' '), Qt::SkipEmptyParts);
    nlohmann::json loads = nlohmann::json::array();
    for (int i = 0; i < std::min(3, static_cast<int>(parts.size())); ++i) {
        bool ok = false;
        const double value = parts[i].toDouble(&ok);
        if (!ok) {
            return nlohmann::json();
        }
        loads.push_back(value);
    }
    return loads;
}

// "/proc/meminfo" lines look like "MemTotal:  3884096 kB".
nlohmann::json parseMemInfo(const QString &output)
{
    nlohmann::json memory = nlohmann::json::object();
    for (const QString &line : nonEmptyLines(output)) {
        const QStringList parts = line.split(QChar(' '), Qt::SkipEmptyParts);
        if (parts.size() < 2) {
            continue;
        }
        bool ok = false;
        const qlonglong kib = parts[1].toLongLong(&ok);
        if (!ok) {
            continue;
        }
        if (parts[0] == QStringLiteral("MemTotal:")) {
            memory["total"] = kib * 1024;
        } else if (parts[0] == QStringLiteral("MemAvailable:")) {
            memory["available"] = kib * 1024;
        } else if (parts[0] == QStringLiteral("MemFree:")) {
            memory["free"] = kib * 1024;
        }
    }
    return memory.empty() ? nlohmann::json() : memory;
}

// POSIX "df -B1 -P /" output: header, then
// "Filesystem 1-blocks Used Available Capacity Mounted-on".
nlohmann::json parseDiskUsage(const QString &output)
{
    const QStringList lines = nonEmptyLines(output);
    if (lines.size() < 2) {
        return nlohmann::json();
    }
    const QStringList parts = lines[1].split(QChar(' '), Qt::SkipEmptyParts);
    if (parts.size() < 4) {
        return nlohmann::json();
    }
    bool totalOk = false;
    bool usedOk = false;
    bool freeOk = false;
    const qlonglong total = parts[1].toLongLong(&totalOk);
    const qlonglong used = parts[2].toLongLong(&usedOk);
    const qlonglong available = parts[3].toLongLong(&freeOk);
    if (!totalOk || !usedOk || !freeOk) {
        return nlohmann::json();
    }
    return nlohmann::json{{"total", total}, {"used", used}, {"free", available}};
}

// "ip -o -4 addr show" lines: "2: eth0    inet 192.168.1.20/24 brd ...".
nlohmann::json parseInterfaces(const QString &output)
{
    nlohmann::json interfaces = nlohmann::json::object();
    for (const QString &line : nonEmptyLines(output)) {
        const QStringList parts = line.split(QChar(' '), Qt::SkipEmptyParts);
        const int inetIndex = parts.indexOf(QStringLiteral("inet"));
        if (parts.size() < 2 || inetIndex < 0 || inetIndex + 1 >= parts.size()) {
            continue;
        }
        const std::string name = parts[1].toStdString();
        if (!interfaces.contains(name)) {
            interfaces[name] = nlohmann::json{{"ipv4", nlohmann::json::array()}};
        }
        interfaces[name]["ipv4"].push_back(parts[inetIndex + 1].toStdString());
    }
    return interfaces;
}

nlohmann::json parseDefaultGateway(const QString &output)
{
    const QStringList parts = output.trimmed().split(QChar(' '), Qt::SkipEmptyParts);
    const int viaIndex = parts.indexOf(QStringLiteral("via"));
    if (viaIndex < 0 || viaIndex + 1 >= parts.size()) {
        return nlohmann::json();
    }
    return parts[viaIndex + 1].toStdString();
}

// "<system> <count>" per line.
nlohmann::json parseCounts(const QString &output)
{
    nlohmann::json counts = nlohmann::json::object();
    for (const QString &line : nonEmptyLines(output)) {
        const QStringList parts = line.split(QChar(' '), Qt::SkipEmptyParts);
        if (parts.size() != 2) {
            continue;
        }
        bool ok = false;
        const qlonglong count = parts[1].toLongLong(&ok);
        if (ok) {
            counts[parts[0].toStdString()] = count;
        }
    }
    return counts;
}

const std::vector<FactCommand> &factsFor(StateCategory category)
{
    static const std::vector<FactCommand> systemFacts = {
        {"hostname", "hostname", &parseText},
        {"kernel", "uname -r", &parseText},
        {"uptime_seconds", "cat /proc/uptime", &parseUptimeSeconds},
        {"load_average", "cat /proc/loadavg", &parseLoadAverage},
        {"cpu_temperature", "cat /sys/class/thermal/thermal_zone0/temp", &parseMilliCelsius},
        {"memory", "cat /proc/meminfo", &parseMemInfo},
        {"disk", "df -B1 -P /", &parseDiskUsage},
    };
    static const std::vector<FactCommand> hardwareFacts = {
        {"model", "tr -d '\\000' < /proc/device-tree/model", &parseText},
        {"architecture", "uname -m", &parseText},
        {"cpu_count", "nproc", &parseInteger},
        {"usb_devices", "lsusb", &parseLines},
    };
    static const std::vector<FactCommand> networkFacts = {
        {"interfaces", "ip -o -4 addr show", &parseInterfaces},
        {"default_gateway", "ip route show default", &parseDefaultGateway},
    };
    static const std::vector<FactCommand> softwareFacts = {
        {"os_name", ". /etc/os-release && printf '%s\\n' \"$PRETTY_NAME\"", &parseText},
        {"python_version", "python3 --version", &parseText},
        {"docker_version", "docker --version", &parseText},
    };
    static const std::vector<FactCommand> servicesFacts = {
        {"running", "systemctl list-units --type=service --state=running --no-legend --plain",
         &parseFirstTokens},
        {"failed", "systemctl list-units --type=service --state=failed --no-legend --plain",
         &parseFirstTokens},
    };
    static const std::vector<FactCommand> gamingFacts = {
        {"emulators", "ls -1 /opt/retropie/emulators", &parseLines},
        {"rom_counts",
         "for d in \"$HOME\"/RetroPie/roms/*/; do [ -d \"$d\" ] && "
         "printf '%s %s\\n' \"$(basename \"$d\")\" \"$(find \"$d\" -type f | wc -l)\"; done",
         &parseCounts},
        {"controllers", "ls -1 /dev/input/js*", &parseLines},
    };

    switch (category) {
    case StateCategory::System:
        return systemFacts;
    case StateCategory::Hardware:
        return hardwareFacts;
    case StateCategory::Network:
        return networkFacts;
    case StateCategory::Software:
        return softwareFacts;
    case StateCategory::Services:
        return servicesFacts;
    case StateCategory::Gaming:
        return gamingFacts;
    }
    return systemFacts;
}

StateError observerError(StateCategory category, const std::string &message)
{
    StateError error(ErrorCode::ObserverError, message);
    error.withCategory(toCategoryString(category));
    return error;
}

} // namespace

CommandObserver::CommandObserver(std::string remote, std::vector<std::string> sshOptions)
    : m_remote(std::move(remote))
    , m_sshOptions(std::move(sshOptions))
{
}

QString CommandObserver::program() const
{
    return m_remote.empty() ? QStringLiteral("sh") : QStringLiteral("ssh");
}

QStringList CommandObserver::commandLine(const QString &command) const
{
    if (m_remote.empty()) {
        return {QStringLiteral("-c"), command};
    }

    QStringList arguments;
    arguments << QStringLiteral("-o") << QStringLiteral("BatchMode=yes");
    for (const auto &option : m_sshOptions) {
        arguments << QString::fromStdString(option);
    }
    arguments << QString::fromStdString(m_remote) << command;
    return arguments;
}

nlohmann::json CommandObserver::scan(StateCategory category, const ScanOptions &options)
{
    const auto deadline = std::chrono::steady_clock::now() + boundedTimeout(options.timeout);
    nlohmann::json payload = nlohmann::json::object();

    for (const auto &fact : factsFor(category)) {
        if (options.cancel && options.cancel->isCancelled()) {
            StateError error(ErrorCode::Cancelled,
                             "Scan of '" + toCategoryString(category) + "' was cancelled");
            error.withCategory(toCategoryString(category));
            throw error;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds(0)) {
            throw observerError(category, "Scan of '" + toCategoryString(category)
                                              + "' exceeded its timeout");
        }

        const CommandResult result =
            runCommand(QString::fromLatin1(fact.command), remaining, category);
        if (result.exitCode != 0 || result.output.trimmed().isEmpty()) {
            continue;
        }

        nlohmann::json value = fact.parse(result.output);
        if (!value.is_null()) {
            payload[fact.key] = std::move(value);
        }
    }

    HSLOG_DEBUG(QStringLiteral("CommandObserver"),
                QStringLiteral("scan"),
                QStringLiteral("category_scanned"),
                QStringLiteral("observer_request"),
                program(),
                hoststate::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"category", toCategoryString(category)},
                                {"facts", payload.size()},
                                {"remote", m_remote}}));
    return payload;
}

CommandObserver::CommandResult CommandObserver::runCommand(const QString &command,
                                                           std::chrono::milliseconds timeout,
                                                           StateCategory category) const
{
    const int waitMs = static_cast<int>(boundedTimeout(timeout).count());
    QProcess process;
    process.start(program(), commandLine(command));
    if (!process.waitForStarted(waitMs)) {
        throw observerError(category, "Failed to start " + program().toStdString()
                                          + ": " + process.errorString().toStdString());
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(waitMs)) {
        process.kill();
        process.waitForFinished();
        throw observerError(category, "Command timed out after "
                                          + std::to_string(timeout.count())
                                          + " ms: " + command.toStdString());
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        throw observerError(category, "Command crashed: " + command.toStdString());
    }

    CommandResult result;
    result.exitCode = process.exitCode();
    if (!m_remote.empty() && result.exitCode == kSshTransportFailure) {
        throw observerError(category, "ssh to '" + m_remote + "' failed: "
                                          + QString::fromUtf8(process.readAllStandardError())
                                                .trimmed()
                                                .toStdString());
    }
    result.output = QString::fromUtf8(process.readAllStandardOutput());
    return result;
}

} // namespace hoststate
