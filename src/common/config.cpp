#include "common/config.hpp"

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QStringList>

#include <unistd.h>

#include <algorithm>

#include "common/json_utils.hpp"
#include "common/models.hpp"
#include "common/state_error.hpp"

namespace hoststate {

namespace {

constexpr auto kDefaultScanTimeout = std::chrono::milliseconds(30000);
constexpr auto kDefaultLockTimeout = std::chrono::milliseconds(5000);

std::string localHostname()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0 || hostname[0] == '\0') {
        return "localhost";
    }
    return hostname;
}

std::string homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? std::string(".") : home.toStdString();
}

// TTLs are added to system_clock time points, so they share the timeout bound.
constexpr long long kMaxTtlSeconds = kMaxTimeoutMs;

long long parseInRange(const std::string &key, const std::string &value,
                       long long min, long long max)
{
    bool ok = false;
    const long long parsed = QString::fromStdString(value).trimmed().toLongLong(&ok);
    if (!ok || parsed < min || parsed > max) {
        throw StateError(ErrorCode::ValidationError,
                         "Invalid value for " + key + ": '" + value + "' (expected "
                             + std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return parsed;
}

long long jsonInRange(const std::string &key, const nlohmann::json &value,
                      long long min, long long max)
{
    if (!value.is_number_integer() || value.get<long long>() < min
        || value.get<long long>() > max) {
        throw StateError(ErrorCode::ValidationError,
                         "Config key " + key + " must be an integer in "
                             + std::to_string(min) + ".." + std::to_string(max));
    }
    return value.get<long long>();
}

std::vector<StateCategory> parseCategoryList(const std::string &key,
                                             const std::vector<std::string> &names)
{
    std::vector<StateCategory> categories;
    for (const auto &name : names) {
        const auto category = parseCategoryString(name);
        if (!category) {
            throw StateError(ErrorCode::ValidationError,
                             "Unknown category '" + name + "' in " + key);
        }
        if (std::find(categories.begin(), categories.end(), *category)
            == categories.end()) {
            categories.push_back(*category);
        }
    }
    return categories;
}

std::string configFilePath()
{
    const QString explicitPath = qEnvironmentVariable("HOSTSTATE_CONFIG");
    if (!explicitPath.isEmpty()) {
        return explicitPath.toStdString();
    }
    return homeDir() + "/.config/hoststate/config.json";
}

void applyConfigFile(StateConfig &config)
{
    const QString path = QString::fromStdString(configFilePath());
    QFile file(path);
    if (!file.exists()) {
        if (qEnvironmentVariableIsSet("HOSTSTATE_CONFIG")) {
            throw StateError(ErrorCode::ValidationError,
                             "Config file not found: " + path.toStdString());
        }
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw StateError(ErrorCode::IoError,
                         "Cannot read config file: " + path.toStdString());
    }

    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw StateError(ErrorCode::ValidationError,
                         "Config file is not a JSON object: " + path.toStdString());
    }
    applyConfigJson(config, parsed);
}

void applyEnvironment(StateConfig &config)
{
    const QString stateFile = qEnvironmentVariable("HOSTSTATE_STATE_FILE");
    if (!stateFile.isEmpty()) {
        config.stateFilePath = stateFile.toStdString();
    }

    for (auto category : allObservableCategories()) {
        const std::string name = toCategoryString(category);
        const std::string key = "HOSTSTATE_TTL_" + QString::fromStdString(name).toUpper().toStdString();
        const QByteArray value = qgetenv(key.c_str());
        if (!value.isEmpty()) {
            config.categoryTtls[category] =
                std::chrono::seconds(parseInRange(key, value.toStdString(), 0, kMaxTtlSeconds));
        }
    }

    const QString required = qEnvironmentVariable("HOSTSTATE_REQUIRED_CATEGORIES");
    if (!required.isEmpty()) {
        std::vector<std::string> names;
        for (const QString &part : required.split(QChar(','), Qt::SkipEmptyParts)) {
            names.push_back(part.trimmed().toStdString());
        }
        config.requiredCategories = parseCategoryList("HOSTSTATE_REQUIRED_CATEGORIES", names);
    }

    const QByteArray scanTimeout = qgetenv("HOSTSTATE_SCAN_TIMEOUT_MS");
    if (!scanTimeout.isEmpty()) {
        config.scanTimeout = std::chrono::milliseconds(
            parseInRange("HOSTSTATE_SCAN_TIMEOUT_MS", scanTimeout.toStdString(), 1,
                         kMaxTimeoutMs));
    }

    const QByteArray lockTimeout = qgetenv("HOSTSTATE_LOCK_TIMEOUT_MS");
    if (!lockTimeout.isEmpty()) {
        config.lockTimeout = std::chrono::milliseconds(
            parseInRange("HOSTSTATE_LOCK_TIMEOUT_MS", lockTimeout.toStdString(), 0,
                         kMaxTimeoutMs));
    }

    if (qEnvironmentVariableIsSet("HOSTSTATE_REMOTE")) {
        config.remote = qEnvironmentVariable("HOSTSTATE_REMOTE").toStdString();
    }

    const QString sshOptions = qEnvironmentVariable("HOSTSTATE_SSH_OPTIONS");
    if (!sshOptions.isEmpty()) {
        config.sshOptions.clear();
        for (const QString &part : sshOptions.split(QChar(' '), Qt::SkipEmptyParts)) {
            config.sshOptions.push_back(part.toStdString());
        }
    }

    const QString socketName = qEnvironmentVariable("HOSTSTATE_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        config.socketName = socketName.toStdString();
    }
}

} // namespace

std::vector<StateCategory> allObservableCategories()
{
    return {
        StateCategory::System,
        StateCategory::Hardware,
        StateCategory::Network,
        StateCategory::Software,
        StateCategory::Services,
        StateCategory::Gaming,
    };
}

std::map<StateCategory, std::chrono::seconds> defaultCategoryTtls()
{
    return {
        {StateCategory::System, std::chrono::seconds(30)},
        {StateCategory::Hardware, std::chrono::seconds(300)},
        {StateCategory::Network, std::chrono::seconds(60)},
        {StateCategory::Software, std::chrono::seconds(300)},
        {StateCategory::Services, std::chrono::seconds(30)},
        {StateCategory::Gaming, std::chrono::seconds(300)},
    };
}

std::string defaultStateFilePath(const std::string &host)
{
    return homeDir() + "/." + host + "-state.json";
}

StateConfig defaultConfig(const std::string &host)
{
    StateConfig config;
    config.host = host;
    config.stateFilePath = defaultStateFilePath(host);
    config.categoryTtls = defaultCategoryTtls();
    config.requiredCategories = allObservableCategories();
    config.scanTimeout = kDefaultScanTimeout;
    config.lockTimeout = kDefaultLockTimeout;

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    config.socketName = (runtimeDir + QStringLiteral("/hoststate.sock")).toStdString();
    return config;
}

void applyConfigJson(StateConfig &config, const nlohmann::json &json)
{
    if (json.contains("state_file")) {
        if (!json.at("state_file").is_string()) {
            throw StateError(ErrorCode::ValidationError,
                             "Config key state_file must be a string");
        }
        config.stateFilePath = json.at("state_file").get<std::string>();
    }

    if (json.contains("ttl_seconds")) {
        const auto &ttls = json.at("ttl_seconds");
        if (!ttls.is_object()) {
            throw StateError(ErrorCode::ValidationError,
                             "Config key ttl_seconds must be an object");
        }
        for (const auto &item : ttls.items()) {
            const auto category = parseCategoryString(item.key());
            if (!category) {
                throw StateError(ErrorCode::ValidationError,
                                 "Unknown category '" + item.key() + "' in ttl_seconds");
            }
            config.categoryTtls[*category] = std::chrono::seconds(
                jsonInRange("ttl_seconds." + item.key(), item.value(), 0, kMaxTtlSeconds));
        }
    }

    if (json.contains("required_categories")) {
        const auto &required = json.at("required_categories");
        if (!required.is_array()) {
            throw StateError(ErrorCode::ValidationError,
                             "Config key required_categories must be an array");
        }
        std::vector<std::string> names;
        for (const auto &name : required) {
            if (!name.is_string()) {
                throw StateError(ErrorCode::ValidationError,
                                 "required_categories entries must be strings");
            }
            names.push_back(name.get<std::string>());
        }
        config.requiredCategories = parseCategoryList("required_categories", names);
    }

    if (json.contains("scan_timeout_ms")) {
        config.scanTimeout = std::chrono::milliseconds(
            jsonInRange("scan_timeout_ms", json.at("scan_timeout_ms"), 1, kMaxTimeoutMs));
    }
    if (json.contains("lock_timeout_ms")) {
        config.lockTimeout = std::chrono::milliseconds(
            jsonInRange("lock_timeout_ms", json.at("lock_timeout_ms"), 0, kMaxTimeoutMs));
    }

    if (json.contains("remote")) {
        if (!json.at("remote").is_string()) {
            throw StateError(ErrorCode::ValidationError,
                             "Config key remote must be a string");
        }
        config.remote = json.at("remote").get<std::string>();
    }

    if (json.contains("ssh_options")) {
        const auto &options = json.at("ssh_options");
        if (!options.is_array()) {
            throw StateError(ErrorCode::ValidationError,
                             "Config key ssh_options must be an array");
        }
        config.sshOptions.clear();
        for (const auto &option : options) {
            if (!option.is_string()) {
                throw StateError(ErrorCode::ValidationError,
                                 "ssh_options entries must be strings");
            }
            config.sshOptions.push_back(option.get<std::string>());
        }
    }
}

StateConfig loadConfig()
{
    const QString hostOverride = qEnvironmentVariable("HOSTSTATE_HOST");
    const std::string host = hostOverride.isEmpty()
        ? localHostname()
        : hostOverride.toStdString();
    if (host.find('/') != std::string::npos) {
        throw StateError(ErrorCode::ValidationError,
                         "HOSTSTATE_HOST must not contain '/': " + host);
    }

    StateConfig config = defaultConfig(host);
    applyConfigFile(config);
    applyEnvironment(config);
    return config;
}

} // namespace hoststate
