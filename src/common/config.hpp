#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace hoststate {

struct StateConfig {
    std::string host;
    std::string stateFilePath;
    std::map<StateCategory, std::chrono::seconds> categoryTtls;
    std::vector<StateCategory> requiredCategories;
    std::chrono::milliseconds scanTimeout{30000};
    std::chrono::milliseconds lockTimeout{5000};
    std::string remote;
    std::vector<std::string> sshOptions;
    std::string socketName;
};

std::vector<StateCategory> allObservableCategories();
std::map<StateCategory, std::chrono::seconds> defaultCategoryTtls();

// Built-in defaults for the given host, rooted at $HOME and $XDG_RUNTIME_DIR.
StateConfig defaultConfig(const std::string &host);

// Applies the keys of a config-file object over `config`. Unknown keys are
// ignored, malformed values throw StateError(ValidationError).
void applyConfigJson(StateConfig &config, const nlohmann::json &json);

// Defaults, then the JSON config file, then HOSTSTATE_* environment variables.
StateConfig loadConfig();

std::string defaultStateFilePath(const std::string &host);

} // namespace hoststate
