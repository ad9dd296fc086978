#pragma once

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hoststate {

// SystemObserver gathers raw facts about the managed host for one category.
// Implementations must be safe to call repeatedly; a failure to observe is
// reported as StateError(ObserverError), distinct from an empty payload
// ("nothing to report"). Cancellation is reported as StateError(Cancelled).
class SystemObserver {
public:
    virtual ~SystemObserver() = default;

    virtual nlohmann::json scan(StateCategory category, const ScanOptions &options) = 0;
};

} // namespace hoststate
