#pragma once

#include <memory>

#include "common/clock.hpp"
#include "common/config.hpp"
#include "engine/request_handler.hpp"
#include "engine/state_manager.hpp"
#include "engine/state_store.hpp"
#include "engine/system_observer.hpp"
#include "engine/ttl_cache.hpp"

namespace hoststate {

/**
 * StateService wires the engine for one configured host: the state file,
 * the TTL cache, the command observer and the request handler on top.
 *
 * Owned from main() by both the CLI and the daemon.
 */
class StateService {
public:
    explicit StateService(StateConfig config);
    // Uses `observer` instead of the command observer.
    StateService(StateConfig config, std::unique_ptr<SystemObserver> observer);

    StateService(const StateService &) = delete;
    StateService &operator=(const StateService &) = delete;

    const StateConfig &config() const
    {
        return m_config;
    }

    StateManager &manager()
    {
        return *m_manager;
    }

    RequestHandler &handler()
    {
        return *m_handler;
    }

private:
    StateConfig m_config;
    SystemClock m_clock;
    std::unique_ptr<SystemObserver> m_observer;
    std::unique_ptr<StateStore> m_store;
    std::unique_ptr<TtlCache> m_cache;
    std::unique_ptr<StateManager> m_manager;
    std::unique_ptr<RequestHandler> m_handler;
};

} // namespace hoststate
