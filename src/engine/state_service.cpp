#include "engine/state_service.hpp"

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/command_observer.hpp"

namespace hoststate {

StateService::StateService(StateConfig config)
    : StateService(config,
                   std::make_unique<CommandObserver>(config.remote, config.sshOptions))
{
}

StateService::StateService(StateConfig config, std::unique_ptr<SystemObserver> observer)
    : m_config(std::move(config))
    , m_observer(std::move(observer))
{
    m_store = std::make_unique<StateStore>(m_config.stateFilePath);
    m_cache = std::make_unique<TtlCache>(m_clock, m_config.categoryTtls);

    ManagerOptions options;
    options.requiredCategories = m_config.requiredCategories;
    options.lockTimeout = m_config.lockTimeout;
    options.scanTimeout = m_config.scanTimeout;
    m_manager = std::make_unique<StateManager>(*m_store, *m_cache, *m_observer, m_clock,
                                               std::move(options));
    m_handler = std::make_unique<RequestHandler>(*m_manager);

    HSLOG_INFO(QStringLiteral("StateService"),
               QStringLiteral("StateService"),
               QStringLiteral("service_configured"),
               QStringLiteral("startup"),
               QStringLiteral("config"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"host", m_config.host},
                               {"stateFile", m_config.stateFilePath},
                               {"remote", m_config.remote},
                               {"categories", m_config.requiredCategories}}));
}

} // namespace hoststate
