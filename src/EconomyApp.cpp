#include "EconomyApp.hpp"

// Handlers (Primary Adapters)
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CheckinHandler.hpp"
#include "adapters/primary/WorkHandler.hpp"
#include "adapters/primary/BankHandler.hpp"
#include "adapters/primary/RobberyHandler.hpp"
#include "adapters/primary/RankingHandler.hpp"
#include "adapters/primary/ProfileHandler.hpp"

// Application Services
#include "application/CheckinService.hpp"
#include "application/WorkService.hpp"
#include "application/BankService.hpp"
#include "application/RobberyService.hpp"
#include "application/RankingService.hpp"
#include "application/ProfileService.hpp"
#include "application/InterestScheduler.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/MtRandomSource.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/EconomySettings.hpp"
#include "settings/SchedulerSettings.hpp"

#include <iostream>

namespace di = boost::di;

using namespace economy;

// ============================================================================
// EconomyApp Implementation
// ============================================================================

EconomyApp::EconomyApp()
{
    std::cout << "[EconomyApp] Application created" << std::endl;
}

EconomyApp::~EconomyApp()
{
    if (scheduler_) {
        scheduler_->stop();
    }
    std::cout << "[EconomyApp] Application destroyed" << std::endl;
}

void EconomyApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[EconomyApp] Loading environment..." << std::endl;

    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[EconomyApp] Environment loaded successfully" << std::endl;
}

std::shared_ptr<ports::output::ILedgerStore> EconomyApp::createStore(
    const std::shared_ptr<settings::DbSettings>& dbSettings,
    const std::shared_ptr<ports::output::IClock>& clock)
{
    if (dbSettings->usePostgres()) {
        std::cout << "[EconomyApp] Ledger store: PostgreSQL at "
                  << dbSettings->getHost() << ":" << dbSettings->getPort() << std::endl;
        return std::make_shared<adapters::secondary::PostgresLedgerStore>(dbSettings);
    }
    std::cout << "[EconomyApp] Ledger store: in-memory" << std::endl;
    return std::make_shared<adapters::secondary::InMemoryLedgerStore>(clock);
}

void EconomyApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[EconomyApp] Configuring Boost.DI injection..." << std::endl;

    // Настройки читаются из ENV один раз; ошибки конфигурации останавливают запуск
    auto dbSettings = std::make_shared<settings::DbSettings>();
    auto economySettings = std::make_shared<settings::EconomySettings>();
    auto schedulerSettings = std::make_shared<settings::SchedulerSettings>();

    auto clock = std::make_shared<adapters::secondary::SystemClock>();
    auto store = createStore(dbSettings, clock);

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings & Secondary Adapters (Output Ports)
        // ====================================================================

        di::bind<settings::DbSettings>().to(dbSettings),
        di::bind<settings::EconomySettings>().to(economySettings),

        di::bind<ports::output::ILedgerStore>().to(store),

        di::bind<ports::output::IClock>().to(clock),

        di::bind<ports::output::IRandomSource>()
            .to(std::make_shared<adapters::secondary::MtRandomSource>()),

        // ====================================================================
        // Layer 2: Application Services (Input Ports)
        // ====================================================================

        di::bind<ports::input::ICheckinService>()
            .to<application::CheckinService>()
            .in(di::singleton),

        di::bind<ports::input::IWorkService>()
            .to<application::WorkService>()
            .in(di::singleton),

        di::bind<ports::input::IBankService>()
            .to<application::BankService>()
            .in(di::singleton),

        di::bind<ports::input::IRobberyService>()
            .to<application::RobberyService>()
            .in(di::singleton),

        di::bind<ports::input::IRankingService>()
            .to<application::RankingService>()
            .in(di::singleton),

        di::bind<ports::input::IProfileService>()
            .to<application::ProfileService>()
            .in(di::singleton));

    std::cout << "[EconomyApp] Injector configured: 5 adapters, 6 services" << std::endl;

    // ========================================================================
    // Layer 3: Primary Adapters (HTTP Handlers)
    // ========================================================================

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
        handlers_[getHandlerKey("GET", "/health")] = handler;
        std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::CheckinHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/economy/checkin")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/economy/checkin")] = handler;
        std::cout << "  ✓ CheckinHandler: POST/GET /api/v1/economy/checkin" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::WorkHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/economy/jobs")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/economy/work")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/economy/work/stats")] = handler;
        std::cout << "  ✓ WorkHandler: /api/v1/economy/jobs, /work, /work/stats" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::BankHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/economy/bank")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/economy/bank/deposit")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/economy/bank/withdraw")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/economy/bank/transfer")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/economy/bank/interest")] = handler;
        std::cout << "  ✓ BankHandler: /api/v1/economy/bank/*" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::RobberyHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/economy/rob")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/economy/rob/stats")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/economy/rob/targets")] = handler;
        std::cout << "  ✓ RobberyHandler: /api/v1/economy/rob/*" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::RankingHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/economy/ranking")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/economy/rank")] = handler;
        std::cout << "  ✓ RankingHandler: GET /api/v1/economy/ranking, /rank" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::ProfileHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/economy/profile")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/economy/activities")] = handler;
        std::cout << "  ✓ ProfileHandler: GET /api/v1/economy/profile, /activities" << std::endl;
    }

    // ========================================================================
    // Background: начисление процентов
    // ========================================================================

    if (schedulerSettings->isEnabled()) {
        scheduler_ = std::make_unique<application::InterestScheduler>(
            injector.create<std::shared_ptr<ports::input::IBankService>>(),
            std::chrono::seconds(schedulerSettings->getIntervalSec()));
        scheduler_->start();
    } else {
        std::cout << "[EconomyApp] Interest scheduler disabled" << std::endl;
    }

    std::cout << "\n[EconomyApp] DI configuration completed - "
              << handlers_.size() << " routes registered" << std::endl;
}

void EconomyApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║        Economy Service - chat virtual economy        ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "║  Ledger:       in-memory / PostgreSQL (libpqxx)      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
