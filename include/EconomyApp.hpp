#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>

namespace economy::ports::output {
    class ILedgerStore;
    class IClock;
}

namespace economy::settings {
    class DbSettings;
}

namespace economy::application {
    class InterestScheduler;
}

/**
 * @class EconomyApp
 * @brief Главное приложение economy-service
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка конфигурации
 * 2. configureInjection() - настройка Boost.DI и регистрация handlers
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Хранилище леджера выбирается по ECONOMY_STORE_BACKEND (memory / postgres).
 * Фоновое начисление процентов живёт столько же, сколько приложение.
 */
class EconomyApp : public BoostBeastApplication
{
public:
    EconomyApp();
    ~EconomyApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Настроить Boost.DI контейнер и зарегистрировать handlers
     */
    void configureInjection() override;

private:
    std::unique_ptr<economy::application::InterestScheduler> scheduler_;

    static std::shared_ptr<economy::ports::output::ILedgerStore> createStore(
        const std::shared_ptr<economy::settings::DbSettings>& dbSettings,
        const std::shared_ptr<economy::ports::output::IClock>& clock);

    void printStartupBanner();
};
