#include "EconomyApp.hpp"
#include "domain/EconomyErrors.hpp"
#include <iostream>
#include <csignal>
#include <stdexcept>

namespace {

// Коды выхода для оркестратора (K8s различает ошибку конфигурации и недоступную БД)
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitBadConfig = 2;
constexpr int kExitStoreUnavailable = 3;

EconomyApp* g_app = nullptr;

void onShutdownSignal(int signal)
{
    std::cout << "\n[main] Received signal " << signal << ", stopping economy service" << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        EconomyApp app;
        g_app = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        std::cout << "========================================" << std::endl;
        std::cout << "  Economy Service Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Economy Service stopped" << std::endl;
        return kExitOk;
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return kExitBadConfig;
    }
    catch (const economy::domain::StoreUnavailableError& e)
    {
        std::cerr << "[main] Ledger store unavailable at startup: " << e.what() << std::endl;
        return kExitStoreUnavailable;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return kExitFatal;
    }
}
