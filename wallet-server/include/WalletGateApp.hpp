#pragma once

#include "ResponseCache.hpp"

// Settings
#include "settings/CorsSettings.hpp"
#include "settings/ProtocolSettings.hpp"
#include "settings/RateLimitSettings.hpp"
#include "settings/ServerSettings.hpp"
#include "settings/WalletSettings.hpp"

// Ports
#include "ports/input/IRequestRegistry.hpp"
#include "ports/input/ISessionStore.hpp"
#include "ports/input/IUnlockRateLimiter.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/output/INotificationBus.hpp"
#include "ports/output/IWalletBackend.hpp"

// Server
#include "server/HttpRouter.hpp"
#include "server/ListenerProbe.hpp"
#include "server/MaintenanceLoop.hpp"
#include "server/PortReclaimer.hpp"
#include "server/ProtocolServer.hpp"

#include <atomic>
#include <memory>

namespace walletgate {

/**
 * @brief Все настройки приложения разом
 *
 * По умолчанию каждая читается из окружения.
 */
struct AppSettings {
    std::shared_ptr<settings::ServerSettings> server = std::make_shared<settings::ServerSettings>();
    std::shared_ptr<settings::ProtocolSettings> protocol = std::make_shared<settings::ProtocolSettings>();
    std::shared_ptr<settings::RateLimitSettings> rateLimit = std::make_shared<settings::RateLimitSettings>();
    std::shared_ptr<settings::CorsSettings> cors = std::make_shared<settings::CorsSettings>();
    std::shared_ptr<settings::WalletSettings> wallet = std::make_shared<settings::WalletSettings>();
};

/**
 * @brief Wallet Gate: сервер авторизации DApp для локального кошелька
 *
 * Template Method как в сервисах платформы:
 * loadEnvironment() -> configureInjection() -> start() -> ожидание stop().
 */
class WalletGateApp {
public:
    WalletGateApp();
    explicit WalletGateApp(AppSettings settings);
    ~WalletGateApp();

    /// Полный цикл для main(). @return код выхода
    int run(int argc, char* argv[]);

    /// Можно звать из обработчика сигнала
    void stop() { stopRequested_ = true; }

    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();

    /// startRobust на адресе из ServerSettings
    server::StartupReport start();

    /// Остановить сервер и сбросить сессии. Идемпотентно
    void shutdown();

    /// Если окружение подменяет компонент (тесты)
    void setWalletBackend(std::shared_ptr<ports::output::IWalletBackend> backend) { backendOverride_ = std::move(backend); }
    void setPortReclaimer(std::shared_ptr<server::IPortReclaimer> reclaimer) { reclaimerOverride_ = std::move(reclaimer); }
    void setListenerProbe(std::shared_ptr<server::IListenerProbe> probe) { probeOverride_ = std::move(probe); }

    const AppSettings& settings() const { return settings_; }
    std::shared_ptr<server::ProtocolServer> server() const { return server_; }
    std::shared_ptr<server::HttpRouter> router() const { return router_; }
    std::shared_ptr<ports::input::IRequestRegistry> registry() const { return registry_; }
    std::shared_ptr<ports::input::ISessionStore> sessions() const { return sessions_; }
    std::shared_ptr<ports::input::IWalletService> wallet() const { return wallet_; }
    std::shared_ptr<ports::output::INotificationBus> bus() const { return bus_; }
    std::shared_ptr<ResponseCache> cache() const { return cache_; }

private:
    AppSettings settings_;
    std::atomic<bool> stopRequested_{false};

    std::shared_ptr<ports::output::IWalletBackend> backendOverride_;
    std::shared_ptr<server::IPortReclaimer> reclaimerOverride_;
    std::shared_ptr<server::IListenerProbe> probeOverride_;

    std::shared_ptr<ResponseCache> cache_;
    std::shared_ptr<ports::output::INotificationBus> bus_;
    std::shared_ptr<ports::input::ISessionStore> sessions_;
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
    std::shared_ptr<ports::input::IUnlockRateLimiter> limiter_;
    std::shared_ptr<ports::input::IWalletService> wallet_;
    std::shared_ptr<server::HttpRouter> router_;
    std::shared_ptr<server::MaintenanceLoop> maintenance_;
    std::shared_ptr<server::ProtocolServer> server_;

    void registerHandlers(std::shared_ptr<ports::input::IWalletService> wallet);
};

} // namespace walletgate
