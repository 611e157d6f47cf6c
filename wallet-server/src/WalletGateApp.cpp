#include "WalletGateApp.hpp"

#include "application/RequestRegistry.hpp"
#include "application/SessionStore.hpp"
#include "application/UnlockRateLimiter.hpp"
#include "application/WalletService.hpp"

#include "adapters/secondary/FakeWalletBackend.hpp"
#include "adapters/secondary/PushNotificationBus.hpp"

#include "adapters/primary/AddTokenHandler.hpp"
#include "adapters/primary/ApproveRequestHandler.hpp"
#include "adapters/primary/AuthRequestHandler.hpp"
#include "adapters/primary/AuthStatusHandler.hpp"
#include "adapters/primary/BalanceHandler.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/DenyRequestHandler.hpp"
#include "adapters/primary/ListTokensHandler.hpp"
#include "adapters/primary/LocalOnlyMiddleware.hpp"
#include "adapters/primary/LockWalletHandler.hpp"
#include "adapters/primary/PendingRequestsHandler.hpp"
#include "adapters/primary/RevokeSessionHandler.hpp"
#include "adapters/primary/SessionAuthMiddleware.hpp"
#include "adapters/primary/SignMessageHandler.hpp"
#include "adapters/primary/TransactionHandler.hpp"
#include "adapters/primary/UnlockWalletHandler.hpp"
#include "adapters/primary/WalletInfoHandler.hpp"
#include "adapters/primary/WalletStatusHandler.hpp"

#include "protocol/ProtocolConstants.hpp"

#include <boost/di.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace di = boost::di;

namespace walletgate {

using namespace adapters::primary;
namespace endpoints = protocol::endpoints;

WalletGateApp::WalletGateApp() {
    std::cout << "[WalletGateApp] Initializing..." << std::endl;
}

WalletGateApp::WalletGateApp(AppSettings settings)
    : settings_(std::move(settings))
{
    std::cout << "[WalletGateApp] Initializing with explicit settings..." << std::endl;
}

WalletGateApp::~WalletGateApp() {
    shutdown();
    std::cout << "[WalletGateApp] Shutting down..." << std::endl;
}

int WalletGateApp::run(int argc, char* argv[]) {
    loadEnvironment(argc, argv);
    configureInjection();

    auto report = start();
    if (report.status == server::StartupStatus::ALREADY_RUNNING) {
        std::cout << "[WalletGateApp] " << report.message << std::endl;
        return 0;
    }
    if (report.status != server::StartupStatus::STARTED) {
        std::cerr << "[WalletGateApp] Startup failed: " << report.message << std::endl;
        return 1;
    }

    while (!stopRequested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    shutdown();
    return 0;
}

void WalletGateApp::loadEnvironment(int argc, char* argv[]) {
    std::string host = settings_.server->getHost();
    uint16_t port = settings_.server->getPort();

    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host") {
            host = argv[++i];
        } else if (arg == "--port") {
            port = static_cast<uint16_t>(std::stoi(argv[++i]));
        }
    }

    settings_.server = std::make_shared<settings::ServerSettings>(host, port);
    std::cout << "[WalletGateApp] Environment loaded" << std::endl;
}

void WalletGateApp::configureInjection() {
    std::cout << "[WalletGateApp] Configuring DI..." << std::endl;

    // Шаг 1: Компоненты с источником времени и интервалами создаём сами
    cache_ = std::make_shared<ResponseCache>(settings_.protocol->getCacheCapacity());
    bus_ = std::make_shared<adapters::secondary::PushNotificationBus>();
    sessions_ = std::make_shared<application::SessionStore>(settings_.protocol);
    registry_ = std::make_shared<application::RequestRegistry>(settings_.protocol, sessions_, bus_);
    limiter_ = std::make_shared<application::UnlockRateLimiter>(settings_.rateLimit);
    router_ = std::make_shared<server::HttpRouter>();

    maintenance_ = std::make_shared<server::MaintenanceLoop>(
        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.protocol->getSweepInterval()));
    maintenance_->addTask("requests", [registry = registry_](domain::TimePoint now) { registry->sweepExpired(now); });
    maintenance_->addTask("sessions", [sessions = sessions_](domain::TimePoint now) { sessions->sweepExpired(now); });
    maintenance_->addTask("unlock-limiter", [limiter = limiter_](domain::TimePoint now) { limiter->sweep(now); });

    std::shared_ptr<server::IListenerProbe> probe = probeOverride_
        ? probeOverride_ : std::make_shared<server::HttpListenerProbe>();
    std::shared_ptr<server::IPortReclaimer> reclaimer = reclaimerOverride_
        ? reclaimerOverride_ : std::make_shared<server::ProcPortReclaimer>();

    // Шаг 2: Основной injector с instance binding
    auto injector = di::make_injector(
        di::bind<settings::ProtocolSettings>().to(settings_.protocol),
        di::bind<settings::CorsSettings>().to(settings_.cors),
        di::bind<settings::WalletSettings>().to(settings_.wallet),
        di::bind<ResponseCache>().to(cache_),
        di::bind<ports::output::INotificationBus>().to(bus_),
        di::bind<ports::input::ISessionStore>().to(sessions_),
        di::bind<ports::input::IRequestRegistry>().to(registry_),
        di::bind<ports::input::IUnlockRateLimiter>().to(limiter_),
        di::bind<server::HttpRouter>().to(router_),
        di::bind<server::MaintenanceLoop>().to(maintenance_),
        di::bind<server::IListenerProbe>().to(probe),
        di::bind<server::IPortReclaimer>().to(reclaimer),

        di::bind<ports::output::IWalletBackend>().to<adapters::secondary::FakeWalletBackend>().in(di::singleton),
        di::bind<ports::input::IWalletService>().to<application::WalletService>().in(di::singleton),
        di::bind<server::CorsPolicy>().in(di::singleton));

    if (backendOverride_) {
        wallet_ = std::make_shared<application::WalletService>(
            settings_.protocol, settings_.wallet, backendOverride_, limiter_, bus_, cache_);
    } else {
        wallet_ = injector.create<std::shared_ptr<ports::input::IWalletService>>();
    }

    // Шаг 3: HTTP Handlers
    registerHandlers(wallet_);

    server_ = injector.create<std::shared_ptr<server::ProtocolServer>>();
    server_->setRetryBackoff(std::chrono::milliseconds(200));

    std::cout << "[WalletGateApp] Ready (" << router_->size() << " routes)" << std::endl;
}

void WalletGateApp::registerHandlers(std::shared_ptr<ports::input::IWalletService> wallet) {
    auto requireSession = [this](std::optional<protocol::Permission> permission) {
        return std::make_shared<SessionAuthMiddleware>(sessions_, permission);
    };
    auto localOnly = std::make_shared<LocalOnlyMiddleware>(settings_.protocol);

    // Без авторизации
    router_->addHandler("GET", endpoints::WALLET_STATUS, std::make_shared<WalletStatusHandler>(wallet));
    router_->addHandler("POST", endpoints::WALLET_UNLOCK, std::make_shared<UnlockWalletHandler>(wallet));
    router_->addHandler("POST", endpoints::AUTH_REQUEST, std::make_shared<AuthRequestHandler>(registry_));
    router_->addHandler("GET", endpoints::AUTH_STATUS, std::make_shared<AuthStatusHandler>(registry_));
    router_->addHandler("POST", endpoints::AUTH_REVOKE, std::make_shared<RevokeSessionHandler>(sessions_));

    // UI кошелька
    router_->addHandler("POST", endpoints::AUTH_APPROVE, std::make_shared<ChainHandler>(
        localOnly, std::make_shared<ApproveRequestHandler>(registry_)));
    router_->addHandler("POST", endpoints::AUTH_DENY, std::make_shared<ChainHandler>(
        localOnly, std::make_shared<DenyRequestHandler>(registry_)));
    router_->addHandler("GET", endpoints::AUTH_PENDING, std::make_shared<ChainHandler>(
        localOnly, std::make_shared<PendingRequestsHandler>(registry_)));

    // По сессии
    router_->addHandler("GET", endpoints::WALLET_INFO, std::make_shared<ChainHandler>(
        requireSession(protocol::Permission::WALLET_INFO), std::make_shared<WalletInfoHandler>(wallet)));
    router_->addHandler("POST", endpoints::WALLET_LOCK, std::make_shared<ChainHandler>(
        requireSession(std::nullopt), std::make_shared<LockWalletHandler>(wallet)));
    router_->addHandler("GET", endpoints::BALANCE, std::make_shared<ChainHandler>(
        requireSession(protocol::Permission::BALANCE), std::make_shared<BalanceHandler>(wallet)));
    router_->addHandler("POST", endpoints::TRANSACTION, std::make_shared<ChainHandler>(
        requireSession(protocol::Permission::TRANSACTIONS), std::make_shared<TransactionHandler>(wallet)));
    router_->addHandler("POST", endpoints::SIGN_MESSAGE, std::make_shared<ChainHandler>(
        requireSession(protocol::Permission::SIGN_MESSAGE), std::make_shared<SignMessageHandler>(wallet)));
    router_->addHandler("POST", endpoints::ADD_TOKEN, std::make_shared<ChainHandler>(
        requireSession(protocol::Permission::ADD_TOKEN), std::make_shared<AddTokenHandler>(wallet)));
    router_->addHandler("GET", endpoints::LIST_TOKENS, std::make_shared<ChainHandler>(
        requireSession(protocol::Permission::ADD_TOKEN), std::make_shared<ListTokensHandler>(wallet)));
}

server::StartupReport WalletGateApp::start() {
    if (!server_) {
        configureInjection();
    }
    return server_->startRobust(settings_.server->getHost(),
                                settings_.server->getPort(),
                                settings_.protocol->getStartupRetries());
}

void WalletGateApp::shutdown() {
    if (server_ && server_->isRunning()) {
        server_->stop();
    }
    if (sessions_) {
        sessions_->clear();
    }
}

} // namespace walletgate
