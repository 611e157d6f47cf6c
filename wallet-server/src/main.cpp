#include "WalletGateApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработчика сигналов
walletgate::WalletGateApp* g_app = nullptr;

void signalHandler(int signal) {
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        walletgate::WalletGateApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Wallet Gate v" << walletgate::protocol::config::PROTOCOL_VERSION << " Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. startRobust() и ожидание сигнала
        int code = app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Wallet Gate stopped" << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
