#pragma once

#include "ports/input/IRequestRegistry.hpp"
#include "ports/output/INotificationBus.hpp"
#include "server/CorsPolicy.hpp"
#include "server/HttpConnection.hpp"
#include "server/HttpRouter.hpp"
#include "server/ListenerProbe.hpp"
#include "server/MaintenanceLoop.hpp"
#include "server/PortReclaimer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace walletgate::server {

/**
 * @brief Не удалось занять адрес
 */
class ListenerBindError : public std::runtime_error {
public:
    ListenerBindError(const std::string& message, boost::system::error_code code)
        : std::runtime_error(message + ": " + code.message())
        , code_(code) {}

    boost::system::error_code code() const { return code_; }

private:
    boost::system::error_code code_;
};

enum class StartupStatus {
    STARTED,
    ALREADY_RUNNING,
    FAILED
};

/**
 * @brief Итог startRobust
 */
struct StartupReport {
    StartupStatus status = StartupStatus::FAILED;
    int attempts = 0;
    std::string message;
};

/**
 * @brief HTTP + WebSocket сервер протокола
 *
 * Один поток io_context обслуживает все соединения. Фоновая чистка
 * живёт в MaintenanceLoop и стартует/останавливается вместе с сервером.
 */
class ProtocolServer {
public:
    ProtocolServer(std::shared_ptr<HttpRouter> router,
                   std::shared_ptr<CorsPolicy> cors,
                   std::shared_ptr<ports::output::INotificationBus> bus,
                   std::shared_ptr<ports::input::IRequestRegistry> registry,
                   std::shared_ptr<MaintenanceLoop> maintenance,
                   std::shared_ptr<IListenerProbe> probe,
                   std::shared_ptr<IPortReclaimer> reclaimer);

    ~ProtocolServer();

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;

    /**
     * @brief Занять адрес и начать принимать соединения
     * @throws ListenerBindError
     */
    void start(const std::string& host, uint16_t port);

    /**
     * @brief start() с разбором занятого порта
     *
     * Порт занят отвечающим кошельком -> ALREADY_RUNNING.
     * Порт занят зависшим процессом -> освобождаем и повторяем
     * до maxRetries раз с растущей паузой.
     */
    StartupReport startRobust(const std::string& host, uint16_t port, int maxRetries);

    /// Идемпотентно: без запущенного сервера ничего не делает
    void stop();

    bool isRunning() const { return running_; }

    /// Реальный порт (полезно при port = 0)
    uint16_t boundPort() const { return boundPort_; }

    void setRetryBackoff(std::chrono::milliseconds backoff) { retryBackoff_ = backoff; }

private:
    std::shared_ptr<HttpRouter> router_;
    std::shared_ptr<CorsPolicy> cors_;
    std::shared_ptr<ports::output::INotificationBus> bus_;
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
    std::shared_ptr<MaintenanceLoop> maintenance_;
    std::shared_ptr<IListenerProbe> probe_;
    std::shared_ptr<IPortReclaimer> reclaimer_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> boundPort_{0};
    std::chrono::milliseconds retryBackoff_{500};

    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread thread_;

    void doAccept();
    void onUpgrade(boost::asio::ip::tcp::socket socket, HttpConnection::Request req);
};

} // namespace walletgate::server
