#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace walletgate::client {

/**
 * @brief Подписка на push события сервера (WebSocket /ws/v1)
 *
 * Чтение идёт в собственном потоке. Колбэк вызывается из этого потока,
 * поэтому закрывать подписку изнутри колбэка нельзя.
 */
class PushSubscription {
public:
    using EventCallback = std::function<void(const nlohmann::json&)>;

    PushSubscription(std::string host, uint16_t port, EventCallback callback);
    ~PushSubscription();

    PushSubscription(const PushSubscription&) = delete;
    PushSubscription& operator=(const PushSubscription&) = delete;

    /**
     * @brief Подключиться и начать читать события
     * @throws boost::system::system_error если сервер недоступен
     */
    void open();

    /// Закрыть соединение и дождаться потока чтения. Идемпотентно
    void close();

    bool isOpen() const { return open_; }
    size_t receivedCount() const { return received_; }

private:
    void doRead();

    std::string host_;
    uint16_t port_;
    EventCallback callback_;

    boost::asio::io_context io_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::thread thread_;
    std::atomic<bool> open_{false};
    std::atomic<size_t> received_{0};
};

} // namespace walletgate::client
