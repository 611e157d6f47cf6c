#pragma once

#include "ports/output/IPushChannel.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace walletgate::server {

/**
 * @brief Push канал поверх Beast WebSocket
 *
 * send() можно звать из любого потока: сообщение ставится в очередь
 * на executor сокета и пишется по одному. Входящие сообщения читаются
 * только для того, чтобы заметить закрытие.
 */
class WebSocketChannel : public ports::output::IPushChannel,
                         public std::enable_shared_from_this<WebSocketChannel> {
public:
    using OpenCallback = std::function<void(std::shared_ptr<WebSocketChannel>)>;
    using CloseCallback = std::function<void(const std::string&)>;

    WebSocketChannel(boost::asio::ip::tcp::socket socket,
                     std::string id,
                     OpenCallback onOpen,
                     CloseCallback onClosed);

    /// Завершить upgrade по уже прочитанному HTTP запросу
    void accept(boost::beast::http::request<boost::beast::http::string_body> req);

    const std::string& id() const override { return id_; }
    bool send(const std::string& message) override;
    void close() override;

    bool isOpen() const { return open_; }

private:
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    std::string id_;
    OpenCallback onOpen_;
    CloseCallback onClosed_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closeNotified_{false};
    std::deque<std::string> queue_;
    boost::beast::flat_buffer readBuffer_;

    void doRead();
    void doWrite();
    void markClosed(const boost::beast::error_code& ec);
};

} // namespace walletgate::server
