#include "server/WebSocketChannel.hpp"

#include <boost/asio/post.hpp>
#include <iostream>

namespace walletgate::server {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

WebSocketChannel::WebSocketChannel(net::ip::tcp::socket socket,
                                   std::string id,
                                   OpenCallback onOpen,
                                   CloseCallback onClosed)
    : ws_(std::move(socket))
    , id_(std::move(id))
    , onOpen_(std::move(onOpen))
    , onClosed_(std::move(onClosed))
{}

void WebSocketChannel::accept(beast::http::request<beast::http::string_body> req) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "walletgate/1.0.0");
    }));

    ws_.async_accept(req, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            std::cerr << "[WebSocketChannel] Handshake failed for " << self->id_ << ": " << ec.message() << std::endl;
            return;
        }
        self->open_ = true;
        std::cout << "[WebSocketChannel] Opened: " << self->id_ << std::endl;
        if (self->onOpen_) {
            self->onOpen_(self);
        }
        self->doRead();
    });
}

bool WebSocketChannel::send(const std::string& message) {
    if (!open_) {
        return false;
    }

    net::post(ws_.get_executor(), [self = shared_from_this(), message]() {
        if (!self->open_) {
            return;
        }
        self->queue_.push_back(message);
        if (self->queue_.size() == 1) {
            self->doWrite();
        }
    });
    return true;
}

void WebSocketChannel::close() {
    if (!open_.exchange(false)) {
        return;
    }

    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->ws_.async_close(websocket::close_code::going_away, [self](beast::error_code) {
            std::cout << "[WebSocketChannel] Closed: " << self->id_ << std::endl;
        });
    });
}

void WebSocketChannel::doRead() {
    ws_.async_read(readBuffer_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
            self->markClosed(ec);
            return;
        }
        // Клиентские сообщения не обрабатываются
        self->readBuffer_.consume(self->readBuffer_.size());
        self->doRead();
    });
}

void WebSocketChannel::doWrite() {
    ws_.text(true);
    ws_.async_write(net::buffer(queue_.front()), [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
            self->queue_.clear();
            self->markClosed(ec);
            return;
        }
        self->queue_.pop_front();
        if (!self->queue_.empty()) {
            self->doWrite();
        }
    });
}

void WebSocketChannel::markClosed(const beast::error_code& ec) {
    open_ = false;
    if (closeNotified_.exchange(true)) {
        return;
    }
    if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
        std::cout << "[WebSocketChannel] " << id_ << " dropped: " << ec.message() << std::endl;
    }
    if (onClosed_) {
        onClosed_(id_);
    }
}

} // namespace walletgate::server
