#include "client/PushSubscription.hpp"
#include "protocol/ProtocolConstants.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <iostream>

namespace walletgate::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

PushSubscription::PushSubscription(std::string host, uint16_t port, EventCallback callback)
    : host_(std::move(host))
    , port_(port)
    , callback_(std::move(callback))
    , ws_(io_)
{}

PushSubscription::~PushSubscription() {
    close();
}

void PushSubscription::open() {
    if (open_) {
        return;
    }

    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_));

    beast::get_lowest_layer(ws_).connect(endpoints);

    websocket::stream_base::timeout timeouts{
        std::chrono::seconds(5),        // handshake и close
        websocket::stream_base::none(), // без idle таймаута
        false
    };
    ws_.set_option(timeouts);
    ws_.handshake(host_ + ":" + std::to_string(port_), protocol::endpoints::WEBSOCKET);

    open_ = true;
    std::cout << "[PushSubscription] Connected to " << host_ << ":" << port_ << std::endl;

    doRead();
    thread_ = std::thread([this]() { io_.run(); });
}

void PushSubscription::close() {
    if (open_.exchange(false)) {
        net::post(io_, [this]() {
            ws_.async_close(websocket::close_code::normal, [](beast::error_code) {});
        });
    }

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        std::cout << "[PushSubscription] Closed" << std::endl;
    }
}

void PushSubscription::doRead() {
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
                std::cerr << "[PushSubscription] Read error: " << ec.message() << std::endl;
            }
            open_ = false;
            return;
        }

        auto text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        ++received_;

        nlohmann::json event;
        try {
            event = nlohmann::json::parse(text);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[PushSubscription] Malformed event: " << e.what() << std::endl;
            doRead();
            return;
        }

        // Ошибка в обработчике не должна обрывать подписку
        if (callback_) {
            try {
                callback_(event);
            } catch (const std::exception& e) {
                std::cerr << "[PushSubscription] Event handler failed: " << e.what() << std::endl;
            }
        }

        doRead();
    });
}

} // namespace walletgate::client
