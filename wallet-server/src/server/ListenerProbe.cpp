#include "server/ListenerProbe.hpp"
#include "protocol/ProtocolConstants.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <iostream>

namespace walletgate::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

bool HttpListenerProbe::isResponsive(const std::string& host, uint16_t port) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code result = net::error::would_block;

    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return false;
    }

    http::request<http::empty_body> req{http::verb::get, protocol::endpoints::WALLET_STATUS, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "walletgate-probe");

    // Один дедлайн на connect + write + read
    stream.expires_after(timeout_);
    stream.async_connect(endpoints, [&](beast::error_code connectEc, const tcp::endpoint&) {
        if (connectEc) {
            result = connectEc;
            return;
        }
        http::async_write(stream, req, [&](beast::error_code writeEc, std::size_t) {
            if (writeEc) {
                result = writeEc;
                return;
            }
            http::async_read(stream, buffer, res, [&](beast::error_code readEc, std::size_t) {
                result = readEc;
            });
        });
    });
    ioc.run();

    if (result) {
        std::cout << "[ListenerProbe] " << host << ":" << port
                  << " did not answer: " << result.message() << std::endl;
        return false;
    }
    if (res.result_int() != 200) {
        return false;
    }

    auto body = nlohmann::json::parse(res.body(), nullptr, false);
    return !body.is_discarded() && body.is_object() && body.contains("available");
}

} // namespace walletgate::server
