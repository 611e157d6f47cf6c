#include "server/HttpConnection.hpp"
#include "protocol/ProtocolConstants.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>

namespace walletgate::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

constexpr auto READ_TIMEOUT = std::chrono::seconds(30);

void applyHeaders(HttpConnection::Response& res, const CorsPolicy::Headers& headers) {
    for (const auto& [name, value] : headers) {
        res.set(name, value);
    }
}

} // namespace

HttpConnection::HttpConnection(net::ip::tcp::socket socket,
                               std::shared_ptr<HttpRouter> router,
                               std::shared_ptr<CorsPolicy> cors,
                               UpgradeHandler onUpgrade)
    : stream_(std::move(socket))
    , router_(std::move(router))
    , cors_(std::move(cors))
    , onUpgrade_(std::move(onUpgrade))
{}

void HttpConnection::run() {
    doRead();
}

void HttpConnection::doRead() {
    req_ = {};
    stream_.expires_after(READ_TIMEOUT);
    http::async_read(stream_, buffer_, req_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
            self->onRead(ec, bytes);
        });
}

void HttpConnection::onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        doClose();
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
            std::cerr << "[HttpConnection] Read error: " << ec.message() << std::endl;
        }
        return;
    }

    if (beast::websocket::is_upgrade(req_)) {
        std::string target(req_.target());
        if (target == protocol::endpoints::WEBSOCKET && onUpgrade_) {
            stream_.expires_never();
            onUpgrade_(stream_.release_socket(), std::move(req_));
            return;
        }
    }

    beast::error_code peerEc;
    auto peer = stream_.socket().remote_endpoint(peerEc);
    std::string peerIp = peerEc ? "" : peer.address().to_string();
    uint16_t peerPort = peerEc ? 0 : peer.port();

    res_ = std::make_shared<Response>(buildResponse(req_, peerIp, peerPort, *router_, *cors_));
    bool keepAlive = res_->keep_alive();

    http::async_write(stream_, *res_,
        [self = shared_from_this(), keepAlive](beast::error_code writeEc, std::size_t bytes) {
            self->onWrite(keepAlive, writeEc, bytes);
        });
}

void HttpConnection::onWrite(bool keepAlive, beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "[HttpConnection] Write error: " << ec.message() << std::endl;
        return;
    }
    if (!keepAlive) {
        doClose();
        return;
    }
    res_.reset();
    doRead();
}

void HttpConnection::doClose() {
    beast::error_code ec;
    stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
}

HttpConnection::Response HttpConnection::buildResponse(const Request& req,
                                                       const std::string& peerIp,
                                                       uint16_t peerPort,
                                                       const HttpRouter& router,
                                                       const CorsPolicy& cors) {
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, "walletgate/1.0.0");
    res.keep_alive(req.keep_alive());

    const std::string origin(req[http::field::origin]);

    if (req.method() == http::verb::options) {
        auto headers = cors.preflightHeaders(origin);
        if (headers.empty()) {
            res.result(http::status::bad_request);
            res.set(http::field::content_type, "application/json");
            res.body() = nlohmann::json{{"error", "Disallowed CORS origin"}}.dump();
        } else {
            applyHeaders(res, headers);
        }
        res.prepare_payload();
        return res;
    }

    std::string target(req.target());
    std::string path = target;
    std::string query;
    if (auto pos = target.find('?'); pos != std::string::npos) {
        path = target.substr(0, pos);
        query = target.substr(pos + 1);
    }

    std::map<std::string, std::string> headers;
    for (const auto& field : req) {
        headers[std::string(field.name_string())] = std::string(field.value());
    }

    SimpleRequest request(std::string(req.method_string()), path, req.body(), peerIp, peerPort, headers);

    size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        auto pair = query.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto eqPos = pair.find('=');
        if (eqPos != std::string::npos) {
            request.setQueryParam(pair.substr(0, eqPos), pair.substr(eqPos + 1));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    SimpleResponse out;
    router.dispatch(request, out);

    res.result(static_cast<unsigned>(out.getStatus()));
    res.set(http::field::content_type, out.getHeader("Content-Type").value_or("application/json"));
    if (auto retryAfter = out.getHeader("Retry-After")) {
        res.set(http::field::retry_after, *retryAfter);
    }
    applyHeaders(res, cors.responseHeaders(origin));
    res.body() = out.getBody();
    res.prepare_payload();
    return res;
}

} // namespace walletgate::server
