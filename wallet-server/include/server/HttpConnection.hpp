#pragma once

#include "server/CorsPolicy.hpp"
#include "server/HttpRouter.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <memory>

namespace walletgate::server {

/**
 * @brief Одно HTTP соединение (keep-alive)
 *
 * Переводит Beast запрос в SimpleRequest, отдаёт его роутеру и
 * собирает ответ с CORS заголовками. Upgrade на /ws/v1 передаёт
 * сокет наружу.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using UpgradeHandler = std::function<void(boost::asio::ip::tcp::socket, Request)>;

    HttpConnection(boost::asio::ip::tcp::socket socket,
                   std::shared_ptr<HttpRouter> router,
                   std::shared_ptr<CorsPolicy> cors,
                   UpgradeHandler onUpgrade);

    void run();

    /// Обработка без сокета (вызывается и из тестов)
    static Response buildResponse(const Request& req,
                                  const std::string& peerIp,
                                  uint16_t peerPort,
                                  const HttpRouter& router,
                                  const CorsPolicy& cors);

private:
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    Request req_;
    std::shared_ptr<Response> res_;
    std::shared_ptr<HttpRouter> router_;
    std::shared_ptr<CorsPolicy> cors_;
    UpgradeHandler onUpgrade_;

    void doRead();
    void onRead(boost::beast::error_code ec, std::size_t bytes);
    void onWrite(bool keepAlive, boost::beast::error_code ec, std::size_t bytes);
    void doClose();
};

} // namespace walletgate::server
