#include "server/ProtocolServer.hpp"
#include "server/WebSocketChannel.hpp"
#include "utils/TokenGenerator.hpp"

#include <boost/asio/post.hpp>
#include <future>
#include <iostream>

namespace walletgate::server {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr auto DRAIN_TIMEOUT = std::chrono::milliseconds(200);

} // namespace

ProtocolServer::ProtocolServer(std::shared_ptr<HttpRouter> router,
                               std::shared_ptr<CorsPolicy> cors,
                               std::shared_ptr<ports::output::INotificationBus> bus,
                               std::shared_ptr<ports::input::IRequestRegistry> registry,
                               std::shared_ptr<MaintenanceLoop> maintenance,
                               std::shared_ptr<IListenerProbe> probe,
                               std::shared_ptr<IPortReclaimer> reclaimer)
    : router_(std::move(router))
    , cors_(std::move(cors))
    , bus_(std::move(bus))
    , registry_(std::move(registry))
    , maintenance_(std::move(maintenance))
    , probe_(std::move(probe))
    , reclaimer_(std::move(reclaimer))
{}

ProtocolServer::~ProtocolServer() {
    stop();
}

void ProtocolServer::start(const std::string& host, uint16_t port) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) {
        return;
    }

    boost::system::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec) {
        throw ListenerBindError("Invalid listen address '" + host + "'", ec);
    }

    auto ioc = std::make_unique<net::io_context>(1);
    auto acceptor = std::make_unique<tcp::acceptor>(*ioc);
    tcp::endpoint endpoint(address, port);

    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        acceptor->close(ignored);
        throw ListenerBindError("Cannot listen on " + host + ":" + std::to_string(port), ec);
    }

    boundPort_ = acceptor->local_endpoint().port();
    ioc_ = std::move(ioc);
    acceptor_ = std::move(acceptor);

    doAccept();
    maintenance_->start();
    thread_ = std::thread([ioc = ioc_.get()]() { ioc->run(); });
    running_ = true;

    std::cout << "[ProtocolServer] Listening on " << host << ":" << boundPort_ << std::endl;
}

StartupReport ProtocolServer::startRobust(const std::string& host, uint16_t port, int maxRetries) {
    StartupReport report;

    for (int attempt = 0; attempt <= maxRetries; ++attempt) {
        report.attempts = attempt + 1;
        try {
            start(host, port);
            report.status = StartupStatus::STARTED;
            report.message = "Listening on " + host + ":" + std::to_string(boundPort_);
            return report;
        } catch (const ListenerBindError& e) {
            if (e.code() != net::error::address_in_use) {
                report.status = StartupStatus::FAILED;
                report.message = e.what();
                return report;
            }

            std::cout << "[ProtocolServer] Port " << port << " is busy, probing current owner" << std::endl;
            if (probe_->isResponsive(host, port)) {
                report.status = StartupStatus::ALREADY_RUNNING;
                report.message = "Wallet server already running on " + host + ":" + std::to_string(port);
                std::cout << "[ProtocolServer] " << report.message << std::endl;
                return report;
            }

            if (attempt == maxRetries) {
                break;
            }
            reclaimer_->reclaim(port);
            std::this_thread::sleep_for(retryBackoff_ * (1 << attempt));
        }
    }

    report.status = StartupStatus::FAILED;
    report.message = "Port " + std::to_string(port) + " still busy after "
                     + std::to_string(report.attempts) + " attempts";
    std::cerr << "[ProtocolServer] " << report.message << std::endl;
    return report;
}

void ProtocolServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) {
        return;
    }
    running_ = false;

    maintenance_->stop();
    bus_->closeAll();

    // Закрываем acceptor на потоке io и даём close-фреймам уйти
    auto drained = std::make_shared<std::promise<void>>();
    auto drainedFuture = drained->get_future();
    net::post(*ioc_, [acceptor = acceptor_.get(), drained]() {
        boost::system::error_code ignored;
        acceptor->close(ignored);
        drained->set_value();
    });
    drainedFuture.wait_for(DRAIN_TIMEOUT);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    ioc_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    acceptor_.reset();
    ioc_.reset();
    boundPort_ = 0;

    std::cout << "[ProtocolServer] Stopped" << std::endl;
}

void ProtocolServer::doAccept() {
    acceptor_->async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                std::cerr << "[ProtocolServer] Accept error: " << ec.message() << std::endl;
            }
            if (!acceptor_->is_open()) {
                return;
            }
        } else {
            std::make_shared<HttpConnection>(
                std::move(socket), router_, cors_,
                [this](tcp::socket upgraded, HttpConnection::Request req) {
                    onUpgrade(std::move(upgraded), std::move(req));
                })->run();
        }
        doAccept();
    });
}

void ProtocolServer::onUpgrade(tcp::socket socket, HttpConnection::Request req) {
    auto bus = bus_;
    auto registry = registry_;
    auto channel = std::make_shared<WebSocketChannel>(
        std::move(socket),
        utils::TokenGenerator::generateWithPrefix("ws"),
        [bus, registry](std::shared_ptr<WebSocketChannel> opened) {
            bus->subscribe(opened);
            opened->send(domain::ConnectedEvent(opened->id(), registry->pendingCount()).serialize());
        },
        [bus](const std::string& id) {
            bus->unsubscribe(id);
        });
    channel->accept(std::move(req));
}

} // namespace walletgate::server
