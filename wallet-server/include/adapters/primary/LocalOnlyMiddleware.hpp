#pragma once

#include "HttpErrors.hpp"
#include "settings/ProtocolSettings.hpp"

#include <IHttpHandler.hpp>
#include <boost/asio/ip/address.hpp>
#include <iostream>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief Доступ только с loopback адреса
 *
 * Закрывает approve/deny/pending: ими пользуется UI самого кошелька,
 * который всегда работает на той же машине.
 */
class LocalOnlyMiddleware : public IHttpHandler {
public:
    explicit LocalOnlyMiddleware(std::shared_ptr<settings::ProtocolSettings> settings)
        : settings_(std::move(settings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        if (settings_->isLocalOnlyAdmin() && !isLoopback(req.getIp())) {
            std::cout << "[LocalOnlyMiddleware] Rejected " << req.getPath()
                      << " from " << req.getIp() << std::endl;
            sendError(res, protocol::ErrorCode::FORBIDDEN,
                      "This endpoint is only available to the local wallet");
            return;
        }
        res.setStatus(0); // для middleware
    }

    static bool isLoopback(const std::string& ip) {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(ip, ec);
        if (ec) {
            return false;
        }
        if (address.is_v6() && address.to_v6().is_v4_mapped()) {
            return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6()).is_loopback();
        }
        return address.is_loopback();
    }

private:
    std::shared_ptr<settings::ProtocolSettings> settings_;
};

} // namespace walletgate::adapters::primary
