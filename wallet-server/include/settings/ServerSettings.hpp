#pragma once

#include "protocol/ProtocolConstants.hpp"

#include <settings/IServerSettings.hpp>
#include <cstdlib>
#include <string>

namespace walletgate::settings {

/**
 * @brief Адрес и порт слушателя
 *
 * По умолчанию только loopback: API кошелька не должен быть виден снаружи.
 */
class ServerSettings : public IServerSettings {
public:
    ServerSettings() {
        if (const char* host = std::getenv("WALLETGATE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("WALLETGATE_PORT")) {
            port_ = static_cast<uint16_t>(std::stoi(port));
        }
    }

    ServerSettings(std::string host, uint16_t port)
        : host_(std::move(host)), port_(port) {}

    std::string getHost() const override { return host_; }
    uint16_t getPort() const override { return port_; }

private:
    std::string host_ = protocol::config::DEFAULT_HOST;
    uint16_t port_ = protocol::config::DEFAULT_PORT;
};

} // namespace walletgate::settings
