#pragma once

#include "settings/CorsSettings.hpp"

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace walletgate::server {

/**
 * @brief Какие Origin получают CORS заголовки
 *
 * Разрешённый Origin отражается в Access-Control-Allow-Origin.
 * Остальные получают ответ без CORS заголовков: запрос выполняется,
 * но браузер его заблокирует.
 */
class CorsPolicy {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit CorsPolicy(std::shared_ptr<settings::CorsSettings> settings)
        : mode_(settings->getMode())
        , origins_(settings->getOrigins())
    {
        if (mode_ == settings::CorsMode::LOCALHOST) {
            for (int port : {3000, 3001, 4200, 5173, 8000, 8080}) {
                origins_.insert("http://localhost:" + std::to_string(port));
                origins_.insert("http://127.0.0.1:" + std::to_string(port));
            }
        }
        std::cout << "[CorsPolicy] Mode: " << modeName() << ", origins: " << origins_.size() << std::endl;
    }

    bool isAllowed(const std::string& origin) const {
        if (origin.empty()) {
            return false;
        }
        if (mode_ == settings::CorsMode::DEVELOPMENT) {
            return true;
        }
        return origins_.count(origin) > 0;
    }

    /// Заголовки для обычного ответа
    Headers responseHeaders(const std::string& origin) const {
        Headers headers;
        if (!isAllowed(origin)) {
            return headers;
        }
        headers.emplace_back("Access-Control-Allow-Origin", origin);
        headers.emplace_back("Access-Control-Allow-Credentials", "true");
        headers.emplace_back("Vary", "Origin");
        return headers;
    }

    /// Заголовки для ответа на OPTIONS
    Headers preflightHeaders(const std::string& origin) const {
        Headers headers = responseHeaders(origin);
        if (headers.empty()) {
            return headers;
        }
        headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
        headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Authorization");
        headers.emplace_back("Access-Control-Max-Age", "600");
        return headers;
    }

    settings::CorsMode mode() const { return mode_; }

private:
    settings::CorsMode mode_;
    std::set<std::string> origins_;

    std::string modeName() const {
        switch (mode_) {
            case settings::CorsMode::DEVELOPMENT: return "development";
            case settings::CorsMode::LOCALHOST:   return "localhost";
            case settings::CorsMode::PRODUCTION:  return "production";
        }
        return "unknown";
    }
};

} // namespace walletgate::server
