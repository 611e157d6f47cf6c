#pragma once

#include <cstdlib>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace walletgate::settings {

/**
 * @brief Режим CORS
 *
 * DEVELOPMENT - любой Origin, LOCALHOST - локальные порты dev серверов,
 * PRODUCTION - явный список.
 */
enum class CorsMode {
    DEVELOPMENT,
    LOCALHOST,
    PRODUCTION
};

inline CorsMode corsModeFromString(const std::string& str) {
    if (str == "development") return CorsMode::DEVELOPMENT;
    if (str == "localhost") return CorsMode::LOCALHOST;
    if (str == "production") return CorsMode::PRODUCTION;
    throw std::invalid_argument("Unknown CORS mode: " + str);
}

class CorsSettings {
public:
    CorsSettings() {
        if (const char* val = std::getenv("WALLETGATE_CORS_MODE")) {
            mode_ = corsModeFromString(val);
        }
        if (const char* val = std::getenv("WALLETGATE_CORS_ORIGINS")) {
            std::istringstream ss(val);
            std::string origin;
            while (std::getline(ss, origin, ',')) {
                if (!origin.empty()) {
                    origins_.insert(origin);
                }
            }
        }
    }

    CorsSettings(CorsMode mode, std::set<std::string> origins)
        : mode_(mode), origins_(std::move(origins)) {}

    CorsMode getMode() const { return mode_; }
    const std::set<std::string>& getOrigins() const { return origins_; }

private:
    CorsMode mode_ = CorsMode::LOCALHOST;
    std::set<std::string> origins_;
};

} // namespace walletgate::settings
