#pragma once

#include <stdexcept>
#include <string>

namespace walletgate::protocol {

/**
 * @brief Вид кошелька, который обслуживает сервер
 */
enum class WalletType {
    DESKTOP,
    WEB,
    CLI,
    HARDWARE
};

inline std::string toString(WalletType type) {
    switch (type) {
        case WalletType::DESKTOP:  return "desktop";
        case WalletType::WEB:      return "web";
        case WalletType::CLI:      return "cli";
        case WalletType::HARDWARE: return "hardware";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline WalletType walletTypeFromString(const std::string& str) {
    if (str == "desktop")  return WalletType::DESKTOP;
    if (str == "web")      return WalletType::WEB;
    if (str == "cli")      return WalletType::CLI;
    if (str == "hardware") return WalletType::HARDWARE;
    throw std::invalid_argument("Unknown WalletType: " + str);
}

} // namespace walletgate::protocol
