#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace walletgate::utils {

/**
 * @brief Генератор идентификаторов и токенов сессий
 *
 * Берёт энтропию напрямую из std::random_device: по id запроса
 * можно забрать токен сессии, поэтому и id, и токен должны быть
 * неугадываемыми.
 *
 * @note Thread-safe благодаря thread_local устройству
 */
class TokenGenerator {
public:
    /**
     * @brief Токен сессии: 256 бит в hex (64 символа)
     */
    static std::string sessionToken() {
        return randomHex(8);
    }

    /**
     * @brief Короткий ID с префиксом
     *
     * @param prefix Префикс (например, "req", "ws")
     * @return ID в формате "prefix-xxxxxxxxxxxxxxxx" (64 бита)
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        return prefix + "-" + randomHex(2);
    }

private:
    static std::string randomHex(int words) {
        thread_local std::random_device rd;
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (int i = 0; i < words; ++i) {
            ss << std::setw(8) << static_cast<uint32_t>(rd());
        }
        return ss.str();
    }
};

} // namespace walletgate::utils
