#pragma once

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace walletgate::protocol {

/**
 * @brief Разрешение, которое DApp может получить в рамках сессии
 */
enum class Permission {
    WALLET_INFO,   ///< Адрес, сеть, chain id
    BALANCE,       ///< Чтение балансов
    TRANSACTIONS,  ///< Отправка транзакций
    SIGN_MESSAGE,  ///< Подпись сообщений
    ADD_TOKEN      ///< Регистрация пользовательских токенов
};

/**
 * @brief Преобразовать в строку (формат протокола)
 */
inline std::string toString(Permission permission) {
    switch (permission) {
        case Permission::WALLET_INFO:  return "wallet_info";
        case Permission::BALANCE:      return "balance";
        case Permission::TRANSACTIONS: return "transactions";
        case Permission::SIGN_MESSAGE: return "sign_message";
        case Permission::ADD_TOKEN:    return "add_token";
    }
    return "unknown";
}

/**
 * @brief Распознать разрешение
 * @return nullopt если строка не является известным разрешением
 */
inline std::optional<Permission> parsePermission(const std::string& str) {
    if (str == "wallet_info")  return Permission::WALLET_INFO;
    if (str == "balance")      return Permission::BALANCE;
    if (str == "transactions") return Permission::TRANSACTIONS;
    if (str == "sign_message") return Permission::SIGN_MESSAGE;
    if (str == "add_token")    return Permission::ADD_TOKEN;
    return std::nullopt;
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline Permission permissionFromString(const std::string& str) {
    auto permission = parsePermission(str);
    if (!permission) {
        throw std::invalid_argument("Unknown permission: " + str);
    }
    return *permission;
}

using PermissionSet = std::set<Permission>;

inline std::vector<std::string> toStrings(const PermissionSet& permissions) {
    std::vector<std::string> result;
    result.reserve(permissions.size());
    for (auto permission : permissions) {
        result.push_back(toString(permission));
    }
    return result;
}

} // namespace walletgate::protocol
