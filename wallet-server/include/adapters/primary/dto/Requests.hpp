#pragma once

#include "domain/WalletModels.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace walletgate::adapters::primary::dto {

/**
 * @brief Тело запроса не прошло проверку схемы
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

namespace detail {

inline std::string requireString(const nlohmann::json& body, const char* field,
                                 size_t minLength, size_t maxLength) {
    if (!body.contains(field) || !body[field].is_string()) {
        throw ValidationError(std::string(field) + " is required");
    }
    auto value = body[field].get<std::string>();
    if (value.size() < minLength || value.size() > maxLength) {
        throw ValidationError(std::string(field) + " must be " + std::to_string(minLength)
                              + "-" + std::to_string(maxLength) + " characters");
    }
    return value;
}

inline std::optional<std::string> optionalString(const nlohmann::json& body, const char* field,
                                                 size_t maxLength) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    if (!body[field].is_string()) {
        throw ValidationError(std::string(field) + " must be a string");
    }
    auto value = body[field].get<std::string>();
    if (value.size() > maxLength) {
        throw ValidationError(std::string(field) + " must be at most "
                              + std::to_string(maxLength) + " characters");
    }
    return value;
}

inline void requireObject(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
}

} // namespace detail

/// POST /wallet/unlock
struct UnlockRequest {
    std::string password;

    static UnlockRequest fromJson(const nlohmann::json& body) {
        detail::requireObject(body);
        return {detail::requireString(body, "password", 1, 1024)};
    }
};

/// POST /auth/request
struct AuthorizationRequestBody {
    std::string appName;
    std::string appUrl;
    std::vector<std::string> permissions;
    std::optional<std::string> description;

    static AuthorizationRequestBody fromJson(const nlohmann::json& body) {
        detail::requireObject(body);
        AuthorizationRequestBody dto;
        dto.appName = detail::requireString(body, "app_name", 1, 100);
        dto.appUrl = detail::requireString(body, "app_url", 1, 500);
        dto.description = detail::optionalString(body, "description", 500);

        if (body.contains("permissions") && !body["permissions"].is_null()) {
            if (!body["permissions"].is_array()) {
                throw ValidationError("permissions must be an array");
            }
            for (const auto& item : body["permissions"]) {
                if (!item.is_string()) {
                    throw ValidationError("permissions must contain strings");
                }
                dto.permissions.push_back(item.get<std::string>());
            }
        }
        return dto;
    }
};

/// POST /transaction
struct TransactionBody {
    static domain::TransactionRequest fromJson(const nlohmann::json& body) {
        detail::requireObject(body);
        domain::TransactionRequest request;
        request.contract = detail::requireString(body, "contract", 1, 100);
        request.function = detail::requireString(body, "function", 1, 100);

        if (body.contains("kwargs") && !body["kwargs"].is_null()) {
            if (!body["kwargs"].is_object()) {
                throw ValidationError("kwargs must be an object");
            }
            request.kwargs = body["kwargs"];
        }

        if (body.contains("stamps_supplied") && !body["stamps_supplied"].is_null()) {
            if (!body["stamps_supplied"].is_number_integer() || body["stamps_supplied"].get<int64_t>() < 0) {
                throw ValidationError("stamps_supplied must be a non-negative integer");
            }
            request.stampsSupplied = body["stamps_supplied"].get<int64_t>();
        }
        return request;
    }
};

/// POST /sign
struct SignBody {
    std::string message;

    static SignBody fromJson(const nlohmann::json& body) {
        detail::requireObject(body);
        return {detail::requireString(body, "message", 1, 10000)};
    }
};

/// POST /tokens/add
struct AddTokenBody {
    static domain::TokenInfo fromJson(const nlohmann::json& body) {
        detail::requireObject(body);
        domain::TokenInfo token;
        token.contractAddress = detail::requireString(body, "contract_address", 1, 100);
        token.tokenName = detail::optionalString(body, "token_name", 100).value_or("");
        token.tokenSymbol = detail::optionalString(body, "token_symbol", 20).value_or("");

        if (body.contains("decimals") && !body["decimals"].is_null()) {
            if (!body["decimals"].is_number_integer()) {
                throw ValidationError("decimals must be an integer");
            }
            auto decimals = body["decimals"].get<int64_t>();
            if (decimals < 0 || decimals > 18) {
                throw ValidationError("decimals must be between 0 and 18");
            }
            token.decimals = static_cast<int>(decimals);
        }
        return token;
    }
};

} // namespace walletgate::adapters::primary::dto
