#pragma once

#include <optional>
#include <string>

namespace walletgate::protocol {

/**
 * @brief Коды ошибок протокола
 *
 * Передаются в поле "code" тела ошибки и однозначно отображаются в HTTP статус.
 */
enum class ErrorCode {
    NONE,
    WALLET_LOCKED,
    UNAUTHORIZED,
    FORBIDDEN,
    SESSION_EXPIRED,
    INVALID_REQUEST,
    NOT_FOUND,
    INVALID_STATE,
    TOO_MANY_PENDING_REQUESTS,
    MAX_SESSIONS_EXCEEDED,
    TOO_MANY_ATTEMPTS,
    ACCOUNT_LOCKED,
    NETWORK_ERROR,
    TRANSACTION_FAILED,
    USER_REJECTED,
    INTERNAL_ERROR
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                      return "NONE";
        case ErrorCode::WALLET_LOCKED:             return "WALLET_LOCKED";
        case ErrorCode::UNAUTHORIZED:              return "UNAUTHORIZED";
        case ErrorCode::FORBIDDEN:                 return "FORBIDDEN";
        case ErrorCode::SESSION_EXPIRED:           return "SESSION_EXPIRED";
        case ErrorCode::INVALID_REQUEST:           return "INVALID_REQUEST";
        case ErrorCode::NOT_FOUND:                 return "NOT_FOUND";
        case ErrorCode::INVALID_STATE:             return "INVALID_STATE";
        case ErrorCode::TOO_MANY_PENDING_REQUESTS: return "TOO_MANY_PENDING_REQUESTS";
        case ErrorCode::MAX_SESSIONS_EXCEEDED:     return "MAX_SESSIONS_EXCEEDED";
        case ErrorCode::TOO_MANY_ATTEMPTS:         return "TOO_MANY_ATTEMPTS";
        case ErrorCode::ACCOUNT_LOCKED:            return "ACCOUNT_LOCKED";
        case ErrorCode::NETWORK_ERROR:             return "NETWORK_ERROR";
        case ErrorCode::TRANSACTION_FAILED:        return "TRANSACTION_FAILED";
        case ErrorCode::USER_REJECTED:             return "USER_REJECTED";
        case ErrorCode::INTERNAL_ERROR:            return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

/**
 * @brief Распознать код из тела ответа
 */
inline std::optional<ErrorCode> parseErrorCode(const std::string& str) {
    for (auto code : {ErrorCode::WALLET_LOCKED, ErrorCode::UNAUTHORIZED, ErrorCode::FORBIDDEN,
                      ErrorCode::SESSION_EXPIRED, ErrorCode::INVALID_REQUEST, ErrorCode::NOT_FOUND,
                      ErrorCode::INVALID_STATE, ErrorCode::TOO_MANY_PENDING_REQUESTS,
                      ErrorCode::MAX_SESSIONS_EXCEEDED, ErrorCode::TOO_MANY_ATTEMPTS,
                      ErrorCode::ACCOUNT_LOCKED, ErrorCode::NETWORK_ERROR,
                      ErrorCode::TRANSACTION_FAILED, ErrorCode::USER_REJECTED,
                      ErrorCode::INTERNAL_ERROR}) {
        if (toString(code) == str) {
            return code;
        }
    }
    return std::nullopt;
}

/**
 * @brief HTTP статус для кода ошибки
 */
inline int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                      return 200;
        case ErrorCode::WALLET_LOCKED:             return 423;
        case ErrorCode::UNAUTHORIZED:              return 401;
        case ErrorCode::SESSION_EXPIRED:           return 401;
        case ErrorCode::FORBIDDEN:                 return 403;
        case ErrorCode::USER_REJECTED:             return 403;
        case ErrorCode::INVALID_REQUEST:           return 400;
        case ErrorCode::TRANSACTION_FAILED:        return 400;
        case ErrorCode::NOT_FOUND:                 return 404;
        case ErrorCode::INVALID_STATE:             return 409;
        case ErrorCode::TOO_MANY_PENDING_REQUESTS: return 429;
        case ErrorCode::MAX_SESSIONS_EXCEEDED:     return 429;
        case ErrorCode::TOO_MANY_ATTEMPTS:         return 429;
        case ErrorCode::ACCOUNT_LOCKED:            return 429;
        case ErrorCode::NETWORK_ERROR:             return 502;
        case ErrorCode::INTERNAL_ERROR:            return 500;
    }
    return 500;
}

} // namespace walletgate::protocol
