#pragma once

#include "domain/Result.hpp"
#include "protocol/ErrorCode.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace walletgate::adapters::primary {

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

/**
 * @brief Ответ с ошибкой протокола
 *
 * Тело: {"error": ..., "code": ..., "detail": ...}. Для отказов по лимиту
 * добавляются заголовок Retry-After и поле retry_after.
 */
inline void sendError(IResponse& res,
                      protocol::ErrorCode code,
                      const std::string& message,
                      std::optional<std::chrono::seconds> retryAfter = std::nullopt) {
    nlohmann::json error;
    error["error"] = message;
    error["code"] = protocol::toString(code);
    error["detail"] = message;
    if (retryAfter) {
        error["retry_after"] = retryAfter->count();
    }
    res.setResult(protocol::httpStatusFor(code), "application/json", error.dump());
    if (retryAfter) {
        res.setHeader("Retry-After", std::to_string(retryAfter->count()));
    }
}

template <typename T>
void sendFailure(IResponse& res, const domain::Result<T>& result) {
    sendError(res, result.error(), result.message(), result.retryAfter());
}

} // namespace walletgate::adapters::primary
