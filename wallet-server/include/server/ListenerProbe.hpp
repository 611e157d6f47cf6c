#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace walletgate::server {

/**
 * @brief Проверка: отвечает ли тот, кто занял порт
 */
class IListenerProbe {
public:
    virtual ~IListenerProbe() = default;

    virtual bool isResponsive(const std::string& host, uint16_t port) = 0;
};

/**
 * @brief GET /api/v1/wallet/status с жёстким дедлайном
 *
 * Отвечающим считается только тот, кто вернул 200 и JSON с полем
 * "available": чужой сервис на порту не маскируется под кошелёк.
 */
class HttpListenerProbe : public IListenerProbe {
public:
    explicit HttpListenerProbe(std::chrono::milliseconds timeout = std::chrono::milliseconds{2000})
        : timeout_(timeout) {}

    bool isResponsive(const std::string& host, uint16_t port) override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace walletgate::server
