#pragma once

#include <string>

namespace walletgate::ports::output {

/**
 * @brief Открытое push соединение с UI кошелька
 */
class IPushChannel {
public:
    virtual ~IPushChannel() = default;

    virtual const std::string& id() const = 0;

    /// @return false если соединение мёртвое
    virtual bool send(const std::string& message) = 0;

    virtual void close() = 0;
};

} // namespace walletgate::ports::output
