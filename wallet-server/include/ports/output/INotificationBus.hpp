#pragma once

#include "domain/events/PushEvent.hpp"
#include "ports/output/IPushChannel.hpp"

#include <memory>
#include <string>

namespace walletgate::ports::output {

/**
 * @brief Рассылка событий в открытые push каналы
 */
class INotificationBus {
public:
    virtual ~INotificationBus() = default;

    virtual void subscribe(std::shared_ptr<IPushChannel> channel) = 0;
    virtual void unsubscribe(const std::string& channelId) = 0;

    /**
     * @brief Отправить событие во все каналы
     *
     * Каналы, не принявшие сообщение, удаляются без повторной попытки.
     * @return Количество каналов, получивших событие
     */
    virtual size_t publish(const domain::PushEvent& event) = 0;

    virtual size_t subscriberCount() const = 0;

    virtual void closeAll() = 0;
};

} // namespace walletgate::ports::output
