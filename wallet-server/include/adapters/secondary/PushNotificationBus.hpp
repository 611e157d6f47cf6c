#pragma once

#include "ThreadSafeMap.hpp"
#include "ports/output/INotificationBus.hpp"

#include <iostream>
#include <memory>

namespace walletgate::adapters::secondary {

/**
 * @brief Рассылка событий по открытым WebSocket каналам
 *
 * Каналы хранятся в ThreadSafeMap: accept-цикл добавляет их,
 * publish обходит снимок без удержания блокировки.
 */
class PushNotificationBus : public ports::output::INotificationBus {
public:
    PushNotificationBus() {
        std::cout << "[PushNotificationBus] Created" << std::endl;
    }

    void subscribe(std::shared_ptr<ports::output::IPushChannel> channel) override {
        std::cout << "[PushNotificationBus] Channel subscribed: " << channel->id() << std::endl;
        channels_.insert(channel->id(), std::move(channel));
    }

    void unsubscribe(const std::string& channelId) override {
        if (channels_.erase(channelId)) {
            std::cout << "[PushNotificationBus] Channel unsubscribed: " << channelId << std::endl;
        }
    }

    size_t publish(const domain::PushEvent& event) override {
        const std::string message = event.serialize();
        size_t delivered = 0;

        for (const auto& channel : channels_.values()) {
            if (channel->send(message)) {
                ++delivered;
            } else {
                std::cout << "[PushNotificationBus] Dropping dead channel: " << channel->id() << std::endl;
                channels_.erase(channel->id());
                channel->close();
            }
        }
        return delivered;
    }

    size_t subscriberCount() const override {
        return channels_.size();
    }

    void closeAll() override {
        auto channels = channels_.values();
        channels_.clear();
        for (const auto& channel : channels) {
            channel->close();
        }
        if (!channels.empty()) {
            std::cout << "[PushNotificationBus] Closed " << channels.size() << " channels" << std::endl;
        }
    }

private:
    ThreadSafeMap<std::string, ports::output::IPushChannel> channels_;
};

} // namespace walletgate::adapters::secondary
