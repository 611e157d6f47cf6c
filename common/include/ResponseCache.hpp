#pragma once

#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace walletgate {

/**
 * @brief Короткоживущий кэш ответов поверх cpp-cache (LRU)
 *
 * Один и тот же класс используется сервером (чтобы не ходить в цепочку
 * за каждым балансом) и клиентом (чтобы не гонять лишние запросы к кошельку).
 *
 * Ёмкость ограничена: при переполнении LRU вытесняет самую старую по
 * обращению запись. TTL задаёт вызывающий в момент чтения, поэтому время
 * записи хранится внутри значения. Просроченная запись удаляется при чтении.
 *
 * Ключи логические: "balance:<contract>", "wallet_info" и т.п.
 */
class ResponseCache
{
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    static constexpr size_t DEFAULT_CAPACITY = 1000;

    /**
     * @param capacity Максимальное количество записей
     * @param now Источник времени (в тестах подменяется)
     */
    explicit ResponseCache(size_t capacity = DEFAULT_CAPACITY,
                           TimeSource now = [] { return Clock::now(); })
        : capacity_(capacity)
        , now_(std::move(now))
    {
        auto base = std::make_unique<Cache<std::string, Entry>>(
            capacity_,
            std::make_unique<LRUPolicy<std::string>>());
        cache_ = std::make_unique<ThreadSafeCache<std::string, Entry>>(std::move(base));
    }

    /**
     * @brief Получить значение, если оно моложе ttl
     */
    std::optional<std::string> get(const std::string &key, std::chrono::milliseconds ttl) const
    {
        auto entry = cache_->get(key);
        if (!entry)
        {
            return std::nullopt;
        }
        if (now_() - entry->storedAt >= ttl)
        {
            remove(key);
            return std::nullopt;
        }
        return entry->value;
    }

    void set(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(keysMutex_);
        cache_->put(key, Entry{value, now_()});
        keys_.insert(key);
        if (keys_.size() > 2 * capacity_)
        {
            pruneKeys();
        }
    }

    bool remove(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(keysMutex_);
        keys_.erase(key);
        return cache_->remove(key);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(keysMutex_);
        cache_->clear();
        keys_.clear();
    }

    /**
     * @brief Удалить все ключи с заданным префиксом
     *
     * Например clearMatching("balance:") после отправки перевода.
     * cpp-cache не перечисляет ключи, поэтому префикс ищется по
     * собственному индексу ключей.
     * @return Количество удалённых записей
     */
    size_t clearMatching(const std::string &prefix)
    {
        std::lock_guard<std::mutex> lock(keysMutex_);
        size_t removed = 0;
        for (auto it = keys_.lower_bound(prefix); it != keys_.end();)
        {
            if (it->compare(0, prefix.size(), prefix) != 0)
            {
                break;
            }
            if (cache_->remove(*it))
            {
                ++removed;
            }
            it = keys_.erase(it);
        }
        return removed;
    }

    /**
     * @brief Количество записей в кэше (не больше capacity)
     */
    size_t size() const
    {
        return cache_->size();
    }

    size_t capacity() const { return capacity_; }

private:
    struct Entry
    {
        std::string value;
        Clock::time_point storedAt;
    };

    // Выбросить из индекса ключи, которые LRU уже вытеснил
    void pruneKeys()
    {
        for (auto it = keys_.begin(); it != keys_.end();)
        {
            if (cache_->get(*it))
            {
                ++it;
            }
            else
            {
                it = keys_.erase(it);
            }
        }
    }

    size_t capacity_;
    TimeSource now_;
    std::unique_ptr<ICache<std::string, Entry>> cache_;

    mutable std::mutex keysMutex_;
    mutable std::set<std::string> keys_;
};

} // namespace walletgate
