#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace walletgate::domain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Источник текущего времени
 *
 * Хранилища получают его в конструкторе, тесты подставляют свой.
 */
using TimeSource = std::function<TimePoint()>;

inline TimeSource systemTime() {
    return [] { return Clock::now(); };
}

/**
 * @brief Временная метка в формате ISO 8601 (UTC)
 */
class Timestamp {
public:
    TimePoint value;

    Timestamp() : value(Clock::now()) {}

    explicit Timestamp(TimePoint tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(Clock::now());
    }

    std::string toString() const {
        auto time_t_val = Clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /// Секунды с эпохи, удобно для JSON
    long long epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }
};

/**
 * @brief Округление оставшегося времени вверх до целых секунд
 *
 * Клиенту сообщается "подождите N секунд", и N не должно быть меньше
 * реально оставшегося времени.
 */
inline std::chrono::seconds ceilSeconds(Clock::duration remaining) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(remaining);
    if (secs < remaining) {
        ++secs;
    }
    return secs.count() < 0 ? std::chrono::seconds(0) : secs;
}

} // namespace walletgate::domain
