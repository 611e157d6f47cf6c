#pragma once

#include "domain/Timestamp.hpp"

namespace walletgate::tests {

/**
 * @brief Управляемые часы для логики со временем
 */
struct ManualClock {
    domain::TimePoint now = domain::TimePoint(std::chrono::seconds(1700000000));

    domain::TimeSource source() {
        return [this] { return now; };
    }

    template <typename Duration>
    void advance(Duration d) {
        now += std::chrono::duration_cast<domain::Clock::duration>(d);
    }
};

} // namespace walletgate::tests
