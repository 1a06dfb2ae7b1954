#pragma once
#include "fact_types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace lunacore {

// Time-bounded copy of the full pinned set. Not internally synchronized:
// the owning FactStore guards it with the same mutex as its writes, so an
// invalidation is atomic with the write that triggers it.
class PinnedCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    // ttl of zero disables caching. A null clock uses Clock::now.
    explicit PinnedCache(std::chrono::seconds ttl, ClockFn clock = nullptr);

    // Up to `limit` cached rows, or nullopt when empty or expired.
    std::optional<std::vector<Memory>> get(uint32_t limit) const;

    // Replace the cached set and stamp the refresh time.
    void put(std::vector<Memory> rows);

    void invalidate();

    bool valid() const;
    std::optional<Clock::time_point> last_refresh() const { return refreshed_at_; }
    std::chrono::seconds ttl() const { return ttl_; }

private:
    std::chrono::seconds ttl_;
    ClockFn clock_;
    std::vector<Memory> rows_;
    std::optional<Clock::time_point> refreshed_at_;
};

} // namespace lunacore
