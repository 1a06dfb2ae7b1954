#include "pinned_cache.hpp"
#include <algorithm>
#include <utility>

namespace lunacore {

PinnedCache::PinnedCache(std::chrono::seconds ttl, ClockFn clock)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return Clock::now(); };
}

bool PinnedCache::valid() const {
    if (!refreshed_at_ || ttl_.count() <= 0) return false;
    return (clock_() - *refreshed_at_) <= ttl_;
}

std::optional<std::vector<Memory>> PinnedCache::get(uint32_t limit) const {
    if (!valid()) return std::nullopt;
    size_t n = std::min(static_cast<size_t>(limit), rows_.size());
    return std::vector<Memory>(rows_.begin(), rows_.begin() + static_cast<std::ptrdiff_t>(n));
}

void PinnedCache::put(std::vector<Memory> rows) {
    rows_ = std::move(rows);
    refreshed_at_ = clock_();
}

void PinnedCache::invalidate() {
    rows_.clear();
    refreshed_at_.reset();
}

} // namespace lunacore
