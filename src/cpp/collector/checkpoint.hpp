#pragma once
// =============================================================================
// Statement history checkpoint
//
// Tracks the highest timer_start seen in events_statements_history_long so a
// statement is never scanned twice. Unset until the first successful read of
// the table's high-water mark; lives only as long as the collector instance.
// The value never decreases.
// =============================================================================

#include <cstdint>
#include <optional>
#include "../utils/logger.hpp"

namespace harvest {

class Checkpoint {
public:
    [[nodiscard]] bool is_established() const { return value_.has_value(); }

    [[nodiscard]] std::optional<uint64_t> value() const { return value_; }

    // First high-water mark read from the source
    void establish(uint64_t high_water_mark) {
        if (value_ && *value_ >= high_water_mark) return;
        value_ = high_water_mark;
        LOG_INF("[checkpoint] Established at timer_start=%llu",
            static_cast<unsigned long long>(high_water_mark));
    }

    // Moves forward to timestamp if it is newer; returns true if it moved
    bool advance(uint64_t timestamp) {
        if (value_ && timestamp <= *value_) return false;
        value_ = timestamp;
        return true;
    }

    // True if a row at this timestamp has not been scanned yet
    [[nodiscard]] bool is_newer(uint64_t timestamp) const {
        return !value_ || timestamp > *value_;
    }

private:
    std::optional<uint64_t> value_;
};

} // namespace harvest
