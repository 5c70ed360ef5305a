#pragma once
// Monotonic timers for run and round-trip durations
#include <chrono>
#include <cstdint>

namespace harvest {

class Timer {
public:
    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    void stop() noexcept { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_us() const noexcept {
        return std::chrono::duration_cast<std::chrono::microseconds>(end_ - start_).count();
    }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
};

// Current wall-clock time in milliseconds since epoch (event timestamps)
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace harvest
