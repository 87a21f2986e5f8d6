#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace Lexigraph {

/**
 * @brief High-resolution timer for stage timings.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Elapsed milliseconds since construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

/**
 * @brief Source of wall-clock milliseconds since the Unix epoch.
 *
 * Injected into the ID allocator so tests can freeze or step time.
 */
using MillisecondClock = std::function<uint64_t()>;

inline uint64_t system_now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

inline MillisecondClock system_clock_ms() {
    return &system_now_ms;
}

} // namespace Lexigraph
