#pragma once

#include <chrono>
#include <ratio>

namespace HWENC {

using duration = std::chrono::nanoseconds;

/**
 * @brief Relative clock for all of hwenc
 *
 * Please use this instead of std::chrono clocks; this way, you can fake real time without changing your code.
 * Tests derive from it and override now() to step time by hand.
 *
 * It also eliminates the class of bugs relating to using absolute time instead of time-since-start.
 */
class relative_clock {
public:
    static_assert(std::chrono::steady_clock::is_steady);

    relative_clock()
        : start_{std::chrono::steady_clock::now()} { }

    virtual ~relative_clock() = default;

    [[nodiscard]] virtual duration now() const {
        return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

template<typename Unit = std::ratio<1>>
double duration_to_double(duration dur) {
    return std::chrono::duration<double, Unit>{dur}.count();
}

} // namespace HWENC
