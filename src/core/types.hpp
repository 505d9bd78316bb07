#pragma once

#include <chrono>
#include <cstdint>

namespace lanlink {

/**
 * Timestamp - milliseconds since the Unix epoch.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] constexpr Timestamp plus(Duration d) const noexcept {
        return Timestamp(millis_ + d.count());
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Duration operator-(const Timestamp& other) const noexcept {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * Random per-process identifier carried in every discovery datagram.
 */
using InstanceId = uint64_t;

} // namespace lanlink
