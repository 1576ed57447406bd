#ifndef OPTVAL_DATE_TIME_H
#define OPTVAL_DATE_TIME_H

#include <chrono>
#include <cstddef>
#include <functional>

namespace std {
    // Specialization for std::chrono::time_point
    template<class Clock, class Duration>
    struct hash<std::chrono::time_point<Clock, Duration> > {
        size_t operator()(const std::chrono::time_point<Clock, Duration> &tp) const noexcept {
            return std::hash<typename Duration::rep>()(tp.time_since_epoch().count());
        }
    };

    // Specialization for std::chrono::duration
    template<class Rep, class Period>
    struct hash<std::chrono::duration<Rep, Period> > {
        size_t operator()(const std::chrono::duration<Rep, Period> &d) const noexcept {
            return std::hash<Rep>()(d.count());
        }
    };
} // namespace std

namespace optval {
    using ov_clock = std::chrono::system_clock;
    // Nanosecond precision, the same resolution as the wall clock on Linux.
    using ov_duration = std::chrono::nanoseconds;
    using ov_time = std::chrono::time_point<ov_clock, ov_duration>;

    // The zero instant is the value-initialized time point, it carries no
    // meaning beyond "not set".
    constexpr ov_time zero_time() noexcept { return ov_time{}; }
    constexpr ov_duration zero_duration() noexcept { return ov_duration::zero(); }

    constexpr bool is_zero_time(ov_time t) noexcept { return t == zero_time(); }
} // namespace optval

#endif  // OPTVAL_DATE_TIME_H
