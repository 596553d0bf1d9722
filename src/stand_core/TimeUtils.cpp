#include "standkit/core/TimeUtils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace standkit {

std::string TimeUtils::toIso8601(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) secs -= std::chrono::seconds(1);   // floor for pre-epoch values
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();

    std::time_t t = Clock::to_time_t(secs);
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &t);
#else
    localtime_r(&t, &local_tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    if (micros != 0) {
        ss << '.' << std::setw(6) << std::setfill('0') << micros;
    }
    return ss.str();
}

double TimeUtils::minutesBetween(TimePoint start, TimePoint end) {
    std::chrono::duration<double> diff = end - start;
    return diff.count() / 60.0;
}

int64_t TimeUtils::toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint TimeUtils::fromEpochMs(int64_t ts_ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ts_ms)));
}

int64_t TimeUtils::nowMs() {
    return toEpochMs(Clock::now());
}

} // namespace standkit
