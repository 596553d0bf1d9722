#pragma once
#include <string>
#include <cstdint>
#include "Types.h"

namespace standkit {

class TimeUtils {
public:
    // local time, "YYYY-MM-DDTHH:MM:SS[.ffffff]" (fraction omitted when zero)
    static std::string toIso8601(TimePoint tp);
    static double minutesBetween(TimePoint start, TimePoint end);
    static int64_t toEpochMs(TimePoint tp);
    static TimePoint fromEpochMs(int64_t ts_ms);
    static int64_t nowMs();
};

} // namespace standkit
