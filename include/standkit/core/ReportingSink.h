#pragma once
#include <string>
#include "Types.h"
#include "Config.h"

namespace standkit {

/*  ReportingSink 后端上报

    - reportStand:   POST {endpoint}/api/stands/push   once per pipeline
    - reportSession: POST {endpoint}/api/visits/push   once per completed session

    Best effort, at most once: any transport error, timeout or non-2xx answer is
    logged and the event dropped. Nothing is queued or retried.
    The return value only says whether the backend acknowledged the event.

    Uses Qt Network; a QCoreApplication must exist (any thread may call).
*/
class ReportingSink {
public:
    static constexpr int kDefaultTimeoutMs = 10000;
    static constexpr const char* kStandsPath = "/api/stands/push";
    static constexpr const char* kVisitsPath = "/api/visits/push";

    explicit ReportingSink(std::string endpoint, int timeout_ms = kDefaultTimeoutMs);
    virtual ~ReportingSink() = default;

    bool reportStand(const StandConfig& stand);
    bool reportSession(const SessionRecord& record);

    const std::string& endpoint() const { return endpoint_; }
    int timeoutMs() const { return timeout_ms_; }

protected:
    // one blocking POST of a json body; true on 2xx
    virtual bool post(const std::string& path, const std::string& body);

private:
    std::string endpoint_;
    int timeout_ms_;
};

} // namespace standkit
