#pragma once
#include "Types.h"
#include <functional>
#include <mutex>

namespace standkit {

struct SessionEvent {
    Transition                   transition = Transition::NONE;
    PipelineState                state;     // snapshot right after the transition
    std::optional<SessionRecord> record;    // DEACTIVATED only
};

using SessionCallback = std::function<void(const SessionEvent&)>;

/*
 * @brief Local observers of activation / deactivation (called on the worker thread)
 * @note The callback runs under the publisher lock: once setCallback() returns,
 *       the previous callback is neither running nor will run again.
 *       A callback must not call setCallback() itself.
 */
class SessionPublisher {
public:
    void setCallback(SessionCallback cb) {
        std::lock_guard<std::mutex> lk(mtx_);
        cb_ = std::move(cb);
    }
    void publish(const SessionEvent& ev) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (cb_) cb_(ev);
    }
private:
    std::mutex mtx_;
    SessionCallback cb_;
};

} // namespace standkit
