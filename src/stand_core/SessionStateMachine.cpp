#include "standkit/core/SessionStateMachine.h"
#include "standkit/core/TimeUtils.h"
#include <algorithm>
#include <utility>

namespace standkit {

SessionStateMachine::SessionStateMachine(std::string stand_name, float activation_distance_m)
    : stand_name_(std::move(stand_name)),
      activation_distance_(activation_distance_m)
{
}

SessionPhase SessionStateMachine::phase() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return phase_;
}

bool SessionStateMachine::wantsCandidate(const PresenceSample& sample) const {
    return phase() == SessionPhase::IDLE
        && sample.distance_m.has_value()
        && *sample.distance_m <= activation_distance_;
}

StepResult SessionStateMachine::step(const PresenceSample& sample,
                                     TimePoint now,
                                     const DemographicsResolver& resolve) {
    StepResult result;
    if (!sample.distance_m) return result;   // nobody measured: hold state

    const float distance = *sample.distance_m;
    const SessionPhase current = phase();

    // case1: idle visitor in range -> needs a matched face to activate
    if (current == SessionPhase::IDLE && distance <= activation_distance_) {
        std::optional<DemographicsResult> info = resolve ? resolve() : std::nullopt;
        if (!info) return result;            // no face match, stay idle

        std::lock_guard<std::mutex> lk(mtx_);
        phase_ = SessionPhase::ACTIVE;
        activated_at_ = now;
        demographics_ = std::move(info);
        result.transition = Transition::ACTIVATED;
        return result;
    }

    // case2: active visitor walked away
    if (current == SessionPhase::ACTIVE && distance > activation_distance_) {
        std::lock_guard<std::mutex> lk(mtx_);
        phase_ = SessionPhase::IDLE;
        deactivated_at_ = now;

        SessionRecord record;
        record.stand_name     = stand_name_;
        record.activated_at   = *activated_at_;
        record.deactivated_at = now;
        record.dwell_minutes  = std::max(0.0, TimeUtils::minutesBetween(*activated_at_, now));  // wall clock may step back
        record.demographics   = *demographics_;

        demographics_.reset();
        result.transition = Transition::DEACTIVATED;
        result.record = std::move(record);
        return result;
    }

    // case3: in range while active / out of range while idle
    return result;
}

PipelineState SessionStateMachine::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    PipelineState s;
    s.phase = phase_;
    s.last_activation = activated_at_;
    s.last_deactivation = deactivated_at_;
    s.demographics = demographics_;
    return s;
}

void SessionStateMachine::reset() {
    std::lock_guard<std::mutex> lk(mtx_);
    phase_ = SessionPhase::IDLE;
    activated_at_.reset();
    deactivated_at_.reset();
    demographics_.reset();
}

} // namespace standkit
