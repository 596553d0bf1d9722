#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "Types.h"
#include "Config.h"

namespace standkit {

// Face matching + demographics for the current frame, called only on the activation path
using DemographicsResolver = std::function<std::optional<DemographicsResult>()>;

struct StepResult {
    Transition                   transition = Transition::NONE;
    std::optional<SessionRecord> record;       // set on DEACTIVATED only
};

/*  SessionStateMachine 访客会话状态机

    IDLE   -> ACTIVE : distance <= activation distance AND a face was matched
    ACTIVE -> IDLE   : distance >  activation distance
    no distance in the sample : no transition, state held

    Written by the worker thread only; snapshot() may be called from any thread.
*/
class SessionStateMachine {
public:
    explicit SessionStateMachine(std::string stand_name,
                                 float activation_distance_m = kDefaultActivationDistance);
    ~SessionStateMachine() = default;

    /* @brief step 处理一帧的 presence 读数

    @param sample:  presence reading of the current frame
    @param now:     frame timestamp
    @param resolve: face match + demographics, invoked lazily when activation is possible

    @return the transition taken; a SessionRecord on deactivation
    */
    StepResult step(const PresenceSample& sample, TimePoint now, const DemographicsResolver& resolve);

    // IDLE and in range: the caller is about to need a face match
    bool wantsCandidate(const PresenceSample& sample) const;

    SessionPhase phase() const;
    float activationDistance() const { return activation_distance_; }

    // session part of PipelineState (phase, timestamps, frozen demographics)
    PipelineState snapshot() const;

    void reset();

private:
    const std::string stand_name_;
    const float activation_distance_;

    mutable std::mutex mtx_;
    SessionPhase phase_ = SessionPhase::IDLE;
    std::optional<TimePoint> activated_at_;
    std::optional<TimePoint> deactivated_at_;
    std::optional<DemographicsResult> demographics_;
};

} // namespace standkit
