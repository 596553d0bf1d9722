#pragma once
#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Enums.h"

namespace standkit {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Per-frame presence reading. Neither value set means "no person detected".
struct PresenceSample {
    std::optional<float>       distance_m;       // rough distance estimate (meters)
    std::optional<cv::Point2f> reference_point;  // nose keypoint (px)

    bool empty() const { return !distance_m && !reference_point; }
};

// What the pose capability saw on one frame
struct PoseObservation {
    bool           person_detected = false;  // any person box at all
    cv::Point2f    body_center;              // person box center, valid if person_detected
    PresenceSample sample;                   // filled only for a confident pose
};

// One person from the pose model, in frame pixels
struct Keypoint {
    float x = 0.f, y = 0.f;
    float conf = 0.f;
};

struct PersonPose {
    cv::Rect              rect;
    float                 conf = 0.f;
    int                   cls_id = 0;     // single class: person
    std::vector<Keypoint> keypoints;      // COCO-17 order: 0 nose, 5/6 shoulders
};

// Detected face box
struct FaceCandidate {
    cv::Rect rect;          // x1,y1 = top-left; x2,y2 = rect.br()
    float    conf = 0.f;    // detection confidence (0~1)
};

struct DemographicsResult {
    std::string gender;                       // "Male" / "Female" / "Unknown"
    std::string age_range;                    // raw label, e.g. "25-32"
    AgeBucket   age_bucket = AgeBucket::SENIOR;
    double      age = 0.0;                    // midpoint of age_range
};

// One completed visit. Built at deactivation only, never modified afterwards.
struct SessionRecord {
    std::string        stand_name;
    TimePoint          activated_at;
    TimePoint          deactivated_at;
    double             dwell_minutes = 0.0;   // (deactivated_at - activated_at) / 60s
    DemographicsResult demographics;
};

// Snapshot of the engine, copied out to the control thread
struct PipelineState {
    SessionPhase                      phase = SessionPhase::IDLE;
    std::optional<TimePoint>          last_activation;
    std::optional<TimePoint>          last_deactivation;
    std::optional<DemographicsResult> demographics;   // frozen for the running session

    bool    slowing_down       = false;
    int64_t frames_processed   = 0;
    int     sessions_completed = 0;
    int     reports_sent       = 0;
    int     reports_dropped    = 0;
};

// Result of one worker loop run
struct LoopResult {
    LoopExit    exit = LoopExit::CANCELLED;
    std::string message;
    int64_t     frames_processed = 0;
};

// One recorded frame for offline replay (see tools/session_replay.cpp)
struct ReplayFrame {
    int64_t                    ts_ms = 0;
    int64_t                    frame_index = -1;
    PoseObservation            pose;
    std::vector<FaceCandidate> faces;
    std::optional<std::string> age_range;   // what the demographics net would answer
    std::optional<std::string> gender;
};

// Backend "/api/visits/push" body for a completed session
std::string sessionRecordToJson(const SessionRecord& record);

// Diagnostics dump of a state snapshot
std::string pipelineStateToJson(const PipelineState& state);

/* 解析 replay .jsonl 的一行
{
   ts_ms, frame_index,
   person: { center:[x,y], distance, nose:[x,y] }   (absent / null = nobody)
   faces:  [ {x1,y1,x2,y2,conf}, ... ],
   demographics: { age_range, gender }
}
*/
bool parseReplayFrameFromJson(const std::string& json, ReplayFrame& out);

} // namespace standkit
