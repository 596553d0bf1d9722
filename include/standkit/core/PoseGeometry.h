#pragma once
#include <vector>
#include "Types.h"

namespace standkit {

// COCO-17 keypoint indices used by the stand
constexpr int kNose          = 0;
constexpr int kLeftShoulder  = 5;
constexpr int kRightShoulder = 6;

// Rough monocular distance from the person box height:
// distance = max(0.5, 300 / box_height_px)
float distanceFromBoxHeight(float box_height_px);

/* @brief toObservation 由检测结果生成单帧观测

@param persons:        pose detections after NMS, best first (only the first is used)
@param keypoint_thres: nose and at least one shoulder must be above it

@return person_detected = any person; body_center = box center (integer px);
        sample = {distance, nose} only for a confident pose
*/
PoseObservation toObservation(const std::vector<PersonPose>& persons, float keypoint_thres = 0.5f);

} // namespace standkit
