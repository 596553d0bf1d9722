#include "standkit/core/PoseGeometry.h"
#include <algorithm>
#include <cmath>

namespace standkit {

float distanceFromBoxHeight(float box_height_px) {
    if (box_height_px <= 0.f) return 0.5f;
    return std::max(0.5f, 300.f / box_height_px);
}

PoseObservation toObservation(const std::vector<PersonPose>& persons, float keypoint_thres) {
    PoseObservation obs;
    if (persons.empty()) return obs;

    const PersonPose& p = persons.front();
    obs.person_detected = true;

    const int x1 = p.rect.x, x2 = p.rect.x + p.rect.width;
    const int y1 = p.rect.y, y2 = p.rect.y + p.rect.height;
    obs.body_center = cv::Point2f(std::floor((x1 + x2) / 2.f), std::floor((y1 + y2) / 2.f));

    if (static_cast<int>(p.keypoints.size()) <= kRightShoulder) return obs;

    const bool head     = p.keypoints[kNose].conf > keypoint_thres;
    const bool shoulder = p.keypoints[kLeftShoulder].conf > keypoint_thres
                       || p.keypoints[kRightShoulder].conf > keypoint_thres;
    if (!head || !shoulder) return obs;   // tracked, but no reliable reading

    obs.sample.distance_m = distanceFromBoxHeight(static_cast<float>(p.rect.height));
    obs.sample.reference_point = cv::Point2f(p.keypoints[kNose].x, p.keypoints[kNose].y);
    return obs;
}

} // namespace standkit
