#include "standkit/core/PresenceTracker.h"
#include <cmath>
#include <numeric>

namespace standkit {

bool PresenceTracker::update(const cv::Point2f& center) {
    if (last_center_) {
        speed_history_.push_back(std::abs(center.x - last_center_->x));
    } else if (speed_history_.empty()) {
        speed_history_.push_back(0.f);   // first sighting of a fresh tracker: no motion yet
    }
    // re-entry after lostPerson(): only the reference is taken, the window is left as is
    last_center_ = center;

    if (speed_history_.size() > kWindowSize) speed_history_.pop_front();

    if (speed_history_.size() < kWindowSize) {
        slowing_down_ = false;
        return false;
    }

    float sum = std::accumulate(speed_history_.end() - kMeanSpan, speed_history_.end(), 0.f);
    float avg_speed = sum / static_cast<float>(kMeanSpan);
    slowing_down_ = avg_speed < kSlowSpeedPx;
    return slowing_down_;
}

void PresenceTracker::lostPerson() {
    last_center_.reset();
}

void PresenceTracker::reset() {
    speed_history_.clear();
    last_center_.reset();
    slowing_down_ = false;
}

} // namespace standkit
