#pragma once
#include <opencv2/core.hpp>
#include <deque>
#include <optional>

namespace standkit {

// 步速分析: horizontal displacement of the body center over the last frames.
// The visitor is "slowing down" once the mean of the last kMeanSpan displacements
// drops below kSlowSpeedPx (px/frame).
class PresenceTracker {
public:
    static constexpr size_t kWindowSize  = 10;
    static constexpr size_t kMeanSpan    = 5;
    static constexpr float  kSlowSpeedPx = 0.8f;

    PresenceTracker() = default;

    /* @brief update 以新的人框中心更新步速窗口
    *
    *  @param center: person box center of the current frame (px)
    *  @return slowing_down (always false until the window is full)
    *
    *  @note dx is measured against the previous center. The first sighting of a fresh
    *        tracker records 0; the first sighting after lostPerson() records nothing.
    */
    bool update(const cv::Point2f& center);

    // Person left the frame: forget the reference center.
    // The displacement window is kept on purpose.
    void lostPerson();

    // Back to a freshly constructed tracker
    void reset();

    bool slowingDown() const { return slowing_down_; }
    size_t windowSize() const { return speed_history_.size(); }
    bool hasReference() const { return last_center_.has_value(); }

private:
    std::deque<float> speed_history_;          // |dx| per frame, at most kWindowSize
    std::optional<cv::Point2f> last_center_;
    bool slowing_down_ = false;
};

} // namespace standkit
