#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <vector>
#include "Types.h"

namespace standkit {

// Picks the face that belongs to the tracked visitor (nose keypoint as reference).
//
// Single pass with a running best distance (+inf) and a running best confidence (0).
// A face becomes the pick only when it is BOTH strictly closer than the running best
// distance AND strictly more confident than the running best confidence; both bounds
// move only on a pick. A strictly closer face that fails the confidence test voids the
// current pick without moving either bound, so a later face that beats the last pick
// on both counts can still win; otherwise nothing is returned.
class CandidateSelector {
public:
    static std::optional<FaceCandidate> select(const std::vector<FaceCandidate>& candidates,
                                               const cv::Point2f& reference_point);

    // Euclidean distance between the box center and the reference point
    static double centerDistance(const FaceCandidate& c, const cv::Point2f& reference_point);
};

} // namespace standkit
