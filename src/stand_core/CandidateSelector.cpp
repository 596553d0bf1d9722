#include "standkit/core/CandidateSelector.h"
#include <cmath>
#include <limits>

namespace standkit {

double CandidateSelector::centerDistance(const FaceCandidate& c, const cv::Point2f& reference_point) {
    double x0 = (c.rect.x + (c.rect.x + c.rect.width)) / 2.0;
    double y0 = (c.rect.y + (c.rect.y + c.rect.height)) / 2.0;
    return std::hypot(x0 - reference_point.x, y0 - reference_point.y);
}

std::optional<FaceCandidate> CandidateSelector::select(const std::vector<FaceCandidate>& candidates,
                                                       const cv::Point2f& reference_point) {
    std::optional<FaceCandidate> best;
    double min_dist = std::numeric_limits<double>::infinity();
    float max_conf = 0.f;

    for (const auto& face : candidates) {
        double dist = centerDistance(face, reference_point);
        if (!(dist < min_dist)) continue;

        if (face.conf > max_conf) {
            best = face;
            min_dist = dist;
            max_conf = face.conf;
        } else {
            best.reset();   // nearer but less confident: voids the pick, bounds stay
        }
    }
    return best;
}

} // namespace standkit
