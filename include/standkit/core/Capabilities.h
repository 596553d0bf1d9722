#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <vector>
#include "Types.h"

namespace standkit {

// ==================== Capture ===========================

class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool open() = 0;                 // false: device/file unavailable
    virtual bool read(cv::Mat& bgr) = 0;     // false: capture failure
    virtual void release() = 0;
};

// ==================== Inference ===========================

// person box + distance + nose keypoint for one frame
class PoseEstimator {
public:
    virtual ~PoseEstimator() = default;
    virtual PoseObservation estimate(const cv::Mat& bgr) = 0;
};

class FaceDetector {
public:
    virtual ~FaceDetector() = default;
    virtual std::vector<FaceCandidate> detectFaces(const cv::Mat& bgr) = 0;
};

// age/gender of one cropped face; nullopt when the nets give nothing usable
class DemographicsEstimator {
public:
    virtual ~DemographicsEstimator() = default;
    virtual std::optional<DemographicsResult> estimate(const cv::Mat& face_bgr) = 0;
};

} // namespace standkit
