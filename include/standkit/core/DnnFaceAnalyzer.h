#pragma once
#include <opencv2/dnn.hpp>
#include <optional>
#include <string>
#include <vector>
#include "Capabilities.h"

namespace standkit {

/*  DnnFaceAnalyzer 人脸 + 年龄/性别

    - detectFaces: SSD face net (300x300, mean 104/117/123), boxes clipped to the frame
    - estimate:    Caffe age + gender nets (227x227) on one face crop
*/
class DnnFaceAnalyzer : public FaceDetector, public DemographicsEstimator {
public:
    struct Models {
        std::string face_proto, face_model;
        std::string age_proto, age_model;
        std::string gender_proto, gender_model;
        float face_conf_thres   = 0.7f;
        float gender_conf_thres = 0.65f;   // below: "Unknown"
    };

    explicit DnnFaceAnalyzer(const Models& models);

    bool isReady() const { return ready_; }

    std::vector<FaceCandidate> detectFaces(const cv::Mat& bgr) override;
    std::optional<DemographicsResult> estimate(const cv::Mat& face_bgr) override;

private:
    Models models_;
    bool ready_ = false;
    cv::dnn::Net face_net_;
    cv::dnn::Net age_net_;
    cv::dnn::Net gender_net_;
};

} // namespace standkit
