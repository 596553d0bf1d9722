#pragma once
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>
#include "Capabilities.h"

namespace standkit {

// YOLOv8-pose via ONNX Runtime: person boxes + 17 keypoints
class OrtPoseEstimator : public PoseEstimator {
public:
    struct SessionOptions {
        std::string model_path = "assets/weights/yolov8n-pose.onnx";
        int   input_size = 640;                // square letterbox
        float conf_thres = 0.25f;              // person box conf
        float nms_iou = 0.45f;
        float keypoint_thres = 0.5f;
        int   intra_threads = 0;               // 0 = auto
    };

    explicit OrtPoseEstimator(const SessionOptions& opt);
    ~OrtPoseEstimator() override = default;

    bool isReady() const { return ready_; }

    // raw detections in frame pixels, after NMS, best first
    std::vector<PersonPose> infer(const cv::Mat& bgr);

    // cv::dnn::NMSBoxes over the person boxes; survivors ordered by confidence, best first
    static std::vector<PersonPose> suppressOverlaps(const std::vector<PersonPose>& persons,
                                                    float conf_thres, float iou_thres);

    PoseObservation estimate(const cv::Mat& bgr) override;

private:
    struct Letterbox {
        cv::Mat img;
        float scale = 1.f;
        int dx = 0, dy = 0;
    };
    static Letterbox letterbox(const cv::Mat& src, int target_size);

    SessionOptions opt_;
    bool ready_ = false;

    // onnx runtime session
    Ort::Env env_;
    Ort::SessionOptions session_options_;
    std::unique_ptr<Ort::Session> session_;
};

} // namespace standkit
