#include "standkit/core/OrtPose.h"
#include "standkit/core/PoseGeometry.h"
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace standkit {

static constexpr int kNumKeypoints = 17;

OrtPoseEstimator::OrtPoseEstimator(const SessionOptions& opt)
    : opt_(opt),
      env_(ORT_LOGGING_LEVEL_WARNING, "YOLOv8n-pose"),
      session_options_()
{
    session_options_.SetIntraOpNumThreads(opt_.intra_threads);   // 0 = auto

    try {
#ifdef _WIN32
        std::wstring model_path_w(opt_.model_path.begin(), opt_.model_path.end());
        session_ = std::make_unique<Ort::Session>(env_, model_path_w.c_str(), session_options_);
#else
        session_ = std::make_unique<Ort::Session>(env_, opt_.model_path.c_str(), session_options_);
#endif
        ready_ = true;
        std::cout << "[OrtPose] ONNX session created with model: " << opt_.model_path << "\n";
    } catch (const Ort::Exception& ex) {
        std::cerr << "[OrtPose] Failed to create ONNX session: " << ex.what() << "\n";
        ready_ = false;   // infer() returns nothing
    }
}

// 预处理：letterbox（保持比例，减少形变）
OrtPoseEstimator::Letterbox OrtPoseEstimator::letterbox(const cv::Mat& src, int target_size) {
    int w = src.cols, h = src.rows;
    float scaling_rate = std::min((float)target_size / w, (float)target_size / h);
    int new_w = int(std::round(w * scaling_rate));
    int new_h = int(std::round(h * scaling_rate));
    int dx = (target_size - new_w) / 2;
    int dy = (target_size - new_h) / 2;

    cv::Mat resized;
    cv::resize(src, resized, cv::Size(new_w, new_h));

    cv::Mat canvas(target_size, target_size, src.type(), cv::Scalar(114, 114, 114));
    resized.copyTo(canvas(cv::Rect(dx, dy, new_w, new_h)));
    return {canvas, scaling_rate, dx, dy};
}

std::vector<PersonPose> OrtPoseEstimator::infer(const cv::Mat& bgr) {
    if (!session_ || !ready_ || bgr.empty()) return {};

    const int size = opt_.input_size;

    // 1/ I/O node names ("images" -> "output0")
    Ort::AllocatorWithDefaultOptions allocator;
    Ort::AllocatedStringPtr input_name_ptr = session_->GetInputNameAllocated(0, allocator);
    Ort::AllocatedStringPtr output_name_ptr = session_->GetOutputNameAllocated(0, allocator);
    const char* input_name = input_name_ptr.get();
    const char* output_name = output_name_ptr.get();

    // 2/ Preprocess (letterbox, bgr->rgb, hwc->nchw, /255)
    Letterbox lb = letterbox(bgr, size);
    cv::Mat rgb;
    cv::cvtColor(lb.img, rgb, cv::COLOR_BGR2RGB);

    std::vector<float> input_tensor_val(3 * size * size);
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < size; ++y) {
            const cv::Vec3b* row = rgb.ptr<cv::Vec3b>(y);
            for (int x = 0; x < size; ++x) {
                input_tensor_val[c * size * size + y * size + x] = row[x][c] / 255.0f;
            }
        }
    }

    // 3/ input tensor
    std::vector<int64_t> input_shape = {1, 3, size, size};
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info,
        input_tensor_val.data(), input_tensor_val.size(),
        input_shape.data(), input_shape.size());

    // 4/ Inference run
    std::vector<const char*> input_names = {input_name};
    std::vector<const char*> output_names = {output_name};
    auto output_tensors = session_->Run(
        Ort::RunOptions{nullptr},
        input_names.data(), &input_tensor, 1,
        output_names.data(), 1);

    // 5/ Output [1, 56, N]: cx,cy,w,h,conf + 17 x (x,y,v), attrs-first
    const float* out = output_tensors[0].GetTensorData<float>();
    auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
    int num_attrs = static_cast<int>(shape.size() >= 2 ? shape[1] : 0);
    int num_boxes = static_cast<int>(shape.size() >= 3 ? shape[2] : 0);
    if (num_attrs < 5 + 3 * kNumKeypoints) {
        std::cerr << "[OrtPose] Unexpected attributes count: " << num_attrs << "\n";
        return {};
    }

    // letterbox space -> frame pixels
    auto unmapX = [&](float v) { return (v - lb.dx) / lb.scale; };
    auto unmapY = [&](float v) { return (v - lb.dy) / lb.scale; };

    std::vector<PersonPose> persons;
    for (int i = 0; i < num_boxes; ++i) {
        float conf = out[4 * num_boxes + i];
        if (conf < opt_.conf_thres) continue;

        float cx = out[i];
        float cy = out[num_boxes + i];
        float w  = out[2 * num_boxes + i];
        float h  = out[3 * num_boxes + i];

        float x1 = unmapX(cx - w * 0.5f), y1 = unmapY(cy - h * 0.5f);
        float x2 = unmapX(cx + w * 0.5f), y2 = unmapY(cy + h * 0.5f);

        PersonPose p;
        p.rect = cv::Rect(cv::Point(int(x1), int(y1)), cv::Point(int(x2), int(y2)));
        p.conf = conf;
        p.keypoints.resize(kNumKeypoints);
        for (int k = 0; k < kNumKeypoints; ++k) {
            int base = 5 + 3 * k;
            p.keypoints[k].x    = unmapX(out[base * num_boxes + i]);
            p.keypoints[k].y    = unmapY(out[(base + 1) * num_boxes + i]);
            p.keypoints[k].conf = out[(base + 2) * num_boxes + i];
        }
        persons.push_back(std::move(p));
    }

    return suppressOverlaps(persons, opt_.conf_thres, opt_.nms_iou);
}

std::vector<PersonPose> OrtPoseEstimator::suppressOverlaps(const std::vector<PersonPose>& persons,
                                                           float conf_thres, float iou_thres) {
    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    boxes.reserve(persons.size());
    scores.reserve(persons.size());
    for (const auto& p : persons) {
        boxes.push_back(p.rect);
        scores.push_back(p.conf);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, conf_thres, iou_thres, keep);

    std::vector<PersonPose> out;
    out.reserve(keep.size());
    for (int idx : keep) out.push_back(persons[idx]);
    std::stable_sort(out.begin(), out.end(),
                     [](const PersonPose& a, const PersonPose& b) { return a.conf > b.conf; });
    return out;
}

PoseObservation OrtPoseEstimator::estimate(const cv::Mat& bgr) {
    std::vector<PersonPose> persons;
    try {
        persons = infer(bgr);
    } catch (const Ort::Exception& ex) {
        // 捕获 ONNX 推理异常，打印一次并按“无人”继续
        static bool warned = false;
        if (!warned) {
            std::cerr << "[OrtPose] infer exception: " << ex.what() << "\n";
            warned = true;
        }
        persons.clear();
    }
    return toObservation(persons, opt_.keypoint_thres);
}

} // namespace standkit
