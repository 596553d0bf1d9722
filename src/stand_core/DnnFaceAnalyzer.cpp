#include "standkit/core/DnnFaceAnalyzer.h"
#include "standkit/core/Demographics.h"
#include <algorithm>
#include <iostream>

namespace standkit {

static const cv::Scalar kFaceMean(104, 117, 123);
static const cv::Scalar kAgeGenderMean(78.4263377603, 87.7689143744, 114.895847746);
static const cv::Size   kFaceInput(300, 300);
static const cv::Size   kAgeGenderInput(227, 227);

DnnFaceAnalyzer::DnnFaceAnalyzer(const Models& models) : models_(models) {
    try {
        face_net_   = cv::dnn::readNet(models_.face_model, models_.face_proto);
        age_net_    = cv::dnn::readNet(models_.age_model, models_.age_proto);
        gender_net_ = cv::dnn::readNet(models_.gender_model, models_.gender_proto);
        ready_ = !face_net_.empty() && !age_net_.empty() && !gender_net_.empty();
    } catch (const cv::Exception& ex) {
        std::cerr << "[DnnFace] Failed to load nets: " << ex.what() << "\n";
        ready_ = false;
    }
    if (ready_) std::cout << "[DnnFace] face/age/gender nets loaded\n";
}

std::vector<FaceCandidate> DnnFaceAnalyzer::detectFaces(const cv::Mat& bgr) {
    std::vector<FaceCandidate> faces;
    if (!ready_ || bgr.empty()) return faces;

    const int w = bgr.cols, h = bgr.rows;
    try {
        cv::Mat blob = cv::dnn::blobFromImage(bgr, 1.0, kFaceInput, kFaceMean, false, false);
        face_net_.setInput(blob);
        cv::Mat det = face_net_.forward();   // [1,1,N,7]: _, _, conf, x1, y1, x2, y2 (normalized)

        cv::Mat rows(det.size[2], det.size[3], CV_32F, det.ptr<float>());
        for (int i = 0; i < rows.rows; ++i) {
            float conf = rows.at<float>(i, 2);
            if (conf <= models_.face_conf_thres) continue;

            int x1 = std::max(0, static_cast<int>(rows.at<float>(i, 3) * w));
            int y1 = std::max(0, static_cast<int>(rows.at<float>(i, 4) * h));
            int x2 = std::min(w - 1, static_cast<int>(rows.at<float>(i, 5) * w));
            int y2 = std::min(h - 1, static_cast<int>(rows.at<float>(i, 6) * h));
            if (x2 <= x1 || y2 <= y1) continue;

            faces.push_back({cv::Rect(cv::Point(x1, y1), cv::Point(x2, y2)), conf});
        }
    } catch (const cv::Exception& ex) {
        std::cerr << "[DnnFace] detect exception: " << ex.what() << "\n";
        faces.clear();
    }
    return faces;
}

std::optional<DemographicsResult> DnnFaceAnalyzer::estimate(const cv::Mat& face_bgr) {
    if (!ready_ || face_bgr.empty()) return std::nullopt;

    try {
        cv::Mat blob = cv::dnn::blobFromImage(face_bgr, 1.0, kAgeGenderInput, kAgeGenderMean, false);

        // gender: argmax, "Unknown" if not sure enough
        gender_net_.setInput(blob);
        cv::Mat g = gender_net_.forward();
        cv::Point g_id;
        double g_prob = 0.0;
        cv::minMaxLoc(g.reshape(1, 1), nullptr, &g_prob, nullptr, &g_id);
        std::string gender = (g_prob < models_.gender_conf_thres || g_id.x > 1) ? kGenders[2] : kGenders[g_id.x];

        // age: argmax over 9 ranges
        age_net_.setInput(blob);
        cv::Mat a = age_net_.forward();
        cv::Point a_id;
        cv::minMaxLoc(a.reshape(1, 1), nullptr, nullptr, nullptr, &a_id);
        if (a_id.x < 0 || a_id.x >= 9) {
            std::cerr << "[DnnFace] age class out of range: " << a_id.x << "\n";
            return std::nullopt;
        }

        return makeDemographics(kAgeRanges[a_id.x], gender);
    } catch (const cv::Exception& ex) {
        std::cerr << "[DnnFace] age/gender exception: " << ex.what() << "\n";
        return std::nullopt;
    }
}

} // namespace standkit
