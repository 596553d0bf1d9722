#include "standkit/core/CameraSource.h"
#include <iostream>
#include <utility>

namespace standkit {

CameraSource::CameraSource(int camera_index, std::string video_path)
    : camera_index_(camera_index), video_path_(std::move(video_path)) {}

CameraSource::~CameraSource() { release(); }

std::string CameraSource::describe() const {
    return video_path_.empty() ? "camera #" + std::to_string(camera_index_) : video_path_;
}

bool CameraSource::open() {
    if (cap_.isOpened()) return true;
    bool ok = video_path_.empty() ? cap_.open(camera_index_) : cap_.open(video_path_);
    if (!ok || !cap_.isOpened()) {  // open capture failed
        std::cerr << "[CameraSource] Failed to open: " << describe() << "\n";
        return false;
    }
    std::cout << "[CameraSource] Opened " << describe()
              << " (" << cap_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << cap_.get(cv::CAP_PROP_FRAME_HEIGHT) << ")\n";
    return true;
}

bool CameraSource::read(cv::Mat& bgr) {
    if (!cap_.isOpened()) return false;
    if (!cap_.read(bgr) || bgr.empty()) return false;   // device lost / end of file
    return true;
}

void CameraSource::release() {
    if (cap_.isOpened()) cap_.release();
}

} // namespace standkit
