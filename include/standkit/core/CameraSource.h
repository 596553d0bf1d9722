#pragma once
#include <opencv2/videoio.hpp>
#include <string>
#include "Capabilities.h"

namespace standkit {

// cv::VideoCapture on a device index, or on a file when video_path is set
class CameraSource : public FrameSource {
public:
    explicit CameraSource(int camera_index, std::string video_path = "");
    ~CameraSource() override;

    bool open() override;
    bool read(cv::Mat& bgr) override;
    void release() override;

    std::string describe() const;

private:
    int camera_index_;
    std::string video_path_;
    cv::VideoCapture cap_;
};

} // namespace standkit
