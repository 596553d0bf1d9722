#pragma once
#include <string>

namespace standkit {

constexpr float kDefaultActivationDistance = 1.5f;   // meters
constexpr const char* kDefaultEndpoint = "http://localhost:8000";

// Stand identity (load from stand.json: { "config": { name, description, section } })
struct StandConfig {
    std::string name;
    std::string description;
    std::string section;

    float       activation_distance = kDefaultActivationDistance;
    std::string endpoint            = kDefaultEndpoint;   // backend base url, no trailing slash

    // throws std::runtime_error: file missing, not json, or no config.name
    static StandConfig fromJson(const std::string& json_path);

    // "/api/stands/push" body
    std::string registrationJson() const;
};

// Stand runtime settings (load from stand.yml)
struct RuntimeConfig {
    // ===================== 字段fields ===================== //

    std::string stand_config = "assets/config/stand.json";
    std::string endpoint     = kDefaultEndpoint;

    // capture: video_path wins over camera_index when set
    int         camera_index = 0;
    std::string video_path;

    // pose model (YOLOv8-pose onnx)
    std::string pose_model_path     = "assets/weights/yolov8n-pose.onnx";
    int         pose_input_size     = 640;
    float       pose_conf_thres     = 0.25f;   // person box conf
    float       keypoint_conf_thres = 0.5f;    // nose / shoulders
    float       nms_iou             = 0.45f;
    int         intra_threads       = 0;       // 0=auto

    // face + demographics models (OpenCV dnn)
    std::string face_proto   = "assets/demographics/opencv_face_detector.pbtxt";
    std::string face_model   = "assets/demographics/opencv_face_detector_uint8.pb";
    std::string age_proto    = "assets/demographics/age_deploy.prototxt";
    std::string age_model    = "assets/demographics/age_net.caffemodel";
    std::string gender_proto = "assets/demographics/gender_deploy.prototxt";
    std::string gender_model = "assets/demographics/gender_net.caffemodel";
    float face_conf_thres    = 0.7f;
    float gender_conf_thres  = 0.65f;
    int   face_padding_px    = 20;

    // session engine
    float activation_distance = kDefaultActivationDistance;
    int   report_timeout_ms   = 10000;
    int   stop_timeout_ms     = 2000;
    int   poll_interval_ms    = 10;

    // supervisor: restart after capture failure (0 = exit)
    int max_restarts       = 0;
    int restart_backoff_ms = 1000;   // doubled after every restart

    // ===================== 方法methods ===================== //

    static RuntimeConfig fromYaml(const std::string& yaml_path);
    static RuntimeConfig fromJson(const std::string& json_path);

    // copy endpoint / threshold onto the stand identity
    void applyTo(StandConfig& stand) const;
};

} // namespace standkit
