#include "standkit/core/Config.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using nlohmann::json;

namespace standkit {

// ==================== StandConfig ===========================

StandConfig StandConfig::fromJson(const std::string& json_path) {
    if (!std::filesystem::exists(json_path)) {
        throw std::runtime_error("Stand config not found: " + json_path);
    }

    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open stand config: " + json_path);
    }

    json r;
    try {
        ifs >> r;
    } catch (const json::exception& e) {
        throw std::runtime_error("Stand config is not valid json (" + json_path + "): " + e.what());
    }

    if (!r.contains("config") || !r["config"].is_object()) {
        throw std::runtime_error("Stand config has no \"config\" object: " + json_path);
    }
    const json& c = r["config"];
    if (!c.contains("name") || !c["name"].is_string()) {
        throw std::runtime_error("Stand config has no config.name: " + json_path);
    }

    StandConfig s;
    s.name        = c["name"].get<std::string>();
    s.description = c.value("description", std::string());
    s.section     = c.value("section", std::string());
    return s;
}

std::string StandConfig::registrationJson() const {
    json o;
    o["name"]        = name;
    o["description"] = description;
    o["section"]     = section;
    return o.dump();
}

// ==================== RuntimeConfig ===========================

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }

RuntimeConfig RuntimeConfig::fromYaml(const std::string& yaml_path) {
    RuntimeConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "stand_config", c.stand_config);
        try_get(r, "endpoint",     c.endpoint);

        try_get(r, "camera_index", c.camera_index);
        try_get(r, "video_path",   c.video_path);

        try_get(r, "pose_model_path",     c.pose_model_path);
        try_get(r, "pose_input_size",     c.pose_input_size);
        try_get(r, "pose_conf_thres",     c.pose_conf_thres);
        try_get(r, "keypoint_conf_thres", c.keypoint_conf_thres);
        try_get(r, "nms_iou",             c.nms_iou);
        try_get(r, "intra_threads",       c.intra_threads);

        try_get(r, "face_proto",        c.face_proto);
        try_get(r, "face_model",        c.face_model);
        try_get(r, "age_proto",         c.age_proto);
        try_get(r, "age_model",         c.age_model);
        try_get(r, "gender_proto",      c.gender_proto);
        try_get(r, "gender_model",      c.gender_model);
        try_get(r, "face_conf_thres",   c.face_conf_thres);
        try_get(r, "gender_conf_thres", c.gender_conf_thres);
        try_get(r, "face_padding_px",   c.face_padding_px);

        try_get(r, "activation_distance", c.activation_distance);
        try_get(r, "report_timeout_ms",   c.report_timeout_ms);
        try_get(r, "stop_timeout_ms",     c.stop_timeout_ms);
        try_get(r, "poll_interval_ms",    c.poll_interval_ms);

        try_get(r, "max_restarts",       c.max_restarts);
        try_get(r, "restart_backoff_ms", c.restart_backoff_ms);
    } catch (const YAML::Exception& e) {
        // keep defaults
        std::cerr << "[Config] Failed to load " << yaml_path << ": " << e.what() << ", using defaults\n";
    }
    return c;
}

RuntimeConfig RuntimeConfig::fromJson(const std::string& json_path) {
    RuntimeConfig c;
    try {
        std::ifstream ifs(json_path);
        if (!ifs.is_open()) {
            std::cerr << "[Config] Cannot open " << json_path << ", using defaults\n";
            return c;
        }
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if(r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_f = [&](const char* k, float& v){ if(r.contains(k)) v = r[k].get<float>(); };

        get_s("stand_config", c.stand_config);
        get_s("endpoint", c.endpoint);

        get_i("camera_index", c.camera_index);
        get_s("video_path", c.video_path);

        get_s("pose_model_path", c.pose_model_path);
        get_i("pose_input_size", c.pose_input_size);
        get_f("pose_conf_thres", c.pose_conf_thres);
        get_f("keypoint_conf_thres", c.keypoint_conf_thres);
        get_f("nms_iou", c.nms_iou);
        get_i("intra_threads", c.intra_threads);

        get_s("face_proto", c.face_proto);
        get_s("face_model", c.face_model);
        get_s("age_proto", c.age_proto);
        get_s("age_model", c.age_model);
        get_s("gender_proto", c.gender_proto);
        get_s("gender_model", c.gender_model);
        get_f("face_conf_thres", c.face_conf_thres);
        get_f("gender_conf_thres", c.gender_conf_thres);
        get_i("face_padding_px", c.face_padding_px);

        get_f("activation_distance", c.activation_distance);
        get_i("report_timeout_ms", c.report_timeout_ms);
        get_i("stop_timeout_ms", c.stop_timeout_ms);
        get_i("poll_interval_ms", c.poll_interval_ms);

        get_i("max_restarts", c.max_restarts);
        get_i("restart_backoff_ms", c.restart_backoff_ms);
    } catch (const json::exception& e) {
        // keep defaults
        std::cerr << "[Config] Failed to parse " << json_path << ": " << e.what() << ", using defaults\n";
    }
    return c;
}

void RuntimeConfig::applyTo(StandConfig& stand) const {
    stand.endpoint = endpoint;
    while (!stand.endpoint.empty() && stand.endpoint.back() == '/') stand.endpoint.pop_back();
    stand.activation_distance = activation_distance;
}

} // namespace standkit
