#include "standkit/core/Types.h"
#include "standkit/core/TimeUtils.h"
#include <nlohmann/json.hpp>
#include <iostream>

namespace standkit {

// field names are fixed by the backend's VisitData model
std::string sessionRecordToJson(const SessionRecord& record) {
    nlohmann::json o;
    o["gender"]       = record.demographics.gender;
    o["group"]        = toString(record.demographics.age_bucket);
    o["age_group"]    = record.demographics.age_range;
    o["age"]          = record.demographics.age;
    o["name"]         = record.stand_name;
    o["datetime"]     = TimeUtils::toIso8601(record.activated_at);
    o["time_elapsed"] = record.dwell_minutes;
    return o.dump();
}

std::string pipelineStateToJson(const PipelineState& state) {
    nlohmann::json o;
    o["phase"] = toString(state.phase);
    o["last_activation"]   = state.last_activation   ? TimeUtils::toIso8601(*state.last_activation)   : "";
    o["last_deactivation"] = state.last_deactivation ? TimeUtils::toIso8601(*state.last_deactivation) : "";
    if (state.demographics) {
        o["demographics"] = {
            {"gender", state.demographics->gender},
            {"group", toString(state.demographics->age_bucket)},
            {"age_group", state.demographics->age_range},
            {"age", state.demographics->age}
        };
    } else {
        o["demographics"] = nullptr;
    }
    o["slowing_down"]       = state.slowing_down;
    o["frames_processed"]   = state.frames_processed;
    o["sessions_completed"] = state.sessions_completed;
    o["reports_sent"]       = state.reports_sent;
    o["reports_dropped"]    = state.reports_dropped;
    return o.dump();
}

static std::optional<cv::Point2f> readPoint(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array() || j[key].size() != 2) return std::nullopt;
    return cv::Point2f(j[key][0].get<float>(), j[key][1].get<float>());
}

bool parseReplayFrameFromJson(const std::string& json, ReplayFrame& out) {
    out = ReplayFrame{};
    try {
        nlohmann::json j = nlohmann::json::parse(json);
        if (!j.is_object()) return false;

        out.ts_ms = j.value("ts_ms", int64_t(0));
        out.frame_index = j.value("frame_index", int64_t(-1));

        // person
        if (j.contains("person") && j["person"].is_object()) {
            const auto& p = j["person"];
            out.pose.person_detected = true;
            if (auto c = readPoint(p, "center")) out.pose.body_center = *c;
            if (p.contains("distance") && p["distance"].is_number()) {
                out.pose.sample.distance_m = p["distance"].get<float>();
            }
            out.pose.sample.reference_point = readPoint(p, "nose");
        }

        // faces
        if (j.contains("faces") && j["faces"].is_array()) {
            for (const auto& f : j["faces"]) {
                int x1 = f.value("x1", 0), y1 = f.value("y1", 0);
                int x2 = f.value("x2", 0), y2 = f.value("y2", 0);
                FaceCandidate fc;
                fc.rect = cv::Rect(cv::Point(x1, y1), cv::Point(x2, y2));
                fc.conf = f.value("conf", 0.f);
                out.faces.push_back(fc);
            }
        }

        // demographics answer
        if (j.contains("demographics") && j["demographics"].is_object()) {
            const auto& d = j["demographics"];
            if (d.contains("age_range")) out.age_range = d["age_range"].get<std::string>();
            if (d.contains("gender"))    out.gender    = d["gender"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Types] Failed to parse replay frame: " << e.what() << "\n";
        return false;
    }
    return true;
}

} // namespace standkit
