#include <QCoreApplication>

#include "standkit/core/CandidateSelector.h"
#include "standkit/core/Config.h"
#include "standkit/core/Demographics.h"
#include "standkit/core/PresenceTracker.h"
#include "standkit/core/ReportingSink.h"
#include "standkit/core/SessionStateMachine.h"
#include "standkit/core/TimeUtils.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace standkit;

static void usage() {
    std::cerr << "Usage: session_replay <frames.jsonl> [--stand stand.json] [--distance meters] [--post endpoint]\n";
}

// 离线回放：recorded per-frame observations -> tracker / selector / state machine -> payloads
int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);   // Qt Network for --post

    if (argc < 2) { usage(); return 1; }

    std::string frames_path = argv[1];
    std::string stand_path;
    std::string post_endpoint;
    float activation_distance = kDefaultActivationDistance;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--stand" && i + 1 < argc)         stand_path = argv[++i];
        else if (a == "--post" && i + 1 < argc)     post_endpoint = argv[++i];
        else if (a == "--distance" && i + 1 < argc) {
            try {
                activation_distance = std::stof(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "[session_replay] Bad --distance value: " << argv[i] << "\n";
                return 1;
            }
        } else { usage(); return 1; }
    }

    StandConfig stand;
    stand.name = "replay";
    if (!stand_path.empty()) {
        try {
            stand = StandConfig::fromJson(stand_path);
        } catch (const std::exception& e) {
            std::cerr << "[session_replay] " << e.what() << "\n";
            return 1;
        }
    }
    stand.activation_distance = activation_distance;

    std::ifstream ifs(frames_path);
    if (!ifs.is_open()) {
        std::cerr << "[session_replay] Failed to open " << frames_path << "\n";
        return 1;
    }

    std::unique_ptr<ReportingSink> sink;
    if (!post_endpoint.empty()) {
        sink = std::make_unique<ReportingSink>(post_endpoint);
        if (!sink->reportStand(stand)) {
            std::cerr << "[session_replay] Stand registration not acknowledged, continuing\n";
        }
    }

    PresenceTracker tracker;
    SessionStateMachine machine(stand.name, stand.activation_distance);

    std::string line;
    size_t line_no = 0, frames = 0, skipped = 0, sessions = 0, sent = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (line.empty()) continue;

        ReplayFrame f;
        if (!parseReplayFrameFromJson(line, f)) {
            std::cerr << "[session_replay] Skipping line " << line_no << "\n";
            ++skipped;
            continue;
        }
        ++frames;

        if (f.pose.person_detected) tracker.update(f.pose.body_center);
        else                        tracker.lostPerson();

        // what the face + demographics nets would have answered for this frame
        auto resolve = [&]() -> std::optional<DemographicsResult> {
            if (!f.pose.sample.reference_point || !f.age_range) return std::nullopt;
            if (!CandidateSelector::select(f.faces, *f.pose.sample.reference_point)) return std::nullopt;
            return makeDemographics(*f.age_range, f.gender.value_or(kGenders[2]));
        };

        StepResult step = machine.step(f.pose.sample, TimeUtils::fromEpochMs(f.ts_ms), resolve);
        if (step.transition == Transition::ACTIVATED) {
            std::cout << "[session_replay] frame " << f.frame_index << " Welcome!"
                      << (tracker.slowingDown() ? " (slowing down)" : "") << "\n";
        } else if (step.transition == Transition::DEACTIVATED) {
            ++sessions;
            std::cout << sessionRecordToJson(*step.record) << "\n";
            std::cout << "[session_replay] frame " << f.frame_index << " Good bye!\n";
            if (sink && sink->reportSession(*step.record)) ++sent;
        }
    }

    std::cout << "[session_replay] frames=" << frames << " skipped=" << skipped
              << " sessions=" << sessions;
    if (sink) std::cout << " posted=" << sent;
    std::cout << " final=" << pipelineStateToJson(machine.snapshot()) << "\n";
    return 0;
}
