#include <QCoreApplication>
#include <QTimer>
#include <QtGlobal>

#include "standkit/core/CameraSource.h"
#include "standkit/core/Config.h"
#include "standkit/core/DnnFaceAnalyzer.h"
#include "standkit/core/OrtPose.h"
#include "standkit/core/PipelineRunner.h"
#include "standkit/core/ReportingSink.h"

#include <atomic>
#include <csignal>
#include <memory>
#include <string>

using namespace standkit;

namespace {

std::atomic<bool> g_quit{false};

void onSignal(int) { g_quit = true; }

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// 用法：stand_app [runtime.yml|runtime.json]
int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    // ===== configs =====
    const std::string runtime_path = argc >= 2 ? argv[1] : "assets/config/stand.yml";
    RuntimeConfig cfg = endsWith(runtime_path, ".json") ? RuntimeConfig::fromJson(runtime_path)
                                                        : RuntimeConfig::fromYaml(runtime_path);

    StandConfig stand;
    try {
        stand = StandConfig::fromJson(cfg.stand_config);
    } catch (const std::exception& e) {
        qCritical("[stand_app] %s", e.what());
        return 1;
    }
    cfg.applyTo(stand);

    // ===== capabilities =====
    OrtPoseEstimator::SessionOptions pose_opt;
    pose_opt.model_path     = cfg.pose_model_path;
    pose_opt.input_size     = cfg.pose_input_size;
    pose_opt.conf_thres     = cfg.pose_conf_thres;
    pose_opt.keypoint_thres = cfg.keypoint_conf_thres;
    pose_opt.nms_iou        = cfg.nms_iou;
    pose_opt.intra_threads  = cfg.intra_threads;
    auto pose = std::make_shared<OrtPoseEstimator>(pose_opt);
    if (!pose->isReady()) {
        qCritical("[stand_app] Pose model unavailable: %s", cfg.pose_model_path.c_str());
        return 1;
    }

    DnnFaceAnalyzer::Models models;
    models.face_proto        = cfg.face_proto;
    models.face_model        = cfg.face_model;
    models.age_proto         = cfg.age_proto;
    models.age_model         = cfg.age_model;
    models.gender_proto      = cfg.gender_proto;
    models.gender_model      = cfg.gender_model;
    models.face_conf_thres   = cfg.face_conf_thres;
    models.gender_conf_thres = cfg.gender_conf_thres;
    auto analyzer = std::make_shared<DnnFaceAnalyzer>(models);
    if (!analyzer->isReady()) {
        qCritical("[stand_app] Face/demographics models unavailable");
        return 1;
    }

    PipelineCapabilities caps;
    caps.source       = std::make_shared<CameraSource>(cfg.camera_index, cfg.video_path);
    caps.pose         = pose;
    caps.faces        = analyzer;
    caps.demographics = analyzer;

    RunnerOptions opts;
    opts.stop_timeout_ms  = cfg.stop_timeout_ms;
    opts.poll_interval_ms = cfg.poll_interval_ms;
    opts.face_padding_px  = cfg.face_padding_px;

    auto sink = std::make_shared<ReportingSink>(stand.endpoint, cfg.report_timeout_ms);
    PipelineRunner runner(stand, caps, sink, opts);

    runner.publisher().setCallback([](const SessionEvent& ev) {
        qInfo("[stand_app] %s %s", toString(ev.transition).c_str(), pipelineStateToJson(ev.state).c_str());
    });

    // ===== restart policy (capture failure) =====
    int restarts = 0;
    int backoff_ms = cfg.restart_backoff_ms;
    runner.setFatalHandler([&](const LoopResult& result) {
        // worker thread -> main thread
        QMetaObject::invokeMethod(&app, [&, result] {
            if (g_quit) return;
            if (restarts >= cfg.max_restarts) {
                qCritical("[stand_app] %s, giving up after %d restart(s)", result.message.c_str(), restarts);
                app.exit(2);
                return;
            }
            ++restarts;
            qWarning("[stand_app] %s, restart %d/%d in %d ms",
                     result.message.c_str(), restarts, cfg.max_restarts, backoff_ms);
            QTimer::singleShot(backoff_ms, &app, [&] {
                if (!g_quit && !runner.start()) qWarning("[stand_app] Restart refused, worker still alive");
            });
            backoff_ms *= 2;
        }, Qt::QueuedConnection);
    });

    // ===== signals =====
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    QTimer quit_poll;
    QObject::connect(&quit_poll, &QTimer::timeout, &app, [&] {
        if (g_quit) app.quit();
    });
    quit_poll.start(100);

    if (!runner.start()) {
        qCritical("[stand_app] Failed to start the pipeline");
        return 1;
    }
    qInfo("[stand_app] Stand \"%s\" running, endpoint %s", stand.name.c_str(), stand.endpoint.c_str());

    int rc = app.exec();

    runner.setFatalHandler(nullptr);
    if (!runner.stop()) qWarning("[stand_app] Pipeline did not stop within %d ms", cfg.stop_timeout_ms);
    qInfo("[stand_app] Exit code %d", rc);
    return rc;
}
