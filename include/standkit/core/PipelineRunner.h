#pragma once
#include "Types.h"
#include "Config.h"
#include "Capabilities.h"
#include "Publish.h"
#include "ReportingSink.h"
#include <functional>
#include <memory>
#include <optional>

class QThread;

namespace standkit {

struct PipelineCapabilities {
    std::shared_ptr<FrameSource>           source;        // required
    std::shared_ptr<PoseEstimator>         pose;          // required
    std::shared_ptr<FaceDetector>          faces;         // none: never activates
    std::shared_ptr<DemographicsEstimator> demographics;  // none: never activates
};

struct RunnerOptions {
    int stop_timeout_ms  = 2000;   // bounded wait inside stop()
    int poll_interval_ms = 10;     // cancellation check per iteration
    int face_padding_px  = 20;     // margin around the matched face before demographics
    std::function<TimePoint()> clock;   // frame timestamps; empty = Clock::now
};

// Called on the worker thread after the loop died on a capture failure.
// Must not call start()/stop() synchronously; hand off to the owner's thread instead.
using FatalHandler = std::function<void(const LoopResult&)>;

/*  PipelineRunner 展台主循环

    One worker QThread: frame -> pose -> PresenceTracker -> SessionStateMachine
    (-> faces -> CandidateSelector -> demographics on the activation path)
    -> ReportingSink on deactivation.

    start/stop/isRunning/state are for the control thread.
*/
class PipelineRunner {
public:
    // registers the stand with the backend (once, best effort)
    PipelineRunner(StandConfig stand,
                   PipelineCapabilities caps,
                   std::shared_ptr<ReportingSink> sink,
                   RunnerOptions opts = RunnerOptions());
    ~PipelineRunner();

    PipelineRunner(const PipelineRunner&) = delete;
    PipelineRunner& operator=(const PipelineRunner&) = delete;

    // false (no action) while a worker is alive
    bool start();

    /* @brief stop 请求停止并有限等待

    @return true once the worker has exited (or none was running);
            false if it is still alive after stop_timeout_ms. The straggler is not
            killed: isRunning() stays true and start() refuses until its loop returns.
    */
    bool stop();

    bool isRunning() const;

    PipelineState state() const;
    std::optional<LoopResult> lastResult() const;

    void setFatalHandler(FatalHandler handler);
    SessionPublisher& publisher();
    const StandConfig& stand() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;   // shared with the worker so a detached straggler stays valid
    std::unique_ptr<QThread> worker_;
};

} // namespace standkit
