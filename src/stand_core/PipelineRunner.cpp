#include "standkit/core/PipelineRunner.h"
#include "standkit/core/CandidateSelector.h"
#include "standkit/core/PresenceTracker.h"
#include "standkit/core/SessionStateMachine.h"
#include <QDeadlineTimer>
#include <QThread>
#include <opencv2/core.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace standkit {

struct PipelineRunner::Impl {
    StandConfig stand;
    PipelineCapabilities caps;
    std::shared_ptr<ReportingSink> sink;
    RunnerOptions opts;

    PresenceTracker tracker;             // worker only
    SessionStateMachine machine;
    SessionPublisher publisher;

    // diagnostics, read by the control thread
    mutable std::mutex diag_mtx;
    PipelineState diag;
    std::optional<LoopResult> last_result;
    bool loop_returned = true;           // worker left loop(); its QThread is about to finish
    FatalHandler fatal;

    Impl(StandConfig s, PipelineCapabilities c, std::shared_ptr<ReportingSink> k, RunnerOptions o)
        : stand(std::move(s)),
          caps(std::move(c)),
          sink(std::move(k)),
          opts(std::move(o)),
          machine(stand.name, stand.activation_distance)
    {
        if (!opts.clock) opts.clock = [] { return Clock::now(); };
    }

    void run();
    LoopResult loop();
    std::optional<DemographicsResult> analyzeCandidate(const cv::Mat& frame, const cv::Point2f& nose);
    void onTransition(const StepResult& step);

    // cancellation: requestInterruption() on the worker QThread
    static bool cancelled() { return QThread::currentThread()->isInterruptionRequested(); }
};

// ==================== Worker ===========================

void PipelineRunner::Impl::run() {
    LoopResult result = loop();

    FatalHandler handler;
    {
        std::lock_guard<std::mutex> lk(diag_mtx);
        last_result = result;
        handler = fatal;
    }

    if (result.exit == LoopExit::CAPTURE_FAILURE) {
        std::cerr << "[PipelineRunner] Worker stopped on capture failure: " << result.message
                  << " (frames=" << result.frames_processed << ")\n";
    } else {
        std::cout << "[PipelineRunner] Worker cancelled after " << result.frames_processed << " frames\n";
    }

    {
        std::lock_guard<std::mutex> lk(diag_mtx);
        loop_returned = true;
    }

    if (result.exit == LoopExit::CAPTURE_FAILURE && handler && !cancelled()) handler(result);
}

LoopResult PipelineRunner::Impl::loop() {
    LoopResult res;
    FrameSource& source = *caps.source;

    if (!source.open()) {
        res.exit = LoopExit::CAPTURE_FAILURE;
        res.message = "Failed to open video capture";
        return res;
    }

    cv::Mat frame;
    const unsigned long poll_ms = static_cast<unsigned long>(std::max(0, opts.poll_interval_ms));

    while (true) {
        // 1. capture (fatal on failure)
        if (!source.read(frame) || frame.empty()) {
            res.exit = LoopExit::CAPTURE_FAILURE;
            res.message = "Error while reading video capture";
            break;
        }

        // 2. pose / distance
        PoseObservation obs;
        try {
            obs = caps.pose->estimate(frame);
        } catch (const std::exception& ex) {
            std::cerr << "[PipelineRunner] pose estimation exception: " << ex.what() << "\n";
            obs = PoseObservation{};
        }

        // 3. step speed
        bool slowing = false;
        if (obs.person_detected) {
            slowing = tracker.update(obs.body_center);
        } else {
            tracker.lostPerson();
        }

        ++res.frames_processed;
        {
            std::lock_guard<std::mutex> lk(diag_mtx);
            diag.frames_processed = res.frames_processed;
            diag.slowing_down = slowing;
        }

        // 4. session transitions
        const TimePoint now = opts.clock();
        const cv::Point2f* nose = obs.sample.reference_point ? &*obs.sample.reference_point : nullptr;
        StepResult step = machine.step(obs.sample, now, [&]() -> std::optional<DemographicsResult> {
            if (!nose) return std::nullopt;
            return analyzeCandidate(frame, *nose);
        });
        onTransition(step);

        // 5. cooperative cancellation
        if (!cancelled() && poll_ms > 0) QThread::msleep(poll_ms);
        if (cancelled()) {
            res.exit = LoopExit::CANCELLED;
            break;
        }
    }

    source.release();
    return res;
}

std::optional<DemographicsResult> PipelineRunner::Impl::analyzeCandidate(const cv::Mat& frame,
                                                                         const cv::Point2f& nose) {
    if (!caps.faces || !caps.demographics) return std::nullopt;

    try {
        std::vector<FaceCandidate> faces = caps.faces->detectFaces(frame);
        std::optional<FaceCandidate> best = CandidateSelector::select(faces, nose);
        if (!best) return std::nullopt;

        const int pad = opts.face_padding_px;
        cv::Rect padded(best->rect.x - pad, best->rect.y - pad,
                        best->rect.width + 2 * pad, best->rect.height + 2 * pad);
        padded &= cv::Rect(0, 0, frame.cols, frame.rows);
        if (padded.area() <= 0) return std::nullopt;

        return caps.demographics->estimate(frame(padded));
    } catch (const std::exception& ex) {
        std::cerr << "[PipelineRunner] face analysis exception: " << ex.what() << "\n";
        return std::nullopt;
    }
}

void PipelineRunner::Impl::onTransition(const StepResult& step) {
    if (step.transition == Transition::NONE) return;

    SessionEvent ev;
    ev.transition = step.transition;
    ev.record = step.record;

    if (step.transition == Transition::ACTIVATED) {
        std::cout << "[PipelineRunner] Welcome!\n";
    } else {
        const bool sent = sink ? sink->reportSession(*step.record) : false;
        {
            std::lock_guard<std::mutex> lk(diag_mtx);
            ++diag.sessions_completed;
            if (sent) ++diag.reports_sent; else ++diag.reports_dropped;
        }
        std::cout << "[PipelineRunner] " << sessionRecordToJson(*step.record) << "\n";
        std::cout << "[PipelineRunner] Good bye!\n";
    }

    ev.state = machine.snapshot();
    {
        std::lock_guard<std::mutex> lk(diag_mtx);
        ev.state.slowing_down       = diag.slowing_down;
        ev.state.frames_processed   = diag.frames_processed;
        ev.state.sessions_completed = diag.sessions_completed;
        ev.state.reports_sent       = diag.reports_sent;
        ev.state.reports_dropped    = diag.reports_dropped;
    }
    if (cancelled()) return;   // owner is stopping (or gone); observers no longer listen
    publisher.publish(ev);
}

// ==================== Control surface ===========================

PipelineRunner::PipelineRunner(StandConfig stand,
                               PipelineCapabilities caps,
                               std::shared_ptr<ReportingSink> sink,
                               RunnerOptions opts)
{
    if (!caps.source) throw std::invalid_argument("PipelineRunner: no frame source");
    if (!caps.pose)   throw std::invalid_argument("PipelineRunner: no pose estimator");

    impl_ = std::make_shared<Impl>(std::move(stand), std::move(caps), std::move(sink), std::move(opts));

    std::cout << "[PipelineRunner] Stand \"" << impl_->stand.name << "\" activation distance "
              << impl_->stand.activation_distance << " m\n";

    if (impl_->sink && !impl_->sink->reportStand(impl_->stand)) {
        std::cerr << "[PipelineRunner] Stand registration not acknowledged, continuing\n";
    }
}

PipelineRunner::~PipelineRunner() {
    if (stop()) return;

    // straggler: nothing may call back into the owner any more
    impl_->publisher.setCallback(nullptr);
    {
        std::lock_guard<std::mutex> lk(impl_->diag_mtx);
        impl_->fatal = nullptr;
    }

    std::cerr << "[PipelineRunner] Worker did not exit in time, detaching it\n";
    QThread* t = worker_.release();
    if (t->isFinished()) {
        delete t;
    } else {
        QObject::connect(t, &QThread::finished, t, &QObject::deleteLater);
    }
}

bool PipelineRunner::start() {
    if (worker_) {
        if (QThread::currentThread() == worker_.get()) {
            std::cerr << "[PipelineRunner] start() called from the worker thread, ignored\n";
            return false;
        }
        if (worker_->isRunning()) {
            bool returned;
            {
                std::lock_guard<std::mutex> lk(impl_->diag_mtx);
                returned = impl_->loop_returned;
            }
            if (!returned) return false;   // already running (or a straggler is still busy)
        }
        worker_->wait();                   // previous run already left its loop
        worker_.reset();
    }

    // fresh run: nothing carries over
    impl_->tracker.reset();
    impl_->machine.reset();
    {
        std::lock_guard<std::mutex> lk(impl_->diag_mtx);
        impl_->diag = PipelineState{};
        impl_->loop_returned = false;
    }

    std::shared_ptr<Impl> self = impl_;
    worker_.reset(QThread::create([self] { self->run(); }));
    worker_->setObjectName(QStringLiteral("standkit-pipeline"));
    worker_->start();
    std::cout << "[PipelineRunner] Worker started\n";
    return true;
}

bool PipelineRunner::stop() {
    if (!worker_) return true;

    worker_->requestInterruption();
    if (QThread::currentThread() == worker_.get()) return false;

    if (!worker_->wait(QDeadlineTimer(impl_->opts.stop_timeout_ms))) {
        std::cerr << "[PipelineRunner] Worker still busy after " << impl_->opts.stop_timeout_ms
                  << " ms, left running until its current call returns\n";
        return false;
    }
    return true;
}

bool PipelineRunner::isRunning() const {
    return worker_ && worker_->isRunning();
}

PipelineState PipelineRunner::state() const {
    PipelineState s = impl_->machine.snapshot();
    std::lock_guard<std::mutex> lk(impl_->diag_mtx);
    s.slowing_down       = impl_->diag.slowing_down;
    s.frames_processed   = impl_->diag.frames_processed;
    s.sessions_completed = impl_->diag.sessions_completed;
    s.reports_sent       = impl_->diag.reports_sent;
    s.reports_dropped    = impl_->diag.reports_dropped;
    return s;
}

std::optional<LoopResult> PipelineRunner::lastResult() const {
    std::lock_guard<std::mutex> lk(impl_->diag_mtx);
    return impl_->last_result;
}

void PipelineRunner::setFatalHandler(FatalHandler handler) {
    std::lock_guard<std::mutex> lk(impl_->diag_mtx);
    impl_->fatal = std::move(handler);
}

SessionPublisher& PipelineRunner::publisher() {
    return impl_->publisher;
}

const StandConfig& PipelineRunner::stand() const {
    return impl_->stand;
}

} // namespace standkit
