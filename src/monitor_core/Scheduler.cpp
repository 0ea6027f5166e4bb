#include "proctor/monitor/Scheduler.h"
#include "proctor/monitor/DetectionSource.h"
#include "proctor/monitor/Errors.h"
#include "proctor/monitor/MonitorEngine.h"
#include "proctor/monitor/Publish.h"

#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

namespace proctor {

using Clock = std::chrono::steady_clock;

struct Scheduler::Impl {
    MonitorConfig cfg;
    DetectionSource& source;
    MonitorEngine& engine;
    Publisher* publisher = nullptr;

    std::mutex tick_mu;                 // one tick at a time
    mutable std::mutex mu;              // guards everything below
    std::condition_variable cv;
    bool running = false;
    bool starting = false;              // start() claimed, worker not spawned yet
    bool in_flight = false;
    uint64_t session = 0;               // 0 = manual runOnce()
    bool unavailable_logged = false;
    SchedulerStats stats;
    std::thread::id worker_id;          // ticking thread of the current / last session

    std::mutex worker_mu;               // guards worker; never taken by the worker itself
    std::thread worker;

    Impl(const MonitorConfig& c, DetectionSource& s, MonitorEngine& e)
        : cfg(c), source(s), engine(e) {}

    bool sessionLive(uint64_t id) const { return id == 0 || (running && id == session); }

    void noteUnavailable(const std::string& why) {
        std::lock_guard<std::mutex> lock(mu);
        ++stats.skipped_unavailable;
        if (!unavailable_logged) {
            std::cerr << "[Scheduler] tick skipped, " << why << "\n";
            unavailable_logged = true;
        }
    }

    // clears in_flight on early exits; the commit path clears it under the lock
    struct InFlightGuard {
        Impl& impl;
        explicit InFlightGuard(Impl& i) : impl(i) {
            std::lock_guard<std::mutex> lock(impl.mu);
            impl.in_flight = true;
        }
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(impl.mu);
            impl.in_flight = false;
        }
    };

    TickOutcome tick(uint64_t session_id) {
        std::lock_guard<std::mutex> tick_lock(tick_mu);
        {
            std::lock_guard<std::mutex> lock(mu);
            if (!sessionLive(session_id)) return TickOutcome::DISCARDED;
        }

        if (!source.isReady()) {
            noteUnavailable("detectors not ready");
            return TickOutcome::SKIPPED_UNAVAILABLE;
        }

        std::optional<FrameRef> frame = source.nextFrame();
        if (!frame) return TickOutcome::END_OF_STREAM;

        InFlightGuard guard(*this);

        auto faces_fut = std::async(std::launch::async, [this, &frame] { return source.detectFaces(*frame); });
        auto objects_fut = std::async(std::launch::async, [this, &frame] { return source.detectObjects(*frame); });

        bool unavailable = false;
        uint64_t failures = 0;
        FrameDetections det;
        det.frame_index = frame->frame_index;
        det.ts_ms = frame->ts_ms;
        det.frame_w = frame->width;
        det.frame_h = frame->height;

        try {
            det.faces = faces_fut.get();
        } catch (const DetectorUnavailableError&) {
            unavailable = true;
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] face detector failed on frame " << frame->frame_index << ": " << e.what() << "\n";
            ++failures;
        }
        try {
            det.objects = objects_fut.get();
        } catch (const DetectorUnavailableError&) {
            unavailable = true;
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] object detector failed on frame " << frame->frame_index << ": " << e.what() << "\n";
            ++failures;
        }

        if (unavailable) {
            noteUnavailable("detector unavailable on frame " + std::to_string(frame->frame_index));
            return TickOutcome::SKIPPED_UNAVAILABLE;
        }

        TickReport report;
        Publisher* sink = nullptr;
        {
            std::lock_guard<std::mutex> lock(mu);
            stats.detector_failures += failures;
            in_flight = false;
            if (!sessionLive(session_id)) {
                ++stats.discarded;
                return TickOutcome::DISCARDED;
            }
            report = engine.processTick(det);
            ++stats.committed;
            unavailable_logged = false;
            sink = publisher;
        }

        if (sink) {
            for (const auto& ev : report.transitions) sink->publishTransition(ev);
            sink->publishTick(report);
        }
        return TickOutcome::COMMITTED;
    }

    void loop(uint64_t session_id) {
        const auto interval = std::chrono::milliseconds(cfg.tick_interval_ms);
        auto next = Clock::now();

        while (true) {
            {
                std::lock_guard<std::mutex> lock(mu);
                if (!sessionLive(session_id)) break;
            }

            TickOutcome outcome = tick(session_id);
            if (outcome == TickOutcome::END_OF_STREAM) {
                std::cout << "[Scheduler] end of stream, stopping\n";
                std::lock_guard<std::mutex> lock(mu);
                if (session == session_id) running = false;
                break;
            }

            next += interval;
            auto now = Clock::now();
            if (now > next) {
                // overran: drop the overdue intervals instead of queueing them
                const int64_t behind = static_cast<int64_t>((now - next) / interval) + 1;
                next += interval * behind;
                std::lock_guard<std::mutex> lock(mu);
                stats.overrun_skipped += static_cast<uint64_t>(behind);
            }

            std::unique_lock<std::mutex> lock(mu);
            cv.wait_until(lock, next, [&] { return !sessionLive(session_id); });
        }
        cv.notify_all();
    }

    bool onWorkerThread() const { return std::this_thread::get_id() == worker_id; }

    // joins the previous session's thread; only called off the ticking thread
    void joinWorker() {
        std::lock_guard<std::mutex> wlock(worker_mu);
        if (worker.joinable()) worker.join();
    }
};

Scheduler::Scheduler(const MonitorConfig& cfg, DetectionSource& source, MonitorEngine& engine)
    : impl_(new Impl(cfg, source, engine)) {
    cfg.validate();
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::setPublisher(Publisher* p) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    impl_->publisher = p;
}

bool Scheduler::start() {
    {
        std::lock_guard<std::mutex> lock(impl_->mu);
        if (impl_->running || impl_->starting) return false;
        // an observer cannot start a new session from the ticking thread
        if (impl_->onWorkerThread()) return false;
        impl_->starting = true;
    }
    if (!impl_->source.isReady()) {
        std::lock_guard<std::mutex> lock(impl_->mu);
        impl_->starting = false;
        std::cerr << "[Scheduler] start refused: detectors not ready\n";
        return false;
    }

    std::lock_guard<std::mutex> wlock(impl_->worker_mu);
    if (impl_->worker.joinable()) impl_->worker.join();   // previous session, already stopped

    {
        std::lock_guard<std::mutex> lock(impl_->mu);
        const uint64_t session_id = ++impl_->session;
        impl_->running = true;
        impl_->starting = false;
        impl_->unavailable_logged = false;
        // the loop takes mu first, so worker_id is set before it can tick
        impl_->worker = std::thread(&Impl::loop, impl_.get(), session_id);
        impl_->worker_id = impl_->worker.get_id();
    }
    std::cout << "[Scheduler] started, interval=" << impl_->cfg.tick_interval_ms << "ms\n";
    return true;
}

void Scheduler::stop() {
    bool was_running;
    bool on_worker;
    {
        std::lock_guard<std::mutex> lock(impl_->mu);
        was_running = impl_->running;
        impl_->running = false;
        on_worker = impl_->onWorkerThread();
    }
    impl_->cv.notify_all();
    if (was_running) std::cout << "[Scheduler] stopped\n";
    // called from an observer: the thread finishes its tick and is joined by
    // the next start() or the destructor
    if (on_worker) return;
    impl_->joinWorker();
}

void Scheduler::reset() {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (impl_->in_flight) throw InvalidResetError();
    impl_->engine.reset();
    std::cout << "[Scheduler] statistics reset\n";
}

TickOutcome Scheduler::runOnce() {
    return impl_->tick(0);
}

void Scheduler::waitUntilIdle() {
    std::unique_lock<std::mutex> lock(impl_->mu);
    impl_->cv.wait(lock, [this] { return !impl_->running; });
}

SchedulerState Scheduler::state() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    return impl_->running ? SchedulerState::RUNNING : SchedulerState::IDLE;
}

MonitorSnapshot Scheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    return impl_->engine.snapshot();
}

SchedulerStats Scheduler::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    return impl_->stats;
}

std::string toString(SchedulerState s) {
    return s == SchedulerState::RUNNING ? "Running" : "Idle";
}

std::string toString(TickOutcome o) {
    switch (o) {
        case TickOutcome::COMMITTED:           return "committed";
        case TickOutcome::SKIPPED_UNAVAILABLE: return "skipped_unavailable";
        case TickOutcome::DISCARDED:           return "discarded";
        case TickOutcome::END_OF_STREAM:       return "end_of_stream";
    }
    return "unknown";
}

} // namespace proctor
