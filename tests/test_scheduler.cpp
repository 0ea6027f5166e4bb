#include "proctor/monitor/DetectionSource.h"
#include "proctor/monitor/Errors.h"
#include "proctor/monitor/MonitorEngine.h"
#include "proctor/monitor/Publish.h"
#include "proctor/monitor/Scheduler.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace proctor;
using namespace proctor::testing;
using Mode = FakeDetectionSource::Mode;

namespace {

MonitorConfig fastConfig(int interval_ms = 5) {
    MonitorConfig cfg;
    cfg.tick_interval_ms = interval_ms;
    return cfg;
}

void waitForIdle(const Scheduler& s) {
    while (s.state() != SchedulerState::IDLE) std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

} // namespace

TEST(Scheduler, StartRefusedWhenDetectorsNotReady) {
    FakeDetectionSource source;
    source.ready = false;
    source.add(makeFrame({makeFace(320.f, 240.f)}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    EXPECT_FALSE(scheduler.start());
    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
}

TEST(Scheduler, RunOnceSkipsWhenNotReady) {
    FakeDetectionSource source;
    source.ready = false;
    source.add(makeFrame({}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    EXPECT_EQ(scheduler.runOnce(), TickOutcome::SKIPPED_UNAVAILABLE);
    EXPECT_EQ(source.consumed(), 0u);
    EXPECT_EQ(scheduler.snapshot().ticks, 0u);
    EXPECT_EQ(scheduler.stats().skipped_unavailable, 1u);
}

TEST(Scheduler, UnavailableDetectorSkipsWholeTick) {
    FakeDetectionSource source;
    source.add(makeFrame({}, {makeObject(ObjectClass::PHONE)}), Mode::UNAVAILABLE);
    source.add(makeFrame({makeFace(320.f, 240.f)}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    EXPECT_EQ(scheduler.runOnce(), TickOutcome::SKIPPED_UNAVAILABLE);
    MonitorSnapshot s = scheduler.snapshot();
    EXPECT_EQ(s.ticks, 0u);
    EXPECT_EQ(s.total, 0);

    EXPECT_EQ(scheduler.runOnce(), TickOutcome::COMMITTED);
    EXPECT_EQ(scheduler.runOnce(), TickOutcome::END_OF_STREAM);
    EXPECT_EQ(scheduler.snapshot().ticks, 1u);
}

TEST(Scheduler, FailingFaceDetectorDegradesToEmpty) {
    FakeDetectionSource source;
    source.add(makeFrame({makeFace(320.f, 240.f)}, {makeObject(ObjectClass::PHONE)}), Mode::FACE_THROWS);
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    EXPECT_EQ(scheduler.runOnce(), TickOutcome::COMMITTED);
    MonitorSnapshot s = scheduler.snapshot();
    EXPECT_TRUE(s.active[ViolationKind::FACE_ABSENT]);
    EXPECT_TRUE(s.active[ViolationKind::PHONE_DETECTED]);
    EXPECT_EQ(scheduler.stats().detector_failures, 1u);
}

TEST(Scheduler, FailingObjectDetectorDegradesToEmpty) {
    FakeDetectionSource source;
    source.add(makeFrame({makeFace(320.f, 240.f)}, {makeObject(ObjectClass::PHONE)}), Mode::OBJECT_THROWS);
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    EXPECT_EQ(scheduler.runOnce(), TickOutcome::COMMITTED);
    MonitorSnapshot s = scheduler.snapshot();
    EXPECT_FALSE(s.active[ViolationKind::FACE_ABSENT]);
    EXPECT_FALSE(s.active[ViolationKind::PHONE_DETECTED]);
    EXPECT_EQ(scheduler.stats().detector_failures, 1u);
}

TEST(Scheduler, ResetRejectedWhileTickInFlight) {
    FakeDetectionSource source;
    source.add(makeFrame({}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    source.closeGate();
    TickOutcome outcome = TickOutcome::DISCARDED;
    std::thread ticker([&] { outcome = scheduler.runOnce(); });
    source.waitEntered();

    EXPECT_THROW(scheduler.reset(), InvalidResetError);

    source.openGate();
    ticker.join();
    EXPECT_EQ(outcome, TickOutcome::COMMITTED);
    EXPECT_EQ(scheduler.snapshot().total, 1);

    EXPECT_NO_THROW(scheduler.reset());
    EXPECT_EQ(scheduler.snapshot().total, 0);
}

TEST(Scheduler, ObserverMayResetFromCallback) {
    FakeDetectionSource source;
    source.add(makeFrame({}, {makeObject(ObjectClass::NOTES)}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    Publisher publisher;
    bool reset_ok = false;
    publisher.setTickCallback([&](const TickReport& report) {
        EXPECT_EQ(report.snapshot.total, 2);
        scheduler.reset();
        reset_ok = true;
    });
    scheduler.setPublisher(&publisher);

    EXPECT_EQ(scheduler.runOnce(), TickOutcome::COMMITTED);
    EXPECT_TRUE(reset_ok);
    EXPECT_EQ(scheduler.snapshot().total, 0);
}

TEST(Scheduler, ObserverStopThenDestroy) {
    for (int round = 0; round < 20; ++round) {
        FakeDetectionSource source;
        for (int i = 0; i < 3; ++i) source.add(makeFrame({}));
        MonitorConfig cfg = fastConfig();
        MonitorEngine engine(cfg);
        auto scheduler = std::make_unique<Scheduler>(cfg, source, engine);
        Scheduler* raw = scheduler.get();

        Publisher publisher;
        bool start_from_observer = true;
        publisher.setTickCallback([&](const TickReport&) {
            raw->stop();
            start_from_observer = raw->start();
        });
        scheduler->setPublisher(&publisher);

        ASSERT_TRUE(scheduler->start());
        scheduler->waitUntilIdle();
        EXPECT_FALSE(start_from_observer);
        EXPECT_NO_THROW(scheduler->reset());
        EXPECT_EQ(scheduler->stats().committed, 1u);
        scheduler.reset();   // joins the ticking thread still inside its tick
    }
}

TEST(Scheduler, OwnerRestartsAfterObserverStop) {
    FakeDetectionSource source;
    for (int i = 0; i < 4; ++i) source.add(makeFrame({}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    std::atomic<int> ticks{0};
    Publisher publisher;
    publisher.setTickCallback([&](const TickReport&) {
        ++ticks;
        scheduler.stop();
    });
    scheduler.setPublisher(&publisher);

    ASSERT_TRUE(scheduler.start());
    scheduler.waitUntilIdle();
    ASSERT_TRUE(scheduler.start());
    scheduler.waitUntilIdle();
    scheduler.stop();

    EXPECT_EQ(ticks.load(), 2);
    EXPECT_EQ(scheduler.stats().committed, 2u);
    EXPECT_EQ(source.consumed(), 2u);
}

TEST(Scheduler, ConcurrentStartClaimsOneSession) {
    for (int round = 0; round < 20; ++round) {
        FakeDetectionSource source;
        source.add(makeFrame({}));
        MonitorConfig cfg = fastConfig();
        MonitorEngine engine(cfg);
        Scheduler scheduler(cfg, source, engine);

        source.closeGate();
        std::atomic<bool> go{false};
        std::atomic<int> started{0};
        auto racer = [&] {
            while (!go.load()) std::this_thread::yield();
            if (scheduler.start()) ++started;
        };
        std::thread a(racer);
        std::thread b(racer);
        go = true;
        a.join();
        b.join();

        EXPECT_EQ(started.load(), 1);
        EXPECT_EQ(scheduler.state(), SchedulerState::RUNNING);
        source.openGate();
        scheduler.stop();
        EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
    }
}

TEST(Scheduler, PeriodicRunEndsAtEndOfStream) {
    FakeDetectionSource source;
    for (int i = 0; i < 5; ++i) source.add(makeFrame({}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    std::atomic<int> ticks{0};
    std::atomic<int> transitions{0};
    Publisher publisher;
    publisher.setTickCallback([&](const TickReport&) { ++ticks; });
    publisher.setTransitionCallback([&](const TransitionEvent&) { ++transitions; });
    scheduler.setPublisher(&publisher);

    ASSERT_TRUE(scheduler.start());
    scheduler.waitUntilIdle();
    scheduler.stop();

    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
    EXPECT_EQ(scheduler.stats().committed, 5u);
    EXPECT_EQ(ticks.load(), 5);
    EXPECT_EQ(transitions.load(), 1);   // faceAbsent rises once
    EXPECT_EQ(scheduler.snapshot().counts[ViolationKind::FACE_ABSENT], 1);
}

TEST(Scheduler, StartWhileRunningIsRefused) {
    FakeDetectionSource source;
    source.add(makeFrame({}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    source.closeGate();
    ASSERT_TRUE(scheduler.start());
    source.waitEntered();
    EXPECT_EQ(scheduler.state(), SchedulerState::RUNNING);
    EXPECT_FALSE(scheduler.start());

    source.openGate();
    scheduler.stop();
    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
}

TEST(Scheduler, StopDiscardsTickInFlight) {
    FakeDetectionSource source;
    source.add(makeFrame({}, {makeObject(ObjectClass::PHONE)}));
    source.add(makeFrame({}));
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    source.closeGate();
    ASSERT_TRUE(scheduler.start());
    source.waitEntered();

    std::thread stopper([&] { scheduler.stop(); });
    waitForIdle(scheduler);
    source.openGate();
    stopper.join();

    SchedulerStats st = scheduler.stats();
    EXPECT_EQ(st.committed, 0u);
    EXPECT_EQ(st.discarded, 1u);
    MonitorSnapshot s = scheduler.snapshot();
    EXPECT_EQ(s.ticks, 0u);
    EXPECT_EQ(s.total, 0);
    EXPECT_EQ(source.consumed(), 1u);
}

TEST(Scheduler, RestartAfterSessionEnds) {
    FakeDetectionSource source;
    MonitorConfig cfg = fastConfig();
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    // empty stream: the loop ends on its first tick
    ASSERT_TRUE(scheduler.start());
    scheduler.waitUntilIdle();
    EXPECT_TRUE(scheduler.start());
    scheduler.waitUntilIdle();
    scheduler.stop();
    EXPECT_EQ(scheduler.stats().committed, 0u);
}

TEST(Scheduler, LongTicksSkipIntervalsWithoutOverlap) {
    FakeDetectionSource source;
    source.face_delay = std::chrono::milliseconds(50);
    for (int i = 0; i < 3; ++i) source.add(makeFrame({makeFace(320.f, 240.f)}));
    MonitorConfig cfg = fastConfig(20);
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    ASSERT_TRUE(scheduler.start());
    scheduler.waitUntilIdle();
    scheduler.stop();

    SchedulerStats st = scheduler.stats();
    EXPECT_EQ(st.committed, 3u);
    EXPECT_GE(st.overrun_skipped, 1u);
    EXPECT_EQ(source.maxConcurrentFaces(), 1);
}

TEST(Scheduler, RejectsInvalidInterval) {
    FakeDetectionSource source;
    MonitorEngine engine{MonitorConfig{}};
    MonitorConfig bad;
    bad.tick_interval_ms = 0;
    EXPECT_THROW((Scheduler{bad, source, engine}), ConfigurationError);
}

TEST(Scheduler, ReplaysSampleSession) {
    ReplayDetectionSource source;
    ASSERT_TRUE(source.loadJsonl(PROCTOR_SAMPLE_SESSION));
    ASSERT_EQ(source.size(), 88u);

    MonitorConfig cfg;
    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    int transitions = 0;
    Publisher publisher;
    publisher.setTransitionCallback([&](const TransitionEvent&) { ++transitions; });
    scheduler.setPublisher(&publisher);

    while (scheduler.runOnce() != TickOutcome::END_OF_STREAM) {}

    SchedulerStats st = scheduler.stats();
    EXPECT_EQ(st.committed, 87u);
    EXPECT_EQ(st.skipped_unavailable, 1u);
    EXPECT_EQ(transitions, 12);

    MonitorSnapshot s = scheduler.snapshot();
    for (auto k : kAllViolationKinds) {
        EXPECT_EQ(s.counts[k], 1) << toString(k);
        EXPECT_FALSE(s.active[k]) << toString(k);
    }
    EXPECT_EQ(s.total, 6);
    EXPECT_EQ(s.severity, Severity::LOW_RISK);
    EXPECT_EQ(s.ticks, 87u);
}

TEST(Scheduler, OutcomeNames) {
    EXPECT_EQ(toString(SchedulerState::RUNNING), "Running");
    EXPECT_EQ(toString(TickOutcome::END_OF_STREAM), "end_of_stream");
}
