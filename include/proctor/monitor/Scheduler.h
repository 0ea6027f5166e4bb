#pragma once
#include "Config.h"
#include "Types.h"
#include <cstdint>
#include <memory>
#include <string>

namespace proctor {

class DetectionSource;
class MonitorEngine;
class Publisher;

enum class SchedulerState { IDLE, RUNNING };

enum class TickOutcome {
    COMMITTED,              // engine state advanced, observers notified
    SKIPPED_UNAVAILABLE,    // detector not ready, nothing mutated
    DISCARDED,              // session stopped while detectors ran
    END_OF_STREAM
};

struct SchedulerStats {
    uint64_t committed = 0;
    uint64_t skipped_unavailable = 0;
    uint64_t overrun_skipped = 0;     // intervals dropped because a tick ran long
    uint64_t discarded = 0;
    uint64_t detector_failures = 0;   // single-detector failures degraded to empty
};

/*  @brief Scheduler 周期采样与生命周期
*
*   IDLE --start()--> RUNNING --stop() / end of stream--> IDLE
*
*   - one tick every tick_interval_ms on a dedicated thread
*   - face and object detection of a tick run concurrently and are both
*     awaited before the engine is touched
*   - ticks never overlap; an overdue interval is skipped, not queued
*   - stop() stops scheduling immediately; a tick in flight finishes but its
*     result is discarded
*   - reset() throws InvalidResetError while a tick is in flight
*
*   Observers are notified after the engine lock is released, on the ticking thread.
*/
class Scheduler {
public:
    // Throws ConfigurationError on invalid config.
    Scheduler(const MonitorConfig& cfg, DetectionSource& source, MonitorEngine& engine);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void setPublisher(Publisher* p);   // not owned, set before start()

    // false when already running / starting, detectors are not ready, or
    // called from an observer on the ticking thread
    bool start();
    // From an observer: only ends the session; the ticking thread is joined
    // by the next start() or the destructor.
    void stop();
    void reset();

    // One synchronous tick on the calling thread (no session check).
    TickOutcome runOnce();

    // Blocks until the periodic loop ends (stop() or end of stream).
    void waitUntilIdle();

    SchedulerState state() const;
    MonitorSnapshot snapshot() const;
    SchedulerStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string toString(SchedulerState s);
std::string toString(TickOutcome o);

} // namespace proctor
