/*
*   Name:  monitor_cli.cpp
*   Usage: ./monitor_replay [--config monitor.yml] [--detections session.jsonl]
*                           [--out events.jsonl] [--realtime] [--no-ticks]
*   ==========================================================================================
*   Replays recorded per-frame detections through the Scheduler/MonitorEngine,
*   writes transitions (and per-tick reports) as JSONL, prints the statistics summary.
*/
#include "proctor/monitor/Config.h"
#include "proctor/monitor/DetectionSource.h"
#include "proctor/monitor/Errors.h"
#include "proctor/monitor/EventLog.h"
#include "proctor/monitor/MonitorEngine.h"
#include "proctor/monitor/Publish.h"
#include "proctor/monitor/Scheduler.h"
#include "proctor/monitor/Statistics.h"

#include <filesystem>
#include <iostream>
#include <string>

using namespace proctor;

static void printUsage() {
    std::cout << "Usage: monitor_replay [--config <yml|json>] [--detections <jsonl>] [--out <jsonl>]\n"
              << "                      [--realtime] [--no-ticks]\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string detections_override;
    std::string out_override;
    bool force_realtime = false;
    bool no_ticks = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--detections" && i + 1 < argc) {
            detections_override = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_override = argv[++i];
        } else if (arg == "--realtime") {
            force_realtime = true;
        } else if (arg == "--no-ticks") {
            no_ticks = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "[Main] Unknown arg: " << arg << "\n";
            printUsage();
            return 2;
        }
    }

    MonitorConfig cfg;
    try {
        if (!config_path.empty()) {
            cfg = std::filesystem::path(config_path).extension() == ".json"
                ? MonitorConfig::fromJson(config_path)
                : MonitorConfig::fromYaml(config_path);
        }
        if (!detections_override.empty()) cfg.detections_jsonl = detections_override;
        if (!out_override.empty()) cfg.events_output = out_override;
        if (force_realtime) cfg.realtime = true;
        if (no_ticks) cfg.write_tick_reports = false;
        cfg.validate();
    } catch (const ConfigurationError& e) {
        std::cerr << "[Main] " << e.what() << "\n";
        return 2;
    }

    std::cout << "[Main] detections: " << cfg.detections_jsonl << "\n"
              << "       events    : " << cfg.events_output << "\n"
              << "       interval  : " << cfg.tick_interval_ms << " ms"
              << (cfg.realtime ? " (realtime)" : " (as fast as possible)") << "\n";

    ReplayDetectionSource source;
    if (!source.loadJsonl(cfg.detections_jsonl)) {
        std::cerr << "[Main] no detections to replay\n";
        return 1;
    }

    EventLog log(cfg.events_output, cfg.write_tick_reports);
    if (!log.isOpen()) return 1;

    MonitorEngine engine(cfg);
    Scheduler scheduler(cfg, source, engine);

    Publisher publisher;
    publisher.setTransitionCallback([&log](const TransitionEvent& ev) {
        log.writeTransition(ev);
        std::cout << "[Frame " << ev.frame_index << "] " << toLabel(ev.kind)
                  << (ev.active ? " - Active (#" + std::to_string(ev.count) + ")" : " - Cleared") << "\n";
    });
    publisher.setTickCallback([&log](const TickReport& report) { log.writeTick(report); });
    scheduler.setPublisher(&publisher);

    if (cfg.realtime) {
        if (!scheduler.start()) return 1;
        scheduler.waitUntilIdle();
        scheduler.stop();
    } else {
        while (scheduler.runOnce() != TickOutcome::END_OF_STREAM) {}
    }

    const SchedulerStats st = scheduler.stats();
    const MonitorSnapshot snap = scheduler.snapshot();
    std::cout << formatStatistics(snap);
    std::cout << "[Main] snapshot: " << snapshotToJson(snap) << "\n";
    std::cout << "[Main] ticks committed=" << st.committed
              << " skipped(unavailable)=" << st.skipped_unavailable
              << " skipped(overrun)=" << st.overrun_skipped
              << " detector failures=" << st.detector_failures << "\n";
    std::cout << "[Main] " << log.linesWritten() << " lines written to " << log.path() << "\n";
    return 0;
}
