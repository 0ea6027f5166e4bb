#include "proctor/monitor/EventLog.h"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace proctor {

EventLog::EventLog(const std::string& path, bool write_ticks)
    : path_(path), write_ticks_(write_ticks) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) std::cerr << "[EventLog] cannot create " << parent.string() << ": " << ec.message() << "\n";
    }
    ofs_.open(path_, std::ios::out | std::ios::trunc);
    if (!ofs_) std::cerr << "[EventLog] Unable to open events file: " << path_ << "\n";
}

void EventLog::writeTransition(const TransitionEvent& ev) {
    writeLine(transitionToJsonLine(ev));
}

void EventLog::writeTick(const TickReport& report) {
    if (!write_ticks_) return;
    writeLine(tickReportToJsonLine(report));
}

void EventLog::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!ofs_) return;
    ofs_ << line << '\n';
    ofs_.flush();
    if (!ofs_) {
        if (!write_failed_logged_) {
            std::cerr << "[EventLog] write failed: " << path_ << "\n";
            write_failed_logged_ = true;
        }
        return;
    }
    ++lines_;
}

std::size_t EventLog::linesWritten() const {
    std::lock_guard<std::mutex> lock(mu_);
    return lines_;
}

} // namespace proctor
