#pragma once
#include "Types.h"
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace proctor {

// Appends transitions and tick reports to a .jsonl file.
class EventLog {
public:
    // Creates parent directories; truncates an existing file.
    EventLog(const std::string& path, bool write_ticks = true);

    bool isOpen() const { return ofs_.is_open(); }
    const std::string& path() const { return path_; }

    void writeTransition(const TransitionEvent& ev);
    void writeTick(const TickReport& report);

    std::size_t linesWritten() const;

private:
    void writeLine(const std::string& line);

    std::string path_;
    bool write_ticks_;
    std::ofstream ofs_;
    mutable std::mutex mu_;
    std::size_t lines_ = 0;          // successful writes only
    bool write_failed_logged_ = false;
};

} // namespace proctor
