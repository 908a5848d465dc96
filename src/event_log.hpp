#pragma once

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace relay_guard {

// Append-only event log. Each line is "[YYYY-MM-DD HH:MM:SS] message", written
// to the log file and echoed to the console stream.
class EventLog {
public:
    // Creates `directory` if needed. An existing `file_name` is first moved
    // aside to <stem>_YYYYMMDD_HHMMSS<ext>. Throws std::runtime_error if the
    // log file cannot be opened.
    EventLog(const std::string& directory, const std::string& file_name, std::ostream& echo);

    // Console-only log, used by tests and tools that want no file.
    explicit EventLog(std::ostream& echo);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void write(const std::string& message);

    const std::string& path() const { return path_; }
    // Where the previous log went on startup; empty if there was none.
    const std::string& rotated_path() const { return rotated_path_; }

private:
    std::mutex mu_;
    std::ostream& echo_;
    std::ofstream file_;
    std::string path_;
    std::string rotated_path_;
};

std::string format_timestamp(const char* fmt);

} // namespace relay_guard
