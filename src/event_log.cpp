#include "event_log.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace relay_guard {

namespace fs = std::filesystem;

std::string format_timestamp(const char* fmt) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buf[64];
    const auto n = std::strftime(buf, sizeof(buf), fmt, &local);
    return std::string(buf, n);
}

EventLog::EventLog(const std::string& directory, const std::string& file_name, std::ostream& echo)
    : echo_(echo) {
    const fs::path dir(directory.empty() ? "." : directory);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create log directory " + dir.string() + ": " + ec.message());
    }

    const fs::path target = dir / file_name;
    if (fs::exists(target, ec)) {
        const auto stamp = format_timestamp("%Y%m%d_%H%M%S");
        const auto stem = target.stem().string();
        const auto ext = target.extension().string();
        fs::path rotated = dir / (stem + "_" + stamp + ext);
        for (int n = 1; fs::exists(rotated, ec); ++n) {
            rotated = dir / (stem + "_" + stamp + "_" + std::to_string(n) + ext);
        }
        fs::rename(target, rotated, ec);
        if (ec) {
            throw std::runtime_error("cannot move previous log " + target.string() + ": " + ec.message());
        }
        rotated_path_ = rotated.string();
    }

    file_.open(target, std::ios::out | std::ios::app);
    if (!file_) {
        throw std::runtime_error("cannot open log file " + target.string());
    }
    path_ = target.string();
}

EventLog::EventLog(std::ostream& echo)
    : echo_(echo) {}

void EventLog::write(const std::string& message) {
    const auto line = "[" + format_timestamp("%Y-%m-%d %H:%M:%S") + "] " + message;
    std::lock_guard<std::mutex> lk(mu_);
    echo_ << line << "\n";
    echo_.flush();
    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
}

} // namespace relay_guard
