#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::mutex& fleetrun_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::string& fleetrun_log_path_ref() {
    static std::string path = (platform::temp_dir() / "fleetrun_debug.log").string();
    return path;
}

inline std::string fleetrun_log_path() {
    std::lock_guard<std::mutex> lock(fleetrun_log_mutex());
    return fleetrun_log_path_ref();
}

// Redirect the debug log (logging.file in the config). Empty keeps the default.
inline void set_fleetrun_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(fleetrun_log_mutex());
    fleetrun_log_path_ref() = path;
}

inline void fleetrun_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(fleetrun_log_mutex());
    std::ofstream out(fleetrun_log_path_ref(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void fleetrun_log_ssh(const std::string& label, const std::string& cmd,
                             const SSHResult& r) {
    fleetrun_log(fmt::format("{} CMD: {}", label, cmd));
    fleetrun_log(fmt::format("{} exit={} kind={} stdout({})={}", label, r.exit_code,
                             to_string(r.kind), r.stdout_data.size(),
                             r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        fleetrun_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
