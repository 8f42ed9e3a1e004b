#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string bugrep_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILE).string();
    return path;
}

inline void bugrep_log(const std::string& msg) {
    std::ofstream out(bugrep_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Log a failed operation with its error kind
template <typename T>
inline void bugrep_log_error(const std::string& label, const Result<T>& r) {
    bugrep_log(fmt::format("{} failed [{}]: {}", label, error_kind_name(r.kind), r.error));
}
