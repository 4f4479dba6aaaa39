#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>

inline std::string pmerge_log_path() {
    static std::string path = (platform::temp_dir() / "prompt_merge_debug.log").string();
    return path;
}

// When set, every log line is also written to stderr (--verbose).
inline bool& pmerge_log_verbose() {
    static bool verbose = false;
    return verbose;
}

inline void pmerge_log(const std::string& msg) {
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

    if (pmerge_log_verbose()) {
        std::cerr << "[" << ts << "] " << msg << "\n";
    }

    std::ofstream out(pmerge_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
