#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::filesystem::path& log_path_override() {
    static std::filesystem::path p;
    return p;
}

} // namespace

std::filesystem::path tunneld_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (!log_path_override().empty()) return log_path_override();
    if (const char* env = std::getenv("TUNNELD_LOG")) return std::filesystem::path(env);
    return platform::temp_dir() / "tunneld_debug.log";
}

void set_log_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_override() = path;
}

void tunneld_log(const std::string& msg) {
    auto path = tunneld_log_path();

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

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
