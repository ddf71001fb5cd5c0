#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

// Debug log: one timestamped line per event, appended to
// <tmp>/tunneld_debug.log unless redirected by set_log_path() or $TUNNELD_LOG.
// Never pass secret material (passwords, keys, DEKs) to these.

std::filesystem::path tunneld_log_path();
void set_log_path(const std::filesystem::path& path);

void tunneld_log(const std::string& msg);

inline void log_info(const std::string& msg)  { tunneld_log("info  " + msg); }
inline void log_warn(const std::string& msg)  { tunneld_log("warn  " + msg); }
inline void log_error(const std::string& msg) { tunneld_log("error " + msg); }
