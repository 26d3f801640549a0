#pragma once

#include <cstddef>
#include <string>

// Timestamped line on stdout: [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
void log(const std::string& level, const std::string& message);

// One QUERY line per served search.
void log_query(double latency_ms, int k, size_t returned, size_t count, int dim,
               const std::string& backend);

#define LOG_INFO(msg) log("INFO", msg)
#define LOG_WARN(msg) log("WARN", msg)
#define LOG_ERROR(msg) log("ERROR", msg)
#define LOG_DEBUG(msg) log("DEBUG", msg)
