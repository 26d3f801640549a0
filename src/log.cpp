#include "log.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <nlohmann/json.hpp>

namespace {
std::mutex g_log_mutex;
}

void log(const std::string& level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::stringstream ss;
    ss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    ss << " [" << level << "] " << message;

    // httplib worker threads log concurrently
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cout << ss.str() << std::endl;
}

void log_query(double latency_ms, int k, size_t returned, size_t count, int dim,
               const std::string& backend) {
    nlohmann::json record;
    record["lat_ms"] = std::round(latency_ms * 100.0) / 100.0;
    record["k"] = k;
    record["returned"] = returned;
    record["count"] = count;
    record["dim"] = dim;
    record["backend"] = backend;
    log("QUERY", record.dump());
}
