#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

class Timer {
public:
    Timer() : start_time_(std::chrono::steady_clock::now()) {}

    double elapsed_ms() const {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time_);
        return duration.count() / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

struct LatencySummary {
    double p50 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

// Search latency and throughput as reported by GET /stats.
// All methods are safe to call from concurrent request handlers.
class SearchMetrics {
public:
    explicit SearchMetrics(size_t latency_window = 1000);

    void record(double latency_ms);

    LatencySummary latency() const;
    double qps_1m() const;
    double uptime_sec() const;
    size_t total_searches() const;

private:
    const std::chrono::steady_clock::time_point started_;
    mutable std::mutex mutex_;
    std::vector<double> samples_;   // ring buffer of the latest latencies
    size_t next_ = 0;
    size_t filled_ = 0;
    size_t total_ = 0;
    std::deque<std::chrono::steady_clock::time_point> recent_;   // last minute
};
