#include "metrics.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr auto kQpsWindow = std::chrono::minutes(1);

// Nearest-rank percentile over an ascending, non-empty sample.
double percentile(const std::vector<double>& sorted, double p) {
    size_t idx = static_cast<size_t>(std::ceil(p * sorted.size() / 100.0));
    idx = idx == 0 ? 0 : idx - 1;
    return sorted[std::min(idx, sorted.size() - 1)];
}
}  // namespace

SearchMetrics::SearchMetrics(size_t latency_window)
    : started_(std::chrono::steady_clock::now()),
      samples_(std::max<size_t>(latency_window, 1)) {}

void SearchMetrics::record(double latency_ms) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    samples_[next_] = latency_ms;
    next_ = (next_ + 1) % samples_.size();
    filled_ = std::min(filled_ + 1, samples_.size());
    ++total_;

    while (!recent_.empty() && recent_.front() < now - kQpsWindow) {
        recent_.pop_front();
    }
    recent_.push_back(now);
}

LatencySummary SearchMetrics::latency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LatencySummary summary;
    if (filled_ == 0) return summary;

    std::vector<double> sorted(samples_.begin(), samples_.begin() + filled_);
    std::sort(sorted.begin(), sorted.end());
    summary.p50 = percentile(sorted, 50.0);
    summary.p95 = percentile(sorted, 95.0);
    summary.p99 = percentile(sorted, 99.0);
    return summary;
}

double SearchMetrics::qps_1m() const {
    auto now = std::chrono::steady_clock::now();
    auto window_start = now - kQpsWindow;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& ts : recent_) {
        if (ts >= window_start) count++;
    }
    if (count == 0) return 0.0;

    auto window_sec = std::chrono::duration<double>(
        now - std::max(window_start, recent_.front())).count();
    return window_sec > 0 ? count / window_sec : 0.0;
}

double SearchMetrics::uptime_sec() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();
}

size_t SearchMetrics::total_searches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}
