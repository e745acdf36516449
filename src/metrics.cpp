#include <file_icon/metrics.hpp>

namespace file_icon {

void counting_metrics::record(const extract_event& event) noexcept {
    calls_.fetch_add(1, std::memory_order_relaxed);

    const auto index = static_cast<std::size_t>(event.outcome);
    if (index < outcomes_.size()) {
        outcomes_[index].fetch_add(1, std::memory_order_relaxed);
    }

    const std::int64_t ns = event.latency.count();
    total_latency_ns_.fetch_add(ns, std::memory_order_relaxed);

    std::int64_t seen = max_latency_ns_.load(std::memory_order_relaxed);
    while (ns > seen &&
           !max_latency_ns_.compare_exchange_weak(seen, ns, std::memory_order_relaxed)) {
    }
}

metrics_snapshot counting_metrics::snapshot() const noexcept {
    metrics_snapshot snap;
    snap.calls = calls_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        snap.outcomes[i] = outcomes_[i].load(std::memory_order_relaxed);
    }
    snap.total_latency = std::chrono::nanoseconds(total_latency_ns_.load(std::memory_order_relaxed));
    snap.max_latency = std::chrono::nanoseconds(max_latency_ns_.load(std::memory_order_relaxed));
    return snap;
}

void counting_metrics::reset() noexcept {
    calls_.store(0, std::memory_order_relaxed);
    for (auto& counter : outcomes_) {
        counter.store(0, std::memory_order_relaxed);
    }
    total_latency_ns_.store(0, std::memory_order_relaxed);
    max_latency_ns_.store(0, std::memory_order_relaxed);
}

} // namespace file_icon
