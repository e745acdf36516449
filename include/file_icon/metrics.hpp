#ifndef FILE_ICON_METRICS_HPP_
#define FILE_ICON_METRICS_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>

namespace file_icon {

// ============================================================================
// Extract Events
// ============================================================================

struct extract_event {
    const std::filesystem::path* path = nullptr;
    icon_size size = icon_size::large;
    extract_error outcome = extract_error::none;
    std::chrono::nanoseconds latency{0};
};

// ============================================================================
// Metrics Sink Interface
// ============================================================================

/**
 * Receives one event per extract call. Emission is one-way; the extractor
 * never reads anything back. Implementations must be thread-safe, calls
 * may arrive concurrently.
 */
class FILE_ICON_EXPORT metrics_sink {
public:
    virtual ~metrics_sink() = default;

    virtual void record(const extract_event& event) noexcept = 0;
};

// ============================================================================
// Counting Metrics (default implementation)
// ============================================================================

inline constexpr std::size_t EXTRACT_ERROR_COUNT =
    static_cast<std::size_t>(extract_error::invalid_argument) + 1;

struct metrics_snapshot {
    std::uint64_t calls = 0;
    std::array<std::uint64_t, EXTRACT_ERROR_COUNT> outcomes{};
    std::chrono::nanoseconds total_latency{0};
    std::chrono::nanoseconds max_latency{0};

    [[nodiscard]] std::uint64_t count(extract_error outcome) const noexcept {
        return outcomes[static_cast<std::size_t>(outcome)];
    }
    [[nodiscard]] std::uint64_t successes() const noexcept {
        return count(extract_error::none);
    }
    [[nodiscard]] std::uint64_t failures() const noexcept {
        return calls - successes();
    }
};

/**
 * Lock-free counters: call count, per-outcome counts, total and maximum
 * latency.
 */
class FILE_ICON_EXPORT counting_metrics : public metrics_sink {
public:
    counting_metrics() = default;

    counting_metrics(const counting_metrics&) = delete;
    counting_metrics& operator=(const counting_metrics&) = delete;

    void record(const extract_event& event) noexcept override;

    [[nodiscard]] metrics_snapshot snapshot() const noexcept;

    void reset() noexcept;

private:
    std::atomic<std::uint64_t> calls_{0};
    std::array<std::atomic<std::uint64_t>, EXTRACT_ERROR_COUNT> outcomes_{};
    std::atomic<std::int64_t> total_latency_ns_{0};
    std::atomic<std::int64_t> max_latency_ns_{0};
};

} // namespace file_icon

#endif // FILE_ICON_METRICS_HPP_
