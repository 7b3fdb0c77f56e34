#pragma once

/// @file sim_metrics.hpp
/// @brief Process-wide run counters, gauges and histograms with
///        Prometheus-compatible text export.
///
/// These are operational numbers about the simulator itself (combats run,
/// attacks resolved, batch wall time). Per-combat balance metrics live in
/// wbs::metrics instead.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wbs::foundation {

/// Well-known metric names emitted by the simulation engine.
namespace metric_names {
inline constexpr std::string_view kCombatsTotal = "wbs_combats_total";
inline constexpr std::string_view kAttacksTotal = "wbs_attacks_total";
inline constexpr std::string_view kHemorrhagesTotal = "wbs_hemorrhages_total";
inline constexpr std::string_view kBatchesFailed = "wbs_batches_failed_total";
inline constexpr std::string_view kLastBatchMeanDamage = "wbs_last_batch_mean_damage";
inline constexpr std::string_view kBatchDurationMs = "wbs_batch_duration_ms";
} // namespace metric_names

/// Bucket upper bounds for histogram metrics.
struct HistogramBuckets {
    /// {10,50,100,250,500,1000,2500,5000,10000} milliseconds.
    static HistogramBuckets batchDuration();

    std::vector<double> boundaries;
};

/// Thread-safe in-memory metric store (PIMPL, non-copyable, movable).
///
/// Example:
/// @code
///   auto& metrics = SimMetrics::instance();
///   metrics.incrementCounter(metric_names::kCombatsTotal, 1000);
///   metrics.setGauge(metric_names::kLastBatchMeanDamage, 84.2);
///   std::cout << metrics.scrape();
/// @endcode
class SimMetrics {
public:
    SimMetrics();
    ~SimMetrics();

    SimMetrics(const SimMetrics&) = delete;
    SimMetrics& operator=(const SimMetrics&) = delete;
    SimMetrics(SimMetrics&&) noexcept;
    SimMetrics& operator=(SimMetrics&&) noexcept;

    /// Increment a counter, creating it on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Current counter value, 0 if unknown.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    void setGauge(std::string_view name, double value);

    /// Current gauge value, 0.0 if unknown.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    /// Register a histogram; a second registration of the same name is ignored.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record into a registered histogram. No-op for unknown names.
    void recordHistogram(std::string_view name, double value);

    /// Number of observations recorded in a histogram.
    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    /// Serialize all metrics in Prometheus text exposition format,
    /// sorted by name within each metric type.
    [[nodiscard]] std::string scrape() const;

    /// Clear everything. Intended for tests.
    void reset();

    static SimMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wbs::foundation
