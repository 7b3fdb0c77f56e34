/// @file sim_metrics.cpp
/// @brief In-memory implementation of SimMetrics.
///
/// Counters use atomics after creation; gauges and histograms are guarded
/// by their own mutexes.

#include "wbs/foundation/sim_metrics.hpp"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>

namespace wbs::foundation {

HistogramBuckets HistogramBuckets::batchDuration() {
    return HistogramBuckets{{10, 50, 100, 250, 500, 1000, 2500, 5000, 10000}};
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // one per boundary + 1 for +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct SimMetrics::Impl {
    // std::map keeps scrape() output in a stable order.
    mutable std::mutex counterMutex;
    std::map<std::string, std::atomic<uint64_t>, std::less<>> counters;

    mutable std::mutex gaugeMutex;
    std::map<std::string, double, std::less<>> gauges;

    mutable std::mutex histogramMutex;
    std::map<std::string, HistogramData, std::less<>> histograms;
};

SimMetrics::SimMetrics() : impl_(std::make_unique<Impl>()) {}

SimMetrics::~SimMetrics() = default;

SimMetrics::SimMetrics(SimMetrics&&) noexcept = default;

SimMetrics& SimMetrics::operator=(SimMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void SimMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        it = impl_->counters.try_emplace(std::string(name), 0).first;
    }
    it->second.fetch_add(value, std::memory_order_relaxed);
}

uint64_t SimMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        return 0;
    }
    return it->second.load(std::memory_order_relaxed);
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void SimMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges[std::string(name)] = value;
}

double SimMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

// ── Histograms ──────────────────────────────────────────────────────────────

void SimMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->histogramMutex);
    if (impl_->histograms.find(name) == impl_->histograms.end()) {
        impl_->histograms.emplace(std::string(name), HistogramData(std::move(buckets.boundaries)));
    }
}

void SimMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(name);
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

uint64_t SimMetrics::histogramCount(std::string_view name) const {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(name);
    return it == impl_->histograms.end() ? 0 : it->second.totalCount;
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string SimMetrics::scrape() const {
    std::ostringstream out;

    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [name, value] : impl_->counters) {
            out << "# TYPE " << name << " counter\n";
            out << name << " " << value.load(std::memory_order_relaxed) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->gaugeMutex);
        for (const auto& [name, value] : impl_->gauges) {
            out << "# TYPE " << name << " gauge\n";
            out << name << " " << formatDouble(value) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->histogramMutex);
        for (const auto& [name, data] : impl_->histograms) {
            out << "# TYPE " << name << " histogram\n";
            for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
                out << name << "_bucket{le=\"" << formatDouble(data.boundaries[i]) << "\"} "
                    << data.bucketCounts[i] << "\n";
            }
            out << name << "_bucket{le=\"+Inf\"} " << data.bucketCounts.back() << "\n";
            out << name << "_sum " << formatDouble(data.totalSum) << "\n";
            out << name << "_count " << data.totalCount << "\n";
        }
    }

    return out.str();
}

void SimMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
    {
        std::lock_guard lock(impl_->histogramMutex);
        impl_->histograms.clear();
    }
}

SimMetrics& SimMetrics::instance() {
    static SimMetrics inst;
    return inst;
}

} // namespace wbs::foundation
