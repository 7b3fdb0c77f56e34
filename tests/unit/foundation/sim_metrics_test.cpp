#include <gtest/gtest.h>

#include <string>

#include "wbs/foundation/sim_metrics.hpp"

using namespace wbs::foundation;

// ---------------------------------------------------------------------------
// Counters and gauges
// ---------------------------------------------------------------------------

TEST(SimMetricsTest, CountersAccumulate) {
    SimMetrics metrics;
    metrics.incrementCounter(metric_names::kCombatsTotal, 1000);
    metrics.incrementCounter(metric_names::kCombatsTotal);
    EXPECT_EQ(metrics.counterValue(metric_names::kCombatsTotal), 1001u);
    EXPECT_EQ(metrics.counterValue("wbs_unknown_total"), 0u);
}

TEST(SimMetricsTest, GaugeHoldsLastValue) {
    SimMetrics metrics;
    metrics.setGauge(metric_names::kLastBatchMeanDamage, 80.5);
    metrics.setGauge(metric_names::kLastBatchMeanDamage, 84.25);
    EXPECT_DOUBLE_EQ(metrics.gaugeValue(metric_names::kLastBatchMeanDamage), 84.25);
}

// ---------------------------------------------------------------------------
// Histograms
// ---------------------------------------------------------------------------

TEST(SimMetricsTest, HistogramRecordsOnlyWhenRegistered) {
    SimMetrics metrics;
    metrics.recordHistogram(metric_names::kBatchDurationMs, 12.0);
    EXPECT_EQ(metrics.histogramCount(metric_names::kBatchDurationMs), 0u);

    metrics.registerHistogram(metric_names::kBatchDurationMs, HistogramBuckets::batchDuration());
    metrics.recordHistogram(metric_names::kBatchDurationMs, 12.0);
    metrics.recordHistogram(metric_names::kBatchDurationMs, 700.0);
    EXPECT_EQ(metrics.histogramCount(metric_names::kBatchDurationMs), 2u);
}

// ---------------------------------------------------------------------------
// Prometheus export
// ---------------------------------------------------------------------------

TEST(SimMetricsTest, ScrapeEmitsPrometheusText) {
    SimMetrics metrics;
    metrics.incrementCounter(metric_names::kAttacksTotal, 5);
    metrics.setGauge(metric_names::kLastBatchMeanDamage, 10.0);
    metrics.registerHistogram(metric_names::kBatchDurationMs, HistogramBuckets::batchDuration());
    metrics.recordHistogram(metric_names::kBatchDurationMs, 30.0);

    auto text = metrics.scrape();
    EXPECT_NE(text.find("# TYPE wbs_attacks_total counter"), std::string::npos);
    EXPECT_NE(text.find("wbs_attacks_total 5"), std::string::npos);
    EXPECT_NE(text.find("# TYPE wbs_last_batch_mean_damage gauge"), std::string::npos);
    EXPECT_NE(text.find("# TYPE wbs_batch_duration_ms histogram"), std::string::npos);
    EXPECT_NE(text.find("wbs_batch_duration_ms_bucket{le=\"+Inf\"} 1"), std::string::npos);
    EXPECT_NE(text.find("wbs_batch_duration_ms_count 1"), std::string::npos);
}

TEST(SimMetricsTest, ResetClearsEverything) {
    SimMetrics metrics;
    metrics.incrementCounter(metric_names::kHemorrhagesTotal, 3);
    metrics.reset();
    EXPECT_EQ(metrics.counterValue(metric_names::kHemorrhagesTotal), 0u);
    EXPECT_TRUE(metrics.scrape().empty());
}
