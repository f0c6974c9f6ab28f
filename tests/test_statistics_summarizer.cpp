#include "StatisticsSummarizer.h"
#include "TestRecords.h"

#include <gtest/gtest.h>

#include <cmath>

using feedmix_test::batch;

namespace {
std::vector<BatchAggregate> sampleBatches() {
    return {batch("B1", 1.0), batch("B2", 3.0), batch("B3", 4.9), batch("B4", 5.0),
            batch("B5", 6.99), batch("B6", 7.0), batch("B7", 12.0)};
}
} // namespace

TEST(StatisticsSummarizerTest, BucketIndexUsesHalfOpenRanges) {
    const SummaryOptions options;
    EXPECT_EQ(StatisticsSummarizer::bucketIndex(2.999, 3.0, options), -1);
    EXPECT_EQ(StatisticsSummarizer::bucketIndex(3.0, 3.0, options), 0);
    EXPECT_EQ(StatisticsSummarizer::bucketIndex(4.999, 3.0, options), 0);
    EXPECT_EQ(StatisticsSummarizer::bucketIndex(5.0, 3.0, options), 1);
    EXPECT_EQ(StatisticsSummarizer::bucketIndex(7.0, 3.0, options), 2);
    EXPECT_EQ(StatisticsSummarizer::bucketIndex(1000.0, 3.0, options), 2);
}

TEST(StatisticsSummarizerTest, BucketLabelsEndOpen) {
    const SummaryOptions options;
    EXPECT_EQ(StatisticsSummarizer::bucketLabel(0, 3.0, options), "[3.0, 5.0)");
    EXPECT_EQ(StatisticsSummarizer::bucketLabel(1, 3.0, options), "[5.0, 7.0)");
    EXPECT_EQ(StatisticsSummarizer::bucketLabel(2, 3.0, options), "[7.0, +inf)");
}

TEST(StatisticsSummarizerTest, SummarizesBothBases) {
    const StatisticsSummary s = StatisticsSummarizer::summarize(sampleBatches(), 3.0);

    EXPECT_EQ(s.countWith(), 7u);
    EXPECT_EQ(s.countWithout(), 6u);
    EXPECT_EQ(s.excludedCount(), 1u);
    EXPECT_NEAR(s.withOutliers.mean, (1.0 + 3.0 + 4.9 + 5.0 + 6.99 + 7.0 + 12.0) / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(s.withOutliers.median, 5.0);
    EXPECT_DOUBLE_EQ(s.withOutliers.max, 12.0);
    EXPECT_DOUBLE_EQ(s.withoutOutliers.max, 7.0);

    ASSERT_EQ(s.withOutliers.buckets.size(), 3u);
    EXPECT_EQ(s.withOutliers.buckets[0].count, 2u);
    EXPECT_EQ(s.withOutliers.buckets[1].count, 2u);
    EXPECT_EQ(s.withOutliers.buckets[2].count, 2u);
    EXPECT_NEAR(s.withOutliers.buckets[0].percent, 200.0 / 7.0, 1e-9);
    EXPECT_TRUE(std::isinf(s.withOutliers.buckets[2].upper));

    ASSERT_EQ(s.withoutOutliers.buckets.size(), 3u);
    EXPECT_EQ(s.withoutOutliers.buckets[2].count, 1u);
    EXPECT_NEAR(s.withoutOutliers.buckets[0].percent, 100.0 / 3.0, 1e-9);
}

TEST(StatisticsSummarizerTest, TwoSidedModeDropsLowValuesFromSecondBasis) {
    const std::vector<BatchAggregate> batches = {batch("B1", -20.0), batch("B2", 2.0), batch("B3", 3.0),
                                                 batch("B4", 4.0), batch("B5", 5.0), batch("B6", 6.0),
                                                 batch("B7", 30.0)};
    SummaryOptions options;
    options.outliers.mode = OutlierMode::TWO_SIDED;
    const StatisticsSummary s = StatisticsSummarizer::summarize(batches, 3.0, options);

    EXPECT_DOUBLE_EQ(s.bounds.lowerBound, -2.0);
    EXPECT_DOUBLE_EQ(s.bounds.upperBound, 10.0);
    EXPECT_EQ(s.countWith(), 7u);
    EXPECT_EQ(s.countWithout(), 5u);
    EXPECT_DOUBLE_EQ(s.withOutliers.min, -20.0);
    EXPECT_DOUBLE_EQ(s.withoutOutliers.min, 2.0);
    EXPECT_DOUBLE_EQ(s.withoutOutliers.max, 6.0);
    EXPECT_DOUBLE_EQ(s.withoutOutliers.mean, 4.0);
    EXPECT_EQ(s.withoutOutliers.buckets[0].count, 2u);
    EXPECT_EQ(s.withoutOutliers.buckets[1].count, 2u);
    EXPECT_EQ(s.withoutOutliers.buckets[2].count, 0u);

    const StatisticsSummary upperOnly = StatisticsSummarizer::summarize(batches, 3.0);
    EXPECT_EQ(upperOnly.countWithout(), 6u);
    EXPECT_DOUBLE_EQ(upperOnly.withoutOutliers.min, -20.0);
}

TEST(StatisticsSummarizerTest, PercentagesNeverExceedHundred) {
    const StatisticsSummary s = StatisticsSummarizer::summarize(sampleBatches(), 0.0);
    double total = 0.0;
    for (const auto& bucket : s.withOutliers.buckets) total += bucket.percent;
    EXPECT_NEAR(total, 100.0, 1e-9);
}

TEST(StatisticsSummarizerTest, EmptyInputYieldsZeroCountsAndNoBuckets) {
    const StatisticsSummary s = StatisticsSummarizer::summarize({}, 3.0);
    EXPECT_EQ(s.countWith(), 0u);
    EXPECT_EQ(s.countWithout(), 0u);
    EXPECT_TRUE(s.withOutliers.buckets.empty());
    EXPECT_TRUE(s.withoutOutliers.buckets.empty());

    const ExportTable table = StatisticsSummarizer::toExportTable(s);
    ASSERT_FALSE(table.rows.empty());
    EXPECT_EQ(table.rows[0], (std::vector<std::string>{"Batch count", "0", "0"}));
    EXPECT_EQ(table.rows[1][1], "-");
}

TEST(StatisticsSummarizerTest, CustomBucketLayout) {
    SummaryOptions options;
    options.bucketWidth = 5.0;
    options.bucketCount = 2;
    const StatisticsSummary s = StatisticsSummarizer::summarize(sampleBatches(), 2.0, options);
    ASSERT_EQ(s.withOutliers.buckets.size(), 2u);
    EXPECT_EQ(s.withOutliers.buckets[0].label, "[2.0, 7.0)");
    EXPECT_EQ(s.withOutliers.buckets[0].count, 4u);
    EXPECT_EQ(s.withOutliers.buckets[1].count, 2u);
}

TEST(StatisticsSummarizerTest, ExportTableListsMetricsAndBuckets) {
    const StatisticsSummary s = StatisticsSummarizer::summarize(sampleBatches(), 3.0);
    const ExportTable table = StatisticsSummarizer::toExportTable(s);
    EXPECT_EQ(table.header, (std::vector<std::string>{"Statistic", "With outliers", "Without outliers"}));
    EXPECT_EQ(table.rows[0], (std::vector<std::string>{"Batch count", "7", "6"}));

    bool sawBucket = false;
    for (const auto& row : table.rows) {
        if (row[0] == "Batches in [7.0, +inf)") {
            EXPECT_EQ(row[1], "2");
            EXPECT_EQ(row[2], "1");
            sawBucket = true;
        }
    }
    EXPECT_TRUE(sawBucket);

    const ExportTable buckets = StatisticsSummarizer::bucketTable(s.withoutOutliers);
    ASSERT_EQ(buckets.rows.size(), 3u);
    EXPECT_EQ(buckets.rows[0], (std::vector<std::string>{"[3.0, 5.0)", "2", "33.3"}));
}
