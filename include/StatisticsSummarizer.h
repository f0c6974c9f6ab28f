#pragma once

#include "FeedRecords.h"
#include "OutlierFilter.h"

#include <cstddef>
#include <string>
#include <vector>

struct RangeBucket {
    std::string label;
    double lower = 0.0;
    double upper = 0.0; // +inf for the open-ended last bucket
    size_t count = 0;
    double percent = 0.0;
};

/**
 * @brief Statistics over one basis (all batches, or batches left after outlier exclusion).
 * @details Bucket percentages use this basis' own count as denominator.
 */
struct SummaryBasis {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::vector<RangeBucket> buckets;
};

struct StatisticsSummary {
    SummaryBasis withOutliers;
    SummaryBasis withoutOutliers;
    OutlierBounds bounds;
    double toleranceThreshold = 0.0;

    size_t countWith() const noexcept { return withOutliers.count; }
    size_t countWithout() const noexcept { return withoutOutliers.count; }
    size_t excludedCount() const noexcept { return withOutliers.count - withoutOutliers.count; }
};

struct SummaryOptions {
    double bucketWidth = 2.0;
    size_t bucketCount = 3;
    OutlierOptions outliers;
};

struct ExportTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

class StatisticsSummarizer {
public:
    /**
     * @brief Count, mean, median, quartiles and range buckets with and without outliers.
     * @details Buckets are [t, t+w), [t+w, t+2w), ..., with the last one open-ended, where t is the
     *          tolerance threshold and w the bucket width.
     * @post Empty input gives zero counts and empty bucket tables for both bases.
     */
    static StatisticsSummary summarize(const std::vector<BatchAggregate>& aggregates,
                                       double toleranceThreshold,
                                       const SummaryOptions& options = SummaryOptions{});

    static SummaryBasis describe(const std::vector<double>& values,
                                 double toleranceThreshold,
                                 const SummaryOptions& options);

    /**
     * @brief Index of the range bucket holding `value`, or -1 when it is below the threshold.
     */
    static int bucketIndex(double value, double toleranceThreshold, const SummaryOptions& options);
    static std::string bucketLabel(size_t index, double toleranceThreshold, const SummaryOptions& options);

    // One row per metric, "With outliers" / "Without outliers" columns.
    static ExportTable toExportTable(const StatisticsSummary& summary);
    static ExportTable bucketTable(const SummaryBasis& basis);
};
