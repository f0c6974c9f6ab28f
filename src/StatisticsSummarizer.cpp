#include "StatisticsSummarizer.h"
#include "CommonUtils.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
std::vector<double> weightedValues(const std::vector<BatchAggregate>& aggregates) {
    std::vector<double> values;
    values.reserve(aggregates.size());
    for (const auto& agg : aggregates) values.push_back(agg.weightedAvgPct);
    return values;
}

double bucketLower(size_t index, double t, const SummaryOptions& options) {
    return t + static_cast<double>(index) * options.bucketWidth;
}

std::string basisCell(const SummaryBasis& basis, double value, int precision) {
    if (basis.count == 0) return "-";
    return CommonUtils::formatFixed(value, precision);
}
} // namespace

int StatisticsSummarizer::bucketIndex(double value, double toleranceThreshold, const SummaryOptions& options) {
    if (options.bucketCount == 0 || !(value >= toleranceThreshold)) return -1;
    for (size_t i = 0; i + 1 < options.bucketCount; ++i) {
        if (value < bucketLower(i + 1, toleranceThreshold, options)) return static_cast<int>(i);
    }
    return static_cast<int>(options.bucketCount - 1);
}

std::string StatisticsSummarizer::bucketLabel(size_t index, double toleranceThreshold, const SummaryOptions& options) {
    const std::string lo = CommonUtils::formatFixed(bucketLower(index, toleranceThreshold, options), 1);
    if (index + 1 >= options.bucketCount) return "[" + lo + ", +inf)";
    return "[" + lo + ", " + CommonUtils::formatFixed(bucketLower(index + 1, toleranceThreshold, options), 1) + ")";
}

SummaryBasis StatisticsSummarizer::describe(const std::vector<double>& values,
                                            double toleranceThreshold,
                                            const SummaryOptions& options) {
    SummaryBasis basis;
    const std::vector<double> sorted = StatsUtils::sortedFinite(values);
    basis.count = sorted.size();
    if (sorted.empty()) return basis;

    basis.mean = StatsUtils::runningMean(sorted);
    basis.median = StatsUtils::medianSorted(sorted);
    const std::vector<double> q = OutlierFilter::quartiles(sorted, options.outliers.quantiles);
    basis.q1 = q[0];
    basis.q3 = q[1];
    basis.min = sorted.front();
    basis.max = sorted.back();

    basis.buckets.resize(options.bucketCount);
    for (size_t i = 0; i < options.bucketCount; ++i) {
        RangeBucket& bucket = basis.buckets[i];
        bucket.label = bucketLabel(i, toleranceThreshold, options);
        bucket.lower = bucketLower(i, toleranceThreshold, options);
        bucket.upper = (i + 1 < options.bucketCount) ? bucketLower(i + 1, toleranceThreshold, options)
                                                     : std::numeric_limits<double>::infinity();
    }
    for (double v : sorted) {
        const int idx = bucketIndex(v, toleranceThreshold, options);
        if (idx >= 0) ++basis.buckets[static_cast<size_t>(idx)].count;
    }
    for (auto& bucket : basis.buckets) {
        bucket.percent = static_cast<double>(bucket.count) / static_cast<double>(basis.count) * 100.0;
    }
    return basis;
}

StatisticsSummary StatisticsSummarizer::summarize(const std::vector<BatchAggregate>& aggregates,
                                                  double toleranceThreshold,
                                                  const SummaryOptions& options) {
    StatisticsSummary summary;
    summary.toleranceThreshold = toleranceThreshold;

    const std::vector<double> values = weightedValues(aggregates);
    summary.bounds = OutlierFilter::bounds(values, options.outliers);
    const std::vector<double> kept = OutlierFilter::exclude(values, summary.bounds, options.outliers.mode);

    summary.withOutliers = describe(values, toleranceThreshold, options);
    summary.withoutOutliers = describe(kept, toleranceThreshold, options);
    return summary;
}

ExportTable StatisticsSummarizer::toExportTable(const StatisticsSummary& summary) {
    const SummaryBasis& with = summary.withOutliers;
    const SummaryBasis& without = summary.withoutOutliers;

    ExportTable table;
    table.header = {"Statistic", "With outliers", "Without outliers"};
    table.rows.push_back({"Batch count", std::to_string(with.count), std::to_string(without.count)});
    table.rows.push_back({"Weighted mean (%)", basisCell(with, with.mean, 1), basisCell(without, without.mean, 1)});
    table.rows.push_back({"Weighted median (%)", basisCell(with, with.median, 1), basisCell(without, without.median, 1)});
    table.rows.push_back({"Q1 (%)", basisCell(with, with.q1, 2), basisCell(without, without.q1, 2)});
    table.rows.push_back({"Q3 (%)", basisCell(with, with.q3, 2), basisCell(without, without.q3, 2)});
    table.rows.push_back({"Minimum (%)", basisCell(with, with.min, 2), basisCell(without, without.min, 2)});
    table.rows.push_back({"Maximum (%)", basisCell(with, with.max, 2), basisCell(without, without.max, 2)});
    table.rows.push_back({"Upper outlier fence (%)",
                          basisCell(with, summary.bounds.upperBound, 2),
                          "-"});

    for (size_t i = 0; i < with.buckets.size(); ++i) {
        const RangeBucket& w = with.buckets[i];
        const bool hasWithout = i < without.buckets.size();
        table.rows.push_back({"Batches in " + w.label,
                              std::to_string(w.count),
                              hasWithout ? std::to_string(without.buckets[i].count) : "-"});
        table.rows.push_back({"Share in " + w.label + " (%)",
                              CommonUtils::formatFixed(w.percent, 1),
                              hasWithout ? CommonUtils::formatFixed(without.buckets[i].percent, 1) : "-"});
    }
    return table;
}

ExportTable StatisticsSummarizer::bucketTable(const SummaryBasis& basis) {
    ExportTable table;
    table.header = {"Range (%)", "Batches", "Share (%)"};
    for (const auto& bucket : basis.buckets) {
        table.rows.push_back({bucket.label, std::to_string(bucket.count), CommonUtils::formatFixed(bucket.percent, 1)});
    }
    return table;
}
