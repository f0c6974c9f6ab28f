#include "OutlierFilter.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace {
std::vector<double> weightedValues(const std::vector<BatchAggregate>& aggregates) {
    std::vector<double> values;
    values.reserve(aggregates.size());
    for (const auto& agg : aggregates) values.push_back(agg.weightedAvgPct);
    return values;
}
} // namespace

std::vector<double> OutlierFilter::quartiles(const std::vector<double>& sorted, QuantileMethod method) {
    if (sorted.empty()) return {0.0, 0.0};
    if (method == QuantileMethod::LINEAR) {
        return {StatsUtils::percentileSorted(sorted, 0.25), StatsUtils::percentileSorted(sorted, 0.75)};
    }

    const size_t n = sorted.size();
    const size_t half = (n + 1) / 2;
    const std::vector<double> lower(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(half));
    const std::vector<double> upper(sorted.begin() + static_cast<std::ptrdiff_t>(n - half), sorted.end());
    return {StatsUtils::medianSorted(lower), StatsUtils::medianSorted(upper)};
}

OutlierBounds OutlierFilter::bounds(const std::vector<double>& values, const OutlierOptions& options) {
    OutlierBounds b;
    const std::vector<double> sorted = StatsUtils::sortedFinite(values);
    b.sampleCount = sorted.size();
    if (sorted.empty()) return b;

    const std::vector<double> q = quartiles(sorted, options.quantiles);
    b.q1 = q[0];
    b.q3 = q[1];
    b.iqr = std::max(0.0, b.q3 - b.q1);
    b.upperBound = b.q3 + options.iqrMultiplier * b.iqr;
    b.lowerBound = b.q1 - options.iqrMultiplier * b.iqr;
    return b;
}

bool OutlierFilter::isOutlier(double value, const OutlierBounds& bounds, OutlierMode mode) {
    if (bounds.iqr <= 0.0) return false;
    if (value > bounds.upperBound) return true;
    return mode == OutlierMode::TWO_SIDED && value < bounds.lowerBound;
}

std::vector<double> OutlierFilter::exclude(const std::vector<double>& values,
                                           const OutlierBounds& bounds,
                                           OutlierMode mode) {
    std::vector<double> out;
    out.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(out), [&](double v) {
        return !isOutlier(v, bounds, mode);
    });
    return out;
}

std::vector<BatchAggregate> OutlierFilter::excludeAggregates(const std::vector<BatchAggregate>& aggregates,
                                                             const OutlierOptions& options,
                                                             OutlierBounds* boundsOut) {
    const OutlierBounds b = bounds(weightedValues(aggregates), options);
    if (boundsOut) *boundsOut = b;

    std::vector<BatchAggregate> out;
    out.reserve(aggregates.size());
    std::copy_if(aggregates.begin(), aggregates.end(), std::back_inserter(out), [&](const BatchAggregate& agg) {
        return !isOutlier(agg.weightedAvgPct, b, options.mode);
    });
    return out;
}
