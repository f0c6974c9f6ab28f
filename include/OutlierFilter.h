#pragma once

#include "FeedRecords.h"

#include <cstddef>
#include <vector>

enum class OutlierMode {
    UPPER_ONLY, // drop values above the upper fence only
    TWO_SIDED   // drop values outside [lower, upper]
};

enum class QuantileMethod {
    LINEAR,      // position q*(n-1) over the sorted sample, interpolated between neighbours
    TUKEY_HINGES // medians of the lower and upper halves, median included in both for odd n
};

struct OutlierOptions {
    OutlierMode mode = OutlierMode::UPPER_ONLY;
    QuantileMethod quantiles = QuantileMethod::LINEAR;
    double iqrMultiplier = 1.5;
};

struct OutlierBounds {
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double lowerBound = 0.0;
    double upperBound = 0.0;
    size_t sampleCount = 0;
};

class OutlierFilter {
public:
    /**
     * @brief Tukey fences over `values`.
     * @post Empty input yields all-zero bounds; small samples use whatever quantiles exist.
     *       upperBound >= q3 always holds since iqr >= 0.
     */
    static OutlierBounds bounds(const std::vector<double>& values, const OutlierOptions& options = OutlierOptions{});

    static bool isOutlier(double value, const OutlierBounds& bounds, OutlierMode mode);

    /**
     * @brief Returns `values` without the outliers, preserving order.
     * @post Nothing is dropped when iqr is zero.
     */
    static std::vector<double> exclude(const std::vector<double>& values,
                                       const OutlierBounds& bounds,
                                       OutlierMode mode);

    // Same fences computed over weightedAvgPct, applied to whole aggregates.
    static std::vector<BatchAggregate> excludeAggregates(const std::vector<BatchAggregate>& aggregates,
                                                         const OutlierOptions& options,
                                                         OutlierBounds* boundsOut = nullptr);

    static std::vector<double> quartiles(const std::vector<double>& sorted, QuantileMethod method);
};
