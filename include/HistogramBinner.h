#pragma once

#include "OutlierFilter.h"

#include <cstddef>
#include <string>
#include <vector>

enum class BinColorClass { WITHIN_TOLERANCE, ABOVE_TOLERANCE };

struct HistogramBin {
    double lowerEdge = 0.0;
    double upperEdge = 0.0;
    size_t count = 0;
    BinColorClass colorClass = BinColorClass::WITHIN_TOLERANCE;
    // 0..1; above tolerance grows with distance past the threshold, within tolerance grows toward zero.
    double intensity = 0.0;

    double midpoint() const { return (lowerEdge + upperEdge) / 2.0; }
};

struct HistogramBinSet {
    std::vector<HistogramBin> bins;
    double binWidth = 0.0;
    double toleranceThreshold = 0.0;
    bool degenerate = false;

    size_t totalCount() const;
    bool empty() const noexcept { return bins.empty(); }
};

struct HistogramOptions {
    QuantileMethod quantiles = QuantileMethod::LINEAR;
    size_t maxBins = 100;
    // Half-width of the single bin used when the Freedman-Diaconis width collapses to zero.
    double degenerateMargin = 0.5;
};

class HistogramBinner {
public:
    /**
     * @brief Freedman-Diaconis binning of `values` with tolerance-based color classes.
     * @details width = 2 * IQR * n^(-1/3); count = ceil((max - min) / width), at least 1, at most maxBins.
     *          Edges start at the sample minimum. The last bin is closed on the right.
     * @post Bin counts sum to the number of finite input values. Empty input yields an empty set.
     */
    static HistogramBinSet bins(const std::vector<double>& values,
                                double toleranceThreshold,
                                const HistogramOptions& options = HistogramOptions{});

    static double freedmanDiaconisWidth(const std::vector<double>& sorted, QuantileMethod method);

    static const char* colorClassName(BinColorClass colorClass);

    // "#rrggbb" fill for a bin: red family above tolerance, green family within.
    static std::string fillColor(const HistogramBin& bin);
};
