#include "HistogramBinner.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace {
void classify(HistogramBinSet& set) {
    if (set.bins.empty()) return;
    const double t = set.toleranceThreshold;
    const double lastEdge = set.bins.back().upperEdge;

    for (auto& bin : set.bins) {
        const double mid = bin.midpoint();
        double intensity = 1.0;
        if (mid >= t) {
            bin.colorClass = BinColorClass::ABOVE_TOLERANCE;
            const double span = lastEdge - t;
            if (span > 0.0) intensity = (mid - t) / span;
        } else {
            bin.colorClass = BinColorClass::WITHIN_TOLERANCE;
            if (t > 0.0) intensity = (t - mid) / t;
        }
        bin.intensity = std::clamp(intensity, 0.0, 1.0);
    }
}
} // namespace

size_t HistogramBinSet::totalCount() const {
    size_t total = 0;
    for (const auto& bin : bins) total += bin.count;
    return total;
}

double HistogramBinner::freedmanDiaconisWidth(const std::vector<double>& sorted, QuantileMethod method) {
    if (sorted.empty()) return 0.0;
    const std::vector<double> q = OutlierFilter::quartiles(sorted, method);
    const double iqr = std::max(0.0, q[1] - q[0]);
    return 2.0 * iqr * std::pow(static_cast<double>(sorted.size()), -1.0 / 3.0);
}

HistogramBinSet HistogramBinner::bins(const std::vector<double>& values,
                                      double toleranceThreshold,
                                      const HistogramOptions& options) {
    HistogramBinSet set;
    set.toleranceThreshold = toleranceThreshold;

    const std::vector<double> sorted = StatsUtils::sortedFinite(values);
    if (sorted.empty()) return set;

    const double minV = sorted.front();
    const double maxV = sorted.back();
    const double range = maxV - minV;
    double width = freedmanDiaconisWidth(sorted, options.quantiles);

    if (!(width > 0.0) || !(range > 0.0)) {
        set.degenerate = true;
        HistogramBin only;
        only.lowerEdge = minV - options.degenerateMargin;
        only.upperEdge = maxV + options.degenerateMargin;
        only.count = sorted.size();
        set.binWidth = only.upperEdge - only.lowerEdge;
        set.bins.push_back(only);
        classify(set);
        return set;
    }

    size_t binCount = static_cast<size_t>(std::ceil(range / width));
    binCount = std::max<size_t>(1, binCount);
    const size_t cap = std::max<size_t>(1, options.maxBins);
    if (binCount > cap) {
        binCount = cap;
        width = range / static_cast<double>(cap);
    }
    set.binWidth = width;

    set.bins.resize(binCount);
    for (size_t i = 0; i < binCount; ++i) {
        set.bins[i].lowerEdge = minV + static_cast<double>(i) * width;
        set.bins[i].upperEdge = minV + static_cast<double>(i + 1) * width;
    }
    set.bins.back().upperEdge = std::max(set.bins.back().upperEdge, maxV);

    for (double v : sorted) {
        size_t idx = static_cast<size_t>(std::floor((v - minV) / width));
        if (idx >= binCount) idx = binCount - 1;
        ++set.bins[idx].count;
    }

    classify(set);
    return set;
}

const char* HistogramBinner::colorClassName(BinColorClass colorClass) {
    return colorClass == BinColorClass::ABOVE_TOLERANCE ? "above-tolerance" : "within-tolerance";
}

std::string HistogramBinner::fillColor(const HistogramBin& bin) {
    // Intensity blends from white toward pure red or pure green, matching an alpha ramp on white paper.
    const int fade = static_cast<int>(std::lround(255.0 * (1.0 - bin.intensity)));
    char buf[8];
    if (bin.colorClass == BinColorClass::ABOVE_TOLERANCE) {
        std::snprintf(buf, sizeof(buf), "#ff%02x%02x", fade, fade);
    } else {
        std::snprintf(buf, sizeof(buf), "#%02xff%02x", fade, fade);
    }
    return buf;
}
