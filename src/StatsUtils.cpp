#include "StatsUtils.h"

#include <algorithm>
#include <iterator>
#include <cmath>
#include <numeric>

namespace StatsUtils {
double runningMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    if (lo == hi) return sorted[lo];
    return sorted[lo] + (sorted[hi] - sorted[lo]) * t;
}

double medianSorted(const std::vector<double>& sorted) {
    if (sorted.empty()) return 0.0;
    const size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 0) return (sorted[mid - 1] + sorted[mid]) / 2.0;
    return sorted[mid];
}

std::vector<double> sortedFinite(const std::vector<double>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(out), [](double v) {
        return std::isfinite(v);
    });
    std::sort(out.begin(), out.end());
    return out;
}
}
