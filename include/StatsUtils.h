#pragma once

#include <vector>

namespace StatsUtils {
double runningMean(const std::vector<double>& values);

// Linear interpolation between closest ranks: position q*(n-1) over the sorted sample.
double percentileSorted(const std::vector<double>& sorted, double q);
double medianSorted(const std::vector<double>& sorted);

// Copy of `values` without non-finite entries, sorted ascending.
std::vector<double> sortedFinite(const std::vector<double>& values);
}
