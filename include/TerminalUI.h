#pragma once
#include "AnalysisPipeline.h"
#include "FeedRecords.h"
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printStatisticsTable(const StatisticsSummary& summary);
    static void printHistogram(const HistogramBinSet& histogram);
    static void printDiagnostics(const Diagnostics& diagnostics, bool verbose);

    // Selector choices found in the data, printed for --list-options.
    static void printFilterOptions(const std::vector<IngredientRecord>& records);
};
