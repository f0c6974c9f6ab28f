#include "TerminalUI.h"
#include "CommonUtils.h"
#include "RecordFilter.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
// Restores std::cout formatting when a printer returns.
class CoutFormatGuard {
public:
    CoutFormatGuard() : flags_(std::cout.flags()), precision_(std::cout.precision()) {}
    ~CoutFormatGuard() {
        std::cout.flags(flags_);
        std::cout.precision(precision_);
    }
    CoutFormatGuard(const CoutFormatGuard&) = delete;
    CoutFormatGuard& operator=(const CoutFormatGuard&) = delete;

private:
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

void printOptionList(const std::string& label, const std::vector<std::string>& values) {
    std::cout << "  " << std::left << std::setw(12) << label << "(" << values.size() << ")\n";
    for (const auto& v : values) std::cout << "      - " << v << "\n";
}
} // namespace

void TerminalUI::printStatisticsTable(const StatisticsSummary& summary) {
    const CoutFormatGuard guard;
    const ExportTable table = StatisticsSummarizer::toExportTable(summary);

    size_t labelWidth = 20;
    for (const auto& row : table.rows) labelWidth = std::max(labelWidth, row[0].size());
    const int w = static_cast<int>(labelWidth) + 2;

    std::cout << "\n=============================== BATCH DEVIATION SUMMARY ===============================\n";
    std::cout << std::left << std::setw(w) << table.header[0]
              << std::right << std::setw(18) << table.header[1]
              << std::setw(20) << table.header[2] << "\n";
    std::cout << std::string(static_cast<size_t>(w) + 38, '-') << "\n";
    for (const auto& row : table.rows) {
        std::cout << std::left << std::setw(w) << row[0]
                  << std::right << std::setw(18) << row[1]
                  << std::setw(20) << row[2] << "\n";
    }
    std::cout << "=======================================================================================\n";
}

void TerminalUI::printHistogram(const HistogramBinSet& histogram) {
    if (histogram.empty()) {
        std::cout << "[FeedMix] Histogram: no batches to plot.\n";
        return;
    }
    const CoutFormatGuard guard;
    size_t peak = 1;
    for (const auto& bin : histogram.bins) peak = std::max(peak, bin.count);

    std::cout << "\n[FeedMix] Histogram (" << histogram.bins.size() << " bins, tolerance "
              << CommonUtils::formatFixed(histogram.toleranceThreshold, 1) << "%)\n";
    for (const auto& bin : histogram.bins) {
        const size_t barLen = (bin.count * 40 + peak - 1) / peak;
        std::cout << "  [" << std::right << std::setw(8) << CommonUtils::formatFixed(bin.lowerEdge, 2)
                  << ", " << std::setw(8) << CommonUtils::formatFixed(bin.upperEdge, 2) << ") "
                  << std::setw(5) << bin.count << " "
                  << (bin.colorClass == BinColorClass::ABOVE_TOLERANCE ? '!' : ' ') << " "
                  << std::string(barLen, '#') << "\n";
    }
}

void TerminalUI::printDiagnostics(const Diagnostics& diagnostics, bool verbose) {
    if (diagnostics.empty()) return;
    const DiagnosticKind kinds[] = {DiagnosticKind::COERCION_WARNING,
                                    DiagnosticKind::DIVISION_UNDEFINED,
                                    DiagnosticKind::EMPTY_RESULT};
    for (DiagnosticKind kind : kinds) {
        const size_t n = diagnostics.count(kind);
        if (n > 0) {
            std::cerr << "[FeedMix][Warning] " << Diagnostics::kindName(kind) << ": " << n << " entr"
                      << (n == 1 ? "y" : "ies") << "\n";
        }
    }
    if (!verbose) return;
    for (const auto& d : diagnostics.entries()) {
        std::cerr << "        -> [" << Diagnostics::kindName(d.kind) << "] " << d.subject << ": " << d.message << "\n";
    }
}

void TerminalUI::printFilterOptions(const std::vector<IngredientRecord>& records) {
    const CoutFormatGuard guard;
    std::cout << "\n[FeedMix] Filter options in dataset (" << records.size() << " records)\n";
    const auto span = RecordFilter::dateSpan(records);
    if (span) {
        std::cout << "  " << std::left << std::setw(12) << "Period" << span->first.toIsoString()
                  << " .. " << span->second.toIsoString() << "\n";
    }
    printOptionList("Operators", RecordFilter::distinctValues(records, FilterDimension::OPERATOR));
    printOptionList("Foods", RecordFilter::distinctValues(records, FilterDimension::FOOD));
    printOptionList("Diets", RecordFilter::distinctValues(records, FilterDimension::DIET));
    printOptionList("Food types", RecordFilter::distinctValues(records, FilterDimension::FOOD_TYPE));
}
