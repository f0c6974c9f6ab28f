#include "AnalysisJson.h"
#include "ResultExporter.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace {
std::string quoted(const std::string& value) {
    return "\"" + AnalysisJson::escapeJsonString(value) + "\"";
}

void appendBasis(std::ostringstream& out, const SummaryBasis& basis) {
    using AnalysisJson::formatDouble;
    const bool empty = basis.count == 0;
    out << "{"
        << "\"count\":" << basis.count << ","
        << "\"mean\":" << (empty ? "null" : formatDouble(basis.mean)) << ","
        << "\"median\":" << (empty ? "null" : formatDouble(basis.median)) << ","
        << "\"q1\":" << (empty ? "null" : formatDouble(basis.q1)) << ","
        << "\"q3\":" << (empty ? "null" : formatDouble(basis.q3)) << ","
        << "\"min\":" << (empty ? "null" : formatDouble(basis.min)) << ","
        << "\"max\":" << (empty ? "null" : formatDouble(basis.max)) << ","
        << "\"buckets\":[";
    for (size_t i = 0; i < basis.buckets.size(); ++i) {
        const RangeBucket& b = basis.buckets[i];
        if (i > 0) out << ',';
        out << "{"
            << "\"label\":" << quoted(b.label) << ","
            << "\"lower\":" << formatDouble(b.lower) << ","
            << "\"upper\":" << formatDouble(b.upper) << ","
            << "\"count\":" << b.count << ","
            << "\"percent\":" << formatDouble(b.percent)
            << "}";
    }
    out << "]}";
}
} // namespace

namespace AnalysisJson {
std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

std::string resultToJson(const AnalysisResult& result, const AnalysisRequest& request) {
    const SummaryOptions bandOptions = AnalysisPipeline::summaryOptions(request);
    const StatisticsSummary& summary = result.summary;

    std::ostringstream out;
    out << "{"
        << "\"source_rows\":" << result.sourceRows << ","
        << "\"dropped_rows\":" << result.droppedRows << ","
        << "\"malformed_rows\":" << result.malformedRows << ","
        << "\"input_records\":" << result.inputRecords << ","
        << "\"filtered_records\":" << result.filteredRecords << ","
        << "\"tolerance_threshold\":" << formatDouble(request.toleranceThreshold) << ",";

    out << "\"aggregates\":[";
    for (size_t i = 0; i < result.aggregates.size(); ++i) {
        const BatchAggregate& agg = result.aggregates[i];
        if (i > 0) out << ',';
        out << "{"
            << "\"batch_code\":" << quoted(agg.batchCode) << ","
            << "\"weighted_avg_pct\":" << formatDouble(agg.weightedAvgPct) << ","
            << "\"date\":" << quoted(agg.date.toIsoString()) << ","
            << "\"operator\":" << quoted(agg.operatorName) << ","
            << "\"diet_name\":" << quoted(agg.dietName) << ","
            << "\"total_adjusted_qty\":" << formatDouble(agg.totalAdjustedQty) << ","
            << "\"total_contribution\":" << formatDouble(agg.totalContribution) << ","
            << "\"ingredient_count\":" << agg.ingredientCount << ","
            << "\"deviation_band\":"
            << quoted(ResultExporter::deviationBand(agg.weightedAvgPct, request.toleranceThreshold, bandOptions)) << ","
            << "\"outlier\":"
            << (OutlierFilter::isOutlier(agg.weightedAvgPct, summary.bounds, request.outliers.mode) ? "true" : "false")
            << "}";
    }
    out << "],";

    const HistogramBinSet& histogram = result.histogram;
    out << "\"histogram\":{"
        << "\"bin_width\":" << formatDouble(histogram.binWidth) << ","
        << "\"degenerate\":" << (histogram.degenerate ? "true" : "false") << ","
        << "\"sample_count\":" << result.histogramSampleCount << ","
        << "\"outliers_removed\":" << (request.removeOutliers ? "true" : "false") << ","
        << "\"bins\":[";
    for (size_t i = 0; i < histogram.bins.size(); ++i) {
        const HistogramBin& bin = histogram.bins[i];
        if (i > 0) out << ',';
        out << "{"
            << "\"lower_edge\":" << formatDouble(bin.lowerEdge) << ","
            << "\"upper_edge\":" << formatDouble(bin.upperEdge) << ","
            << "\"count\":" << bin.count << ","
            << "\"color_class\":" << quoted(HistogramBinner::colorClassName(bin.colorClass)) << ","
            << "\"intensity\":" << formatDouble(bin.intensity) << ","
            << "\"fill_color\":" << quoted(HistogramBinner::fillColor(bin))
            << "}";
    }
    out << "]},";

    out << "\"summary\":{"
        << "\"bounds\":{"
        << "\"q1\":" << formatDouble(summary.bounds.q1) << ","
        << "\"q3\":" << formatDouble(summary.bounds.q3) << ","
        << "\"iqr\":" << formatDouble(summary.bounds.iqr) << ","
        << "\"lower_bound\":" << formatDouble(summary.bounds.lowerBound) << ","
        << "\"upper_bound\":" << formatDouble(summary.bounds.upperBound) << ","
        << "\"sample_count\":" << summary.bounds.sampleCount
        << "},"
        << "\"with_outliers\":";
    appendBasis(out, summary.withOutliers);
    out << ",\"without_outliers\":";
    appendBasis(out, summary.withoutOutliers);
    out << "},";

    out << "\"diagnostics\":[";
    const auto& entries = result.diagnostics.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out << ',';
        out << "{"
            << "\"kind\":" << quoted(Diagnostics::kindName(entries[i].kind)) << ","
            << "\"subject\":" << quoted(entries[i].subject) << ","
            << "\"message\":" << quoted(entries[i].message)
            << "}";
    }
    out << "]}";
    return out.str();
}

std::string errorToJson(const std::string& error, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":\"" << escapeJsonString(error) << "\","
        << "\"latency_ms\":" << formatDouble(latencyMs)
        << "}";
    return out.str();
}

AnalysisResult analyzeCsvText(const std::string& csvBody, const AnalysisConfig& config) {
    std::istringstream in(csvBody);
    const CSVUtils::RawTable table = CSVUtils::loadTable(in, config.table);
    return AnalysisPipeline::runTable(table, config.columns, config.normalizer, config.request);
}
} // namespace AnalysisJson
