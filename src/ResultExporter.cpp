#include "ResultExporter.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FeedMixExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#ifdef FEEDMIX_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
std::string formatValue(double v) {
    return CommonUtils::formatFixed(v, 6);
}

#ifdef FEEDMIX_USE_NATIVE_PARQUET
template <typename Builder>
bool finishColumn(Builder& builder,
                  const std::string& name,
                  const std::shared_ptr<arrow::DataType>& type,
                  std::vector<std::shared_ptr<arrow::Field>>& fields,
                  std::vector<std::shared_ptr<arrow::Array>>& arrays,
                  std::string& errorOut) {
    std::shared_ptr<arrow::Array> arr;
    auto status = builder.Finish(&arr);
    if (!status.ok()) {
        errorOut = "Failed to finalize Arrow array for column '" + name + "': " + status.ToString();
        return false;
    }
    fields.push_back(arrow::field(name, type, false));
    arrays.push_back(arr);
    return true;
}

bool exportParquetNative(const AnalysisResult& result,
                         const AnalysisRequest& request,
                         const std::string& parquetPath,
                         std::string& errorOut) {
    const SummaryOptions bandOptions = AnalysisPipeline::summaryOptions(request);

    arrow::StringBuilder batchCodes;
    arrow::DoubleBuilder weightedAvg;
    arrow::Date32Builder dates;
    arrow::StringBuilder operators;
    arrow::StringBuilder diets;
    arrow::DoubleBuilder adjustedQty;
    arrow::DoubleBuilder contributions;
    arrow::Int64Builder ingredientCounts;
    arrow::StringBuilder bands;

    for (const auto& agg : result.aggregates) {
        const bool ok = batchCodes.Append(agg.batchCode).ok() &&
                        weightedAvg.Append(agg.weightedAvgPct).ok() &&
                        dates.Append(static_cast<int32_t>(agg.date.daysSinceEpoch())).ok() &&
                        operators.Append(agg.operatorName).ok() &&
                        diets.Append(agg.dietName).ok() &&
                        adjustedQty.Append(agg.totalAdjustedQty).ok() &&
                        contributions.Append(agg.totalContribution).ok() &&
                        ingredientCounts.Append(static_cast<int64_t>(agg.ingredientCount)).ok() &&
                        bands.Append(ResultExporter::deviationBand(agg.weightedAvgPct,
                                                                   request.toleranceThreshold,
                                                                   bandOptions)).ok();
        if (!ok) {
            errorOut = "Failed to append values for batch '" + agg.batchCode + "'";
            return false;
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    if (!finishColumn(batchCodes, "batch_code", arrow::utf8(), fields, arrays, errorOut) ||
        !finishColumn(weightedAvg, "weighted_avg_pct", arrow::float64(), fields, arrays, errorOut) ||
        !finishColumn(dates, "date", arrow::date32(), fields, arrays, errorOut) ||
        !finishColumn(operators, "operator", arrow::utf8(), fields, arrays, errorOut) ||
        !finishColumn(diets, "diet_name", arrow::utf8(), fields, arrays, errorOut) ||
        !finishColumn(adjustedQty, "total_adjusted_qty", arrow::float64(), fields, arrays, errorOut) ||
        !finishColumn(contributions, "total_contribution", arrow::float64(), fields, arrays, errorOut) ||
        !finishColumn(ingredientCounts, "ingredient_count", arrow::int64(), fields, arrays, errorOut) ||
        !finishColumn(bands, "deviation_band", arrow::utf8(), fields, arrays, errorOut)) {
        return false;
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(result.aggregates.size()));

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, static_cast<int64_t>(result.aggregates.size()));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif
} // namespace

ResultExporter::ResultExporter(std::string outputDir) : outputDir_(std::move(outputDir)) {
    std::error_code ec;
    std::filesystem::create_directories(outputDir_, ec);
    if (ec) {
        throw FeedMix::IOException("Unable to create output directory '" + outputDir_ + "': " + ec.message());
    }
}

std::string ResultExporter::pathFor(const std::string& fileName) const {
    return (std::filesystem::path(outputDir_) / fileName).string();
}

void ResultExporter::writeCsv(std::ostream& out, const ExportTable& table) {
    auto writeRow = [&](const std::vector<std::string>& row) {
        for (size_t c = 0; c < row.size(); ++c) {
            if (c) out << ',';
            out << CSVUtils::escapeField(row[c]);
        }
        out << '\n';
    };
    writeRow(table.header);
    for (const auto& row : table.rows) writeRow(row);
}

std::string ResultExporter::writeTable(const std::string& fileName, const ExportTable& table) const {
    const std::string path = pathFor(fileName);
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw FeedMix::IOException("Unable to write " + fileName + ": " + path);
    }
    writeCsv(out, table);
    if (!out) {
        throw FeedMix::IOException("Write failed for " + path);
    }
    return path;
}

std::string ResultExporter::deviationBand(double weightedAvgPct,
                                          double toleranceThreshold,
                                          const SummaryOptions& options) {
    const int idx = StatisticsSummarizer::bucketIndex(weightedAvgPct, toleranceThreshold, options);
    if (idx < 0) return "within-tolerance";
    return StatisticsSummarizer::bucketLabel(static_cast<size_t>(idx), toleranceThreshold, options);
}

ExportTable ResultExporter::processedBatchTable(const AnalysisResult& result, const AnalysisRequest& request) {
    const SummaryOptions bandOptions = AnalysisPipeline::summaryOptions(request);

    ExportTable table;
    table.header = {"batch_code", "weighted_avg_pct", "date", "operator", "diet_name",
                    "total_adjusted_qty", "total_contribution", "ingredient_count",
                    "deviation_band", "outlier"};
    table.rows.reserve(result.aggregates.size());
    for (const auto& agg : result.aggregates) {
        const bool outlier = OutlierFilter::isOutlier(agg.weightedAvgPct, result.summary.bounds, request.outliers.mode);
        table.rows.push_back({agg.batchCode,
                              formatValue(agg.weightedAvgPct),
                              agg.date.toIsoString(),
                              agg.operatorName,
                              agg.dietName,
                              formatValue(agg.totalAdjustedQty),
                              formatValue(agg.totalContribution),
                              std::to_string(agg.ingredientCount),
                              deviationBand(agg.weightedAvgPct, request.toleranceThreshold, bandOptions),
                              outlier ? "true" : "false"});
    }
    return table;
}

ExportTable ResultExporter::histogramTable(const HistogramBinSet& histogram) {
    ExportTable table;
    table.header = {"lower_edge", "upper_edge", "count", "color_class", "intensity", "fill_color"};
    for (const auto& bin : histogram.bins) {
        table.rows.push_back({formatValue(bin.lowerEdge),
                              formatValue(bin.upperEdge),
                              std::to_string(bin.count),
                              HistogramBinner::colorClassName(bin.colorClass),
                              CommonUtils::formatFixed(bin.intensity, 4),
                              HistogramBinner::fillColor(bin)});
    }
    return table;
}

std::string ResultExporter::writeStatistics(const StatisticsSummary& summary) const {
    return writeTable("statistics.csv", StatisticsSummarizer::toExportTable(summary));
}

std::string ResultExporter::writeProcessedBatches(const AnalysisResult& result, const AnalysisRequest& request) const {
    return writeTable("processed_batches.csv", processedBatchTable(result, request));
}

std::string ResultExporter::writeHistogramBins(const HistogramBinSet& histogram) const {
    return writeTable("histogram_bins.csv", histogramTable(histogram));
}

std::string ResultExporter::writeProcessedBatchesParquet(const AnalysisResult& result,
                                                         const AnalysisRequest& request) const {
    const std::string parquetPath = pathFor("processed_batches.parquet");
#ifdef FEEDMIX_USE_NATIVE_PARQUET
    std::string parquetError;
    if (!exportParquetNative(result, request, parquetPath, parquetError)) {
        std::cerr << "[FeedMix][Warning] Native parquet export failed: " << parquetError
                  << ". CSV export is available at " << pathFor("processed_batches.csv") << "\n";
        return "";
    }
    return parquetPath;
#else
    (void)result;
    (void)request;
    std::cerr << "[FeedMix][Warning] Parquet export requested, but this build was compiled without native parquet support. "
              << "Rebuild with FEEDMIX_USE_NATIVE_PARQUET=ON. CSV export is available at "
              << pathFor("processed_batches.csv") << "\n";
    return "";
#endif
}
