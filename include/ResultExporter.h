#pragma once

#include "AnalysisPipeline.h"
#include "StatisticsSummarizer.h"

#include <ostream>
#include <string>

/**
 * @brief Writes the tabular artifacts of one run into an output directory.
 * @details File names are fixed: statistics.csv, processed_batches.csv, histogram_bins.csv
 *          and, in Parquet-enabled builds, processed_batches.parquet.
 */
class ResultExporter {
public:
    explicit ResultExporter(std::string outputDir);

    // Each writer returns the path it wrote. Throws FeedMix::IOException when the file cannot be written.
    std::string writeStatistics(const StatisticsSummary& summary) const;
    std::string writeProcessedBatches(const AnalysisResult& result, const AnalysisRequest& request) const;
    std::string writeHistogramBins(const HistogramBinSet& histogram) const;

    /**
     * @brief Native Parquet copy of the processed batch table.
     * @post Returns an empty string, after logging a warning, when the build has no Parquet support
     *       or the write fails. The CSV export is unaffected.
     */
    std::string writeProcessedBatchesParquet(const AnalysisResult& result, const AnalysisRequest& request) const;

    /**
     * @brief "within-tolerance" below the threshold, otherwise the range bucket label.
     * @details Uses the same bucket boundaries as the statistics tables, so a batch's band
     *          always agrees with the bucket it is counted in.
     */
    static std::string deviationBand(double weightedAvgPct, double toleranceThreshold, const SummaryOptions& options);

    static ExportTable processedBatchTable(const AnalysisResult& result, const AnalysisRequest& request);
    static ExportTable histogramTable(const HistogramBinSet& histogram);
    static void writeCsv(std::ostream& out, const ExportTable& table);

    const std::string& outputDir() const { return outputDir_; }

private:
    std::string pathFor(const std::string& fileName) const;
    std::string writeTable(const std::string& fileName, const ExportTable& table) const;

    std::string outputDir_;
};
