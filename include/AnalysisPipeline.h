#pragma once

#include "CSVUtils.h"
#include "FeedRecords.h"
#include "HistogramBinner.h"
#include "OutlierFilter.h"
#include "RecordFilter.h"
#include "RecordNormalizer.h"
#include "StatisticsSummarizer.h"
#include "WeightedAggregator.h"

#include <cstddef>
#include <vector>

/**
 * @brief Everything one analysis run depends on. Nothing is read from ambient configuration.
 */
struct AnalysisRequest {
    FilterCriteria filter;
    RelativeWeightMap weights;
    double toleranceThreshold = 3.0;
    // Drop upper outliers from the histogram sample; the summary always reports both bases.
    bool removeOutliers = false;
    OutlierOptions outliers;
    double bucketWidth = 2.0;
    size_t bucketCount = 3;
    size_t maxBins = 100;
};

struct AnalysisResult {
    size_t sourceRows = 0;
    size_t droppedRows = 0;
    size_t malformedRows = 0;
    size_t inputRecords = 0;
    size_t filteredRecords = 0;
    std::vector<BatchAggregate> aggregates;
    size_t histogramSampleCount = 0;
    HistogramBinSet histogram;
    StatisticsSummary summary;
    Diagnostics diagnostics;
};

class AnalysisPipeline {
public:
    /**
     * @brief Filter -> aggregate -> {histogram, summary} over already normalized records.
     * @post `records` is not modified. Recoverable problems land in result.diagnostics.
     */
    static AnalysisResult run(const std::vector<IngredientRecord>& records, const AnalysisRequest& request);

    /**
     * @brief Normalizes `table` first, then runs the analysis.
     * @throws FeedMix::MissingColumnException when a mapped column is absent.
     */
    static AnalysisResult runTable(const CSVUtils::RawTable& table,
                                   const ColumnMapping& mapping,
                                   const NormalizerOptions& normalizerOptions,
                                   const AnalysisRequest& request);

    static SummaryOptions summaryOptions(const AnalysisRequest& request);
    static HistogramOptions histogramOptions(const AnalysisRequest& request);
};
