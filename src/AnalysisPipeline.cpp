#include "AnalysisPipeline.h"

SummaryOptions AnalysisPipeline::summaryOptions(const AnalysisRequest& request) {
    SummaryOptions options;
    options.bucketWidth = request.bucketWidth;
    options.bucketCount = request.bucketCount;
    options.outliers = request.outliers;
    return options;
}

HistogramOptions AnalysisPipeline::histogramOptions(const AnalysisRequest& request) {
    HistogramOptions options;
    options.quantiles = request.outliers.quantiles;
    options.maxBins = request.maxBins;
    return options;
}

AnalysisResult AnalysisPipeline::run(const std::vector<IngredientRecord>& records, const AnalysisRequest& request) {
    AnalysisResult result;
    result.inputRecords = records.size();

    const std::vector<IngredientRecord> filtered = RecordFilter::apply(records, request.filter);
    result.filteredRecords = filtered.size();
    if (filtered.empty()) {
        result.diagnostics.add(DiagnosticKind::EMPTY_RESULT, "filter", "No records match the selected filters");
    }

    AggregationResult aggregation = WeightedAggregator::aggregate(filtered, request.weights);
    result.diagnostics.append(aggregation.diagnostics);
    result.aggregates = std::move(aggregation.aggregates);
    if (!filtered.empty() && result.aggregates.empty()) {
        result.diagnostics.add(DiagnosticKind::EMPTY_RESULT, "aggregation", "No batch produced a weighted average");
    }

    std::vector<BatchAggregate> histogramSample = request.removeOutliers
        ? OutlierFilter::excludeAggregates(result.aggregates, request.outliers)
        : result.aggregates;
    std::vector<double> values;
    values.reserve(histogramSample.size());
    for (const auto& agg : histogramSample) values.push_back(agg.weightedAvgPct);

    result.histogramSampleCount = values.size();
    result.histogram = HistogramBinner::bins(values, request.toleranceThreshold, histogramOptions(request));
    result.summary = StatisticsSummarizer::summarize(result.aggregates, request.toleranceThreshold, summaryOptions(request));
    return result;
}

AnalysisResult AnalysisPipeline::runTable(const CSVUtils::RawTable& table,
                                          const ColumnMapping& mapping,
                                          const NormalizerOptions& normalizerOptions,
                                          const AnalysisRequest& request) {
    NormalizationResult normalized = RecordNormalizer::normalize(table, mapping, normalizerOptions);

    AnalysisResult result = run(normalized.records, request);
    result.sourceRows = normalized.sourceRows;
    result.droppedRows = normalized.droppedRows;
    result.malformedRows = normalized.malformedRows;

    Diagnostics ordered = normalized.diagnostics;
    ordered.append(result.diagnostics);
    result.diagnostics = std::move(ordered);
    return result;
}
