#include "AnalysisConfig.h"
#include "AnalysisPipeline.h"
#include "CSVUtils.h"
#include "FeedMixExceptions.h"
#include "GnuplotEngine.h"
#include "RecordNormalizer.h"
#include "ReportEngine.h"
#include "ResultExporter.h"
#include "TerminalUI.h"

#ifdef FEEDMIX_ENABLE_SERVICE
#include "AnalysisService.h"
#endif

#include <filesystem>
#include <iostream>
#include <string>

namespace {
int runService(const AnalysisConfig& config) {
#ifdef FEEDMIX_ENABLE_SERVICE
    RequestMonitor monitor;
    AnalysisService service(config, monitor);
    AnalysisService::Config serviceConfig;
    serviceConfig.host = config.host;
    serviceConfig.port = config.port;
    return service.start(serviceConfig);
#else
    (void)config;
    throw FeedMix::ConfigurationException("This build has no HTTP service (configure with FEEDMIX_ENABLE_SERVICE=ON and cpp-httplib)");
#endif
}

std::string renderHistogram(const AnalysisConfig& config, const AnalysisResult& result) {
    if (!config.plot) return "";
    if (result.histogram.empty()) {
        std::cout << "[FeedMix][Plot] No batches to plot.\n";
        return "";
    }

    GnuplotEngine plotter(config.outputDir, config.plotConfig);
    if (!plotter.isAvailable()) {
        std::cerr << "[FeedMix][Warning] gnuplot not found in PATH; skipping histogram image.\n";
        return "";
    }
    const std::string imagePath = plotter.histogram("histogram", result.histogram, "Weighted deviation per batch");
    if (imagePath.empty()) return "";
    return std::filesystem::path(imagePath).filename().string();
}

int runAnalysis(const AnalysisConfig& config) {
    const CSVUtils::RawTable table = CSVUtils::loadTableFile(config.datasetPath, config.table);
    if (config.verbose) {
        std::cout << "[FeedMix] Loaded " << table.rows.size() << " rows, " << table.header.size() << " columns\n";
    }
    if (table.malformedRows > 0) {
        std::cerr << "[FeedMix][Warning] " << table.malformedRows
                  << " row(s) with unbalanced quotes skipped; see diagnostics\n";
    }

    if (config.listOptions) {
        const NormalizationResult normalized = RecordNormalizer::normalize(table, config.columns, config.normalizer);
        TerminalUI::printFilterOptions(normalized.records);
        TerminalUI::printDiagnostics(normalized.diagnostics, config.verbose);
        return 0;
    }

    const AnalysisResult result = AnalysisPipeline::runTable(table, config.columns, config.normalizer, config.request);
    std::cout << "[FeedMix] " << result.filteredRecords << " of " << result.inputRecords
              << " ingredient records selected, " << result.aggregates.size() << " batches aggregated\n";

    TerminalUI::printStatisticsTable(result.summary);
    TerminalUI::printHistogram(result.histogram);
    TerminalUI::printDiagnostics(result.diagnostics, config.verbose);

    ResultExporter exporter(config.outputDir);
    std::cout << "[FeedMix] Wrote " << exporter.writeStatistics(result.summary) << "\n";
    std::cout << "[FeedMix] Wrote " << exporter.writeProcessedBatches(result, config.request) << "\n";
    std::cout << "[FeedMix] Wrote " << exporter.writeHistogramBins(result.histogram) << "\n";
    if (config.exportParquet) {
        const std::string parquetPath = exporter.writeProcessedBatchesParquet(result, config.request);
        if (!parquetPath.empty()) std::cout << "[FeedMix] Wrote " << parquetPath << "\n";
    }

    const std::string imageFile = renderHistogram(config, result);
    const std::string reportPath = (std::filesystem::path(config.outputDir) / "report.md").string();
    ReportEngine::forAnalysis(result, config, imageFile).save(reportPath);
    std::cout << "[FeedMix] Report saved to " << reportPath << "\n";
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            std::cout << AnalysisConfig::usage() << "\n";
            return 0;
        }
    }

    AnalysisConfig config;
    try {
        config = AnalysisConfig::fromArgs(argc, argv);
    } catch (const FeedMix::FeedMixException& e) {
        std::cerr << "[FeedMix][Error] " << e.what() << "\n";
        return 1;
    }

    try {
        if (config.serve) return runService(config);
        return runAnalysis(config);
    } catch (const FeedMix::FeedMixException& e) {
        std::cerr << "[FeedMix][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FeedMix][Exception] " << e.what() << "\n";
        return 1;
    }
}
