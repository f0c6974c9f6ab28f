#pragma once

#include "AnalysisPipeline.h"
#include "CSVUtils.h"
#include "RecordNormalizer.h"

#include <string>
#include <utility>
#include <vector>

struct PlotConfig {
    std::string format = "png";
    int width = 1280;
    int height = 720;
    std::string theme = "light";
    bool showGrid = true;
    double lineWidth = 1.5;
};

/**
 * @brief Everything the CLI and the HTTP service need for one analysis run.
 * @details Built from a loose YAML file, command-line flags, or HTTP query parameters.
 *          Every source funnels through assign() so the key set is identical everywhere.
 */
struct AnalysisConfig {
    std::string datasetPath;
    std::string outputDir = "feedmix_output";

    CSVUtils::TableLoadOptions table;
    ColumnMapping columns;
    NormalizerOptions normalizer;
    AnalysisRequest request;

    bool plot = true;
    PlotConfig plotConfig;
    bool exportParquet = false;
    bool listOptions = false;
    bool verbose = false;

    bool serve = false;
    std::string host = "127.0.0.1";
    int port = 8080;

    /**
     * @brief Parses `feedmix <dataset.csv> [options]` or `feedmix --serve [options]`.
     * @details A --config file is applied first; flags given on the command line override it.
     *          Repeated --operator/--food/--diet/--weight flags accumulate.
     * @throws FeedMix::ConfigurationException on unknown flags, bad values or a failed validate().
     */
    static AnalysisConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Reads loose YAML (`key: value`) or JSON-ish (`"key": "value",`) lines over `base`.
     * @details `weights:` and `columns:` open sections whose indented entries become
     *          `weight.<food type>` and `column.<field>` keys.
     * @throws FeedMix::ConfigurationException naming the offending line.
     */
    static AnalysisConfig fromFile(const std::string& configPath, const AnalysisConfig& base);
    static AnalysisConfig fromFile(const std::string& configPath);

    // Applies one normalized key. Throws FeedMix::ConfigurationException for unknown keys.
    static void assign(AnalysisConfig& config, const std::string& key, const std::string& value);

    // Adds `value` (comma separated) to the operator/food/diet selection named by `key`.
    // Returns false when `key` is not one of the filter dimensions.
    static bool appendFilterValues(AnalysisConfig& config, const std::string& key, const std::string& value);

    /**
     * @brief Applies command-line style (key, value) pairs in order.
     * @details Keys may carry leading dashes. `weight` takes TYPE=W. The first operator/food/diet
     *          option replaces that selection; later ones add to it.
     */
    static void applyOverrides(AnalysisConfig& config, const std::vector<std::pair<std::string, std::string>>& options);

    static std::string normalizeKey(const std::string& key);
    static std::string usage();

    void validate() const;
};
