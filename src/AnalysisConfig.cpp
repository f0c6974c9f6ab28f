#include "AnalysisConfig.h"
#include "CommonUtils.h"
#include "FeedMixExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <set>
#include <utility>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw FeedMix::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const FeedMix::FeedMixException&) {
        throw;
    } catch (const std::exception& ex) {
        throw FeedMix::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw FeedMix::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw FeedMix::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw FeedMix::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

CalendarDate parseDateStrict(const std::string& value, const std::string& key, CalendarDate::OrderHint hint) {
    CalendarDate date;
    if (!CalendarDate::parse(value, hint, date)) {
        throw FeedMix::ConfigurationException("Invalid date for " + key + ": " + value);
    }
    return date;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string stripTrailingComment(const std::string& line) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        if (!inQuotes && line[i] == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string sectionPrefix(const std::string& section) {
    if (section == "weights" || section == "weight") return "weight.";
    if (section == "columns" || section == "column") return "column.";
    throw FeedMix::ConfigurationException("Unknown configuration section: " + section);
}

bool isIn(const std::string& value, std::initializer_list<const char*> options) {
    return std::any_of(options.begin(), options.end(), [&](const char* option) { return value == option; });
}

std::vector<std::string>* filterList(AnalysisConfig& config, const std::string& key) {
    FilterCriteria& filter = config.request.filter;
    if (key == "operator" || key == "operators") return &filter.operators;
    if (key == "food" || key == "foods") return &filter.foods;
    if (key == "diet" || key == "diets") return &filter.diets;
    return nullptr;
}

void assignColumn(ColumnMapping& columns, const std::string& field, const std::string& header) {
    if (field == "batch_code") columns.batchCode = header;
    else if (field == "food_type") columns.foodType = header;
    else if (field == "food" || field == "food_name") columns.food = header;
    else if (field == "planned_kg") columns.plannedKg = header;
    else if (field == "realized_kg") columns.realizedKg = header;
    else if (field == "pct_difference") columns.pctDifference = header;
    else if (field == "operator") columns.operatorName = header;
    else if (field == "diet_name") columns.dietName = header;
    else if (field == "date") columns.date = header;
    else throw FeedMix::ConfigurationException("Unknown column field: column." + field);
}

NumericLocale parseNumericLocale(const std::string& value) {
    const std::string v = CommonUtils::toLower(value);
    if (v == "auto") return NumericLocale::AUTO;
    if (v == "us") return NumericLocale::US;
    if (v == "eu") return NumericLocale::EUROPEAN;
    throw FeedMix::ConfigurationException("numeric_locale must be one of: auto, us, eu");
}

CalendarDate::OrderHint parseDateOrder(const std::string& value) {
    const std::string v = CommonUtils::toLower(value);
    if (v == "auto") return CalendarDate::OrderHint::AUTO;
    if (v == "dmy") return CalendarDate::OrderHint::DMY;
    if (v == "mdy") return CalendarDate::OrderHint::MDY;
    throw FeedMix::ConfigurationException("date_order must be one of: auto, dmy, mdy");
}

OutlierMode parseOutlierMode(const std::string& value) {
    const std::string v = CommonUtils::toLower(value);
    if (v == "upper" || v == "upper_only") return OutlierMode::UPPER_ONLY;
    if (v == "two_sided" || v == "both") return OutlierMode::TWO_SIDED;
    throw FeedMix::ConfigurationException("outlier_mode must be upper or two_sided");
}

QuantileMethod parseQuantileMethod(const std::string& value) {
    const std::string v = CommonUtils::toLower(value);
    if (v == "linear") return QuantileMethod::LINEAR;
    if (v == "tukey" || v == "tukey_hinges") return QuantileMethod::TUKEY_HINGES;
    throw FeedMix::ConfigurationException("quantile_method must be linear or tukey");
}
} // namespace

std::string AnalysisConfig::normalizeKey(const std::string& rawKey) {
    std::string key = CommonUtils::trim(rawKey);
    while (!key.empty() && key.front() == '-') key.erase(key.begin());

    const std::string lowered = CommonUtils::toLower(key);
    // Food types keep their spelling; they are matched verbatim against the data.
    if (lowered.rfind("weight.", 0) == 0) {
        return "weight." + CommonUtils::trim(key.substr(7));
    }

    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

bool AnalysisConfig::appendFilterValues(AnalysisConfig& config, const std::string& key, const std::string& value) {
    std::vector<std::string>* list = filterList(config, key);
    if (!list) return false;
    for (auto& item : CommonUtils::splitList(value)) list->push_back(std::move(item));
    return true;
}

void AnalysisConfig::assign(AnalysisConfig& config, const std::string& key, const std::string& value) {
    AnalysisRequest& request = config.request;

    if (key.rfind("weight.", 0) == 0) {
        const std::string foodType = key.substr(7);
        if (foodType.empty()) throw FeedMix::ConfigurationException("weight.<food type> requires a food type");
        request.weights.set(foodType, parseDoubleStrict(value, key));
        return;
    }
    if (key.rfind("column.", 0) == 0) {
        if (CommonUtils::trim(value).empty() && key != "column.food") {
            throw FeedMix::ConfigurationException(key + " requires a header name");
        }
        assignColumn(config.columns, key.substr(7), value);
        return;
    }
    if (std::vector<std::string>* list = filterList(config, key)) {
        *list = CommonUtils::splitList(value);
        return;
    }

    if (key == "dataset") {
        config.datasetPath = value;
    } else if (key == "delimiter") {
        if (value.size() != 1) throw FeedMix::ConfigurationException("delimiter expects a single character");
        config.table.delimiter = value[0];
    } else if (key == "skip_rows") {
        config.table.skipRows = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "remove_first_column") {
        config.table.removeFirstColumn = parseBoolStrict(value, key);
    } else if (key == "columns_to_remove" || key == "exclude") {
        config.table.columnsToRemove = CommonUtils::splitList(value);
    } else if (key == "numeric_locale") {
        config.normalizer.numericLocale = parseNumericLocale(value);
    } else if (key == "date_order") {
        config.normalizer.dateOrder = parseDateOrder(value);
    } else if (key == "max_row_diagnostics") {
        config.normalizer.maxRowDiagnostics = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "start" || key == "start_date") {
        if (CommonUtils::trim(value).empty()) request.filter.startDate.reset();
        else request.filter.startDate = parseDateStrict(value, key, config.normalizer.dateOrder);
    } else if (key == "end" || key == "end_date") {
        if (CommonUtils::trim(value).empty()) request.filter.endDate.reset();
        else request.filter.endDate = parseDateStrict(value, key, config.normalizer.dateOrder);
    } else if (key == "tolerance" || key == "tolerance_threshold") {
        request.toleranceThreshold = parseDoubleStrict(value, key);
    } else if (key == "bucket_width") {
        request.bucketWidth = parseDoubleStrict(value, key);
    } else if (key == "bucket_count") {
        request.bucketCount = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "remove_outliers") {
        request.removeOutliers = parseBoolStrict(value, key);
    } else if (key == "outlier_mode") {
        request.outliers.mode = parseOutlierMode(value);
    } else if (key == "quantile_method") {
        request.outliers.quantiles = parseQuantileMethod(value);
    } else if (key == "outlier_iqr_multiplier") {
        request.outliers.iqrMultiplier = parseDoubleStrict(value, key);
    } else if (key == "max_bins") {
        request.maxBins = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "output_dir") {
        config.outputDir = value;
    } else if (key == "plot") {
        config.plot = parseBoolStrict(value, key);
    } else if (key == "plot_format") {
        config.plotConfig.format = CommonUtils::toLower(value);
    } else if (key == "plot_width") {
        config.plotConfig.width = parseIntStrict(value, key, 320);
    } else if (key == "plot_height") {
        config.plotConfig.height = parseIntStrict(value, key, 240);
    } else if (key == "plot_theme") {
        config.plotConfig.theme = CommonUtils::toLower(value);
    } else if (key == "plot_grid") {
        config.plotConfig.showGrid = parseBoolStrict(value, key);
    } else if (key == "plot_line_width") {
        config.plotConfig.lineWidth = parseDoubleStrict(value, key);
    } else if (key == "export_parquet") {
        config.exportParquet = parseBoolStrict(value, key);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else if (key == "host") {
        config.host = value;
    } else if (key == "port") {
        config.port = parseIntStrict(value, key, 1);
    } else {
        throw FeedMix::ConfigurationException("Unknown configuration key: " + key);
    }
}

std::string AnalysisConfig::usage() {
    return "Usage: feedmix <dataset.csv> [--config path] [--delimiter ,] [--skip-rows N] "
           "[--remove-first-column true|false] [--operator X]... [--food X]... [--diet X]... "
           "[--start YYYY-MM-DD] [--end YYYY-MM-DD] [--weight TYPE=W]... [--tolerance T] "
           "[--bucket-width W] [--bucket-count K] [--remove-outliers true|false] "
           "[--outlier-mode upper|two_sided] [--quantile-method linear|tukey] [--outlier-iqr-multiplier M] "
           "[--max-bins N] [--date-order auto|dmy|mdy] [--numeric-locale auto|us|eu] [--output-dir DIR] "
           "[--plot true|false] [--plot-format png|svg|pdf] [--export-parquet true|false] "
           "[--list-options] [--verbose true|false]\n"
           "       feedmix --serve [--config path] [--host H] [--port P]";
}

void AnalysisConfig::applyOverrides(AnalysisConfig& config,
                                    const std::vector<std::pair<std::string, std::string>>& options) {
    std::set<const std::vector<std::string>*> replacedLists;
    for (const auto& option : options) {
        const std::string key = normalizeKey(option.first);
        const std::string& value = option.second;

        if (key == "weight") {
            const size_t eq = value.rfind('=');
            if (eq == std::string::npos || eq == 0) {
                throw FeedMix::ConfigurationException("weight expects TYPE=W, got: " + value);
            }
            assign(config, normalizeKey("weight." + value.substr(0, eq)), CommonUtils::trim(value.substr(eq + 1)));
            continue;
        }
        if (std::vector<std::string>* list = filterList(config, key)) {
            // Repeated options accumulate, but the first one replaces whatever the config file selected.
            if (replacedLists.insert(list).second) list->clear();
            appendFilterValues(config, key, value);
            continue;
        }
        try {
            assign(config, key, value);
        } catch (const FeedMix::ConfigurationException& ex) {
            throw FeedMix::ConfigurationException("Invalid option " + option.first + " -> " + ex.what());
        }
    }
}

AnalysisConfig AnalysisConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw FeedMix::ConfigurationException(usage());
    }

    AnalysisConfig config;
    int first = 1;
    const std::string head = argv[1];
    if (head == "--serve") {
        config.serve = true;
        first = 2;
    } else if (head.rfind("--", 0) != 0) {
        config.datasetPath = head;
        first = 2;
    }

    for (int i = first; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            const std::string datasetPath = config.datasetPath;
            const bool serve = config.serve;
            config = fromFile(argv[i + 1], config);
            if (!datasetPath.empty()) config.datasetPath = datasetPath;
            config.serve = serve;
            break;
        }
    }

    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw FeedMix::ConfigurationException("Unexpected argument: " + arg);
        }
        if (arg == "--list-options") {
            config.listOptions = true;
            continue;
        }
        if (arg == "--serve") {
            config.serve = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw FeedMix::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];
        if (arg == "--config") continue;
        overrides.emplace_back(arg, value);
    }
    applyOverrides(config, overrides);

    config.validate();
    return config;
}

AnalysisConfig AnalysisConfig::fromFile(const std::string& configPath) {
    return fromFile(configPath, AnalysisConfig());
}

AnalysisConfig AnalysisConfig::fromFile(const std::string& configPath, const AnalysisConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw FeedMix::ConfigurationException("Could not open config file: " + configPath);

    AnalysisConfig config = base;
    std::string rawLine;
    std::string section;
    size_t lineNo = 0;
    while (std::getline(in, rawLine)) {
        ++lineNo;
        const bool indented = !rawLine.empty() && (rawLine[0] == ' ' || rawLine[0] == '\t');
        std::string line = CommonUtils::trim(stripTrailingComment(rawLine));
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            if (!indented) section.clear();
            if (value.empty() && !indented) {
                const std::string lowered = CommonUtils::toLower(key);
                if (lowered == "weights" || lowered == "columns") {
                    section = sectionPrefix(lowered);
                    continue;
                }
            }
            if (!section.empty()) key = section + key;
            assign(config, normalizeKey(key), value);
        } catch (const FeedMix::FeedMixException& ex) {
            throw FeedMix::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }

    return config;
}

void AnalysisConfig::validate() const {
    if (!serve && datasetPath.empty()) {
        throw FeedMix::ConfigurationException("A dataset path is required unless --serve is given");
    }
    if (request.toleranceThreshold < 0.0) {
        throw FeedMix::ConfigurationException("tolerance must be >= 0");
    }
    if (!(request.bucketWidth > 0.0)) {
        throw FeedMix::ConfigurationException("bucket_width must be > 0");
    }
    if (request.bucketCount < 1) {
        throw FeedMix::ConfigurationException("bucket_count must be >= 1");
    }
    if (!(request.outliers.iqrMultiplier > 0.0)) {
        throw FeedMix::ConfigurationException("outlier_iqr_multiplier must be > 0");
    }
    if (request.maxBins < 1) {
        throw FeedMix::ConfigurationException("max_bins must be >= 1");
    }
    if (request.filter.startDate && request.filter.endDate && *request.filter.endDate < *request.filter.startDate) {
        throw FeedMix::ConfigurationException("end date must not precede start date");
    }
    if (columns.batchCode.empty() || columns.foodType.empty() || columns.plannedKg.empty() ||
        columns.realizedKg.empty() || columns.pctDifference.empty() || columns.operatorName.empty() ||
        columns.dietName.empty() || columns.date.empty()) {
        throw FeedMix::ConfigurationException("column mappings must name a header for every required field");
    }
    if (!isIn(plotConfig.format, {"png", "svg", "pdf"})) {
        throw FeedMix::ConfigurationException("plot_format must be one of: png, svg, pdf");
    }
    if (!isIn(plotConfig.theme, {"light", "dark"})) {
        throw FeedMix::ConfigurationException("plot_theme must be light or dark");
    }
    if (!(plotConfig.lineWidth > 0.0)) {
        throw FeedMix::ConfigurationException("plot_line_width must be > 0");
    }
    if (port < 1 || port > 65535) {
        throw FeedMix::ConfigurationException("port must be within [1,65535]");
    }
    if (outputDir.empty()) {
        throw FeedMix::ConfigurationException("output_dir must not be empty");
    }
}
