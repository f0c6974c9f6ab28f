#pragma once

#include "AnalysisConfig.h"
#include "AnalysisPipeline.h"

#include <string>

namespace AnalysisJson {
std::string escapeJsonString(const std::string& value);
std::string formatDouble(double value); // "null" for non-finite values

/**
 * @brief Aggregates, histogram, summary and diagnostics of one run as a JSON object.
 */
std::string resultToJson(const AnalysisResult& result, const AnalysisRequest& request);
std::string errorToJson(const std::string& error, double latencyMs);

/**
 * @brief Loads `csvBody` with the table options of `config` and runs the full analysis.
 * @throws FeedMix::DatasetException (including MissingColumnException) for unusable input.
 */
AnalysisResult analyzeCsvText(const std::string& csvBody, const AnalysisConfig& config);
}
