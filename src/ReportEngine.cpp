#include "ReportEngine.h"
#include "CommonUtils.h"
#include "FeedMixExceptions.h"

#include <fstream>
#include <optional>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

std::string joinOrAll(const std::vector<std::string>& values) {
    if (values.empty()) return "all";
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += values[i];
    }
    return out;
}

std::string dateBound(const std::optional<CalendarDate>& date) {
    return date ? date->toDisplayString() : "open";
}

const char* outlierModeName(OutlierMode mode) {
    return mode == OutlierMode::TWO_SIDED ? "two-sided" : "upper only";
}

const char* quantileMethodName(QuantileMethod method) {
    return method == QuantileMethod::TUKEY_HINGES ? "Tukey hinges" : "linear interpolation";
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& title) {
    body_ += "## " + title + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBullets(const std::vector<std::string>& items) {
    for (const auto& item : items) body_ += "- " + item + "\n";
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "### " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    if (rows.empty()) {
        body_ += "_No rows._\n\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (!tallTable) {
        appendMarkdownTable(body_, headers, rows);
        return;
    }

    body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(kTallTableRowCap));
    appendMarkdownTable(body_, headers, previewRows);

    body_ += "<details>\n";
    body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
    appendMarkdownTable(body_, headers, rows);
    body_ += "</details>\n\n";
}

void ReportEngine::addTable(const std::string& title, const ExportTable& table) {
    addTable(title, table.header, table.rows);
}

void ReportEngine::addImage(const std::string& title, const std::string& imagePath) {
    body_ += "### " + title + "\n";
    body_ += "![" + title + "](" + imagePath + ")\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath);
    if (!out) {
        throw FeedMix::IOException("Unable to write report: " + filePath);
    }
    out << body_;
    if (!out) {
        throw FeedMix::IOException("Write failed for report: " + filePath);
    }
}

ReportEngine ReportEngine::forAnalysis(const AnalysisResult& result,
                                       const AnalysisConfig& config,
                                       const std::string& imageFile) {
    const AnalysisRequest& request = config.request;
    const StatisticsSummary& summary = result.summary;

    ReportEngine report;
    report.addTitle("Batch Deviation Analysis");

    report.addSection("Scope");
    report.addBullets({
        "Dataset: `" + (config.datasetPath.empty() ? std::string("(request body)") : config.datasetPath) + "`",
        "Rows read: " + std::to_string(result.sourceRows) + ", dropped during coercion: " + std::to_string(result.droppedRows) +
            " (" + std::to_string(result.malformedRows) + " with unbalanced quotes)",
        "Ingredient records after filters: " + std::to_string(result.filteredRecords) + " of " + std::to_string(result.inputRecords),
        "Batches analysed: " + std::to_string(result.aggregates.size()),
        "Period: " + dateBound(request.filter.startDate) + " to " + dateBound(request.filter.endDate),
        "Operators: " + joinOrAll(request.filter.operators),
        "Foods: " + joinOrAll(request.filter.foods),
        "Diets: " + joinOrAll(request.filter.diets),
        "Tolerance threshold: " + CommonUtils::formatFixed(request.toleranceThreshold, 1) + "%",
    });

    report.addSection("Statistics");
    report.addParagraph("Outlier fences use " + std::string(quantileMethodName(request.outliers.quantiles)) +
                        " quartiles with a " + CommonUtils::formatFixed(request.outliers.iqrMultiplier, 2) +
                        " x IQR multiplier, " + outlierModeName(request.outliers.mode) + ". " +
                        std::to_string(summary.excludedCount()) + " of " + std::to_string(summary.countWith()) +
                        " batches fall outside the fences.");
    report.addTable("Summary", StatisticsSummarizer::toExportTable(summary));
    report.addTable("Batches by deviation range (with outliers)", StatisticsSummarizer::bucketTable(summary.withOutliers));
    report.addTable("Batches by deviation range (without outliers)", StatisticsSummarizer::bucketTable(summary.withoutOutliers));

    std::vector<std::vector<std::string>> weightRows;
    for (const auto& entry : request.weights.entries()) {
        weightRows.push_back({entry.first, CommonUtils::formatFixed(entry.second, 2)});
    }
    report.addSection("Relative weights");
    report.addParagraph("Food types not listed weigh " + CommonUtils::formatFixed(RelativeWeightMap::kDefaultWeight, 2) + ".");
    report.addTable("Weights in effect", {"Food type", "Relative weight"}, weightRows);

    report.addSection("Histogram");
    report.addParagraph(std::to_string(result.histogram.bins.size()) + " bins of width " +
                        CommonUtils::formatFixed(result.histogram.binWidth, 3) + " over " +
                        std::to_string(result.histogramSampleCount) + " batches" +
                        (request.removeOutliers ? " (outliers removed)." : "."));
    if (!imageFile.empty()) {
        report.addImage("Weighted deviation per batch", imageFile);
    }

    report.addSection("Diagnostics");
    if (result.diagnostics.empty()) {
        report.addParagraph("No issues were recorded.");
    } else {
        std::vector<std::vector<std::string>> rows;
        for (const auto& d : result.diagnostics.entries()) {
            rows.push_back({Diagnostics::kindName(d.kind), d.subject, d.message});
        }
        report.addTable("Recorded conditions", {"Kind", "Subject", "Message"}, rows);
    }
    return report;
}
