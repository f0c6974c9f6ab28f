#pragma once

#include "AnalysisConfig.h"
#include "AnalysisPipeline.h"
#include "StatisticsSummarizer.h"

#include <string>
#include <vector>

class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addSection(const std::string& title);
    void addParagraph(const std::string& text);
    void addBullets(const std::vector<std::string>& items);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);
    void addTable(const std::string& title, const ExportTable& table);
    void addImage(const std::string& title, const std::string& imagePath);

    /**
     * @throws FeedMix::IOException when `filePath` cannot be written.
     */
    void save(const std::string& filePath) const;

    const std::string& body() const { return body_; }

    /**
     * @brief Markdown report of one run: scope, statistics with and without outliers,
     *        the range sub-tables, weights in effect, histogram and diagnostics.
     * @param imageFile Histogram image relative to the report, or empty when none was rendered.
     */
    static ReportEngine forAnalysis(const AnalysisResult& result,
                                    const AnalysisConfig& config,
                                    const std::string& imageFile);

private:
    std::string body_;
};
