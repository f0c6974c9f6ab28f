#include "AnalysisJson.h"
#include "FeedMixExceptions.h"

#include <gtest/gtest.h>

#include <limits>

namespace {
const char* kCsv =
    "batch_code,food_type,planned_kg,realized_kg,pct_difference,operator,diet_name,date\n"
    "B1,Concentrado,100,104,4,Joao,Lactacao,2024-03-01\n"
    "B1,Volumoso,50,49,-2,Joao,Lactacao,2024-03-01\n"
    "B2,Concentrado,200,201,0.5,Ana,Recria,2024-03-02\n"
    "B3,Concentrado,bad,1,1,Ana,Recria,2024-03-02\n";
}

TEST(AnalysisJsonTest, EscapesControlCharacters) {
    EXPECT_EQ(AnalysisJson::escapeJsonString("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(AnalysisJson::escapeJsonString(std::string("\x01", 1)), "\\u0001");
}

TEST(AnalysisJsonTest, NonFiniteNumbersBecomeNull) {
    EXPECT_EQ(AnalysisJson::formatDouble(std::numeric_limits<double>::quiet_NaN()), "null");
    EXPECT_EQ(AnalysisJson::formatDouble(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(AnalysisJson::formatDouble(3.6), "3.6");
}

TEST(AnalysisJsonTest, AnalyzesCsvBodyWithConfiguredWeights) {
    AnalysisConfig config;
    config.request.weights.set("Volumoso", 0.5);
    const AnalysisResult result = AnalysisJson::analyzeCsvText(kCsv, config);

    EXPECT_EQ(result.sourceRows, 4u);
    EXPECT_EQ(result.droppedRows, 1u);
    ASSERT_EQ(result.aggregates.size(), 2u);
    EXPECT_NEAR(result.aggregates[0].weightedAvgPct, 3.6, 1e-12);
    EXPECT_NEAR(result.aggregates[1].weightedAvgPct, 0.5, 1e-12);
}

TEST(AnalysisJsonTest, ResultDocumentCarriesEverySection) {
    AnalysisConfig config;
    config.request.weights.set("Volumoso", 0.5);
    const AnalysisResult result = AnalysisJson::analyzeCsvText(kCsv, config);
    const std::string json = AnalysisJson::resultToJson(result, config.request);

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    for (const char* key : {"\"source_rows\":4", "\"dropped_rows\":1", "\"malformed_rows\":0", "\"aggregates\":[",
                            "\"batch_code\":\"B1\"", "\"deviation_band\":\"[3.0, 5.0)\"",
                            "\"deviation_band\":\"within-tolerance\"", "\"histogram\":{",
                            "\"summary\":{", "\"with_outliers\":", "\"without_outliers\":",
                            "\"kind\":\"CoercionWarning\""}) {
        EXPECT_NE(json.find(key), std::string::npos) << key;
    }
}

TEST(AnalysisJsonTest, EmptySummaryUsesNulls) {
    AnalysisConfig config;
    config.request.filter.operators = {"Nobody"};
    const AnalysisResult result = AnalysisJson::analyzeCsvText(kCsv, config);
    const std::string json = AnalysisJson::resultToJson(result, config.request);
    EXPECT_NE(json.find("\"count\":0,\"mean\":null"), std::string::npos);
    EXPECT_NE(json.find("EmptyResultWarning"), std::string::npos);
}

TEST(AnalysisJsonTest, MissingColumnsAbortTheRequest) {
    const AnalysisConfig config;
    EXPECT_THROW(AnalysisJson::analyzeCsvText("batch_code\nB1\n", config), FeedMix::MissingColumnException);
    EXPECT_THROW(AnalysisJson::analyzeCsvText("", config), FeedMix::DatasetException);
}

TEST(AnalysisJsonTest, ErrorDocument) {
    EXPECT_EQ(AnalysisJson::errorToJson("bad \"input\"", 1.5), "{\"error\":\"bad \\\"input\\\"\",\"latency_ms\":1.5}");
}

TEST(AnalysisJsonTest, UnbalancedQuoteRowIsReported) {
    const std::string csv = std::string(kCsv) +
        "B4,\"Concentrado,10,10,0,Ana,Recria,2024-03-02\n"
        "B5,Concentrado,10,11,10,Ana,Recria,2024-03-02\n";
    const AnalysisConfig config;
    const AnalysisResult result = AnalysisJson::analyzeCsvText(csv, config);

    EXPECT_EQ(result.malformedRows, 1u);
    EXPECT_EQ(result.droppedRows, 2u);
    ASSERT_EQ(result.aggregates.size(), 3u);
    EXPECT_EQ(result.aggregates.back().batchCode, "B5");

    bool reported = false;
    for (const auto& d : result.diagnostics.entries()) {
        if (d.subject == "line 6" && d.message.find("unbalanced quote") != std::string::npos) reported = true;
    }
    EXPECT_TRUE(reported);
    EXPECT_NE(AnalysisJson::resultToJson(result, config.request).find("\"malformed_rows\":1"), std::string::npos);
}
