#include "AnalysisConfig.h"
#include "FeedMixExceptions.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace {
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content) {
        path_ = (std::filesystem::temp_directory_path() /
                 ("feedmix_config_" + std::to_string(++counter_) + ".yaml")).string();
        std::ofstream out(path_);
        out << content;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    const std::string& path() const { return path_; }

private:
    static inline int counter_ = 0;
    std::string path_;
};

AnalysisConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "feedmix");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return AnalysisConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST(AnalysisConfigTest, DefaultsMatchTheDocumentedRun) {
    const AnalysisConfig config;
    EXPECT_DOUBLE_EQ(config.request.toleranceThreshold, 3.0);
    EXPECT_DOUBLE_EQ(config.request.bucketWidth, 2.0);
    EXPECT_EQ(config.request.bucketCount, 3u);
    EXPECT_FALSE(config.request.removeOutliers);
    EXPECT_EQ(config.request.outliers.mode, OutlierMode::UPPER_ONLY);
    EXPECT_EQ(config.request.outliers.quantiles, QuantileMethod::LINEAR);
    EXPECT_DOUBLE_EQ(config.request.outliers.iqrMultiplier, 1.5);
}

TEST(AnalysisConfigTest, ReadsYamlSections) {
    const TempConfigFile file(
        "# mixer export\n"
        "dataset: batidas.csv\n"
        "delimiter: \";\"\n"
        "columns:\n"
        "  batch_code: \"COD. BATIDA\"\n"
        "  planned_kg: \"PREVISTO (KG)\"\n"
        "  food: ALIMENTO\n"
        "weights:\n"
        "  Concentrado: 1.0\n"
        "  Volumoso: 0.5   # roughage\n"
        "tolerance: 2.5\n"
        "operators: Joao, Ana\n"
        "start: 2024-03-01\n"
        "quantile_method: tukey\n"
        "remove_outliers: yes\n");

    const AnalysisConfig config = AnalysisConfig::fromFile(file.path());
    EXPECT_EQ(config.datasetPath, "batidas.csv");
    EXPECT_EQ(config.table.delimiter, ';');
    EXPECT_EQ(config.columns.batchCode, "COD. BATIDA");
    EXPECT_EQ(config.columns.plannedKg, "PREVISTO (KG)");
    EXPECT_EQ(config.columns.food, "ALIMENTO");
    EXPECT_DOUBLE_EQ(config.request.weights.weightFor("Concentrado"), 1.0);
    EXPECT_DOUBLE_EQ(config.request.weights.weightFor("Volumoso"), 0.5);
    EXPECT_DOUBLE_EQ(config.request.toleranceThreshold, 2.5);
    EXPECT_EQ(config.request.filter.operators, (std::vector<std::string>{"Joao", "Ana"}));
    ASSERT_TRUE(config.request.filter.startDate.has_value());
    EXPECT_EQ(*config.request.filter.startDate, CalendarDate::fromYmd(2024, 3, 1));
    EXPECT_EQ(config.request.outliers.quantiles, QuantileMethod::TUKEY_HINGES);
    EXPECT_TRUE(config.request.removeOutliers);
}

TEST(AnalysisConfigTest, ReadsJsonStyleLines) {
    const TempConfigFile file(
        "{\n"
        "  \"dataset\": \"in.csv\",\n"
        "  \"bucket_width\": 1.5,\n"
        "  \"outlier_mode\": \"two_sided\"\n"
        "}\n");
    const AnalysisConfig config = AnalysisConfig::fromFile(file.path());
    EXPECT_EQ(config.datasetPath, "in.csv");
    EXPECT_DOUBLE_EQ(config.request.bucketWidth, 1.5);
    EXPECT_EQ(config.request.outliers.mode, OutlierMode::TWO_SIDED);
}

TEST(AnalysisConfigTest, FileLayersOverBaseConfig) {
    const TempConfigFile file("tolerance: 4\n");
    AnalysisConfig base;
    base.datasetPath = "base.csv";
    base.request.bucketWidth = 1.0;

    const AnalysisConfig config = AnalysisConfig::fromFile(file.path(), base);
    EXPECT_EQ(config.datasetPath, "base.csv");
    EXPECT_DOUBLE_EQ(config.request.bucketWidth, 1.0);
    EXPECT_DOUBLE_EQ(config.request.toleranceThreshold, 4.0);

    const AnalysisConfig fresh = AnalysisConfig::fromFile(file.path());
    EXPECT_DOUBLE_EQ(fresh.request.bucketWidth, AnalysisConfig().request.bucketWidth);
}

TEST(AnalysisConfigTest, FileErrorsNameTheLine) {
    const TempConfigFile file("dataset: a.csv\ntolerance: lots\n");
    try {
        AnalysisConfig::fromFile(file.path());
        FAIL() << "expected ConfigurationException";
    } catch (const FeedMix::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    EXPECT_THROW(AnalysisConfig::fromFile("/nonexistent/feedmix.yaml"), FeedMix::ConfigurationException);
}

TEST(AnalysisConfigTest, NormalizeKeyKeepsFoodTypeSpelling) {
    EXPECT_EQ(AnalysisConfig::normalizeKey("--Bucket-Width"), "bucket_width");
    EXPECT_EQ(AnalysisConfig::normalizeKey("weight.Milho Moido"), "weight.Milho Moido");
    EXPECT_EQ(AnalysisConfig::normalizeKey("Weight.Soja"), "weight.Soja");
}

TEST(AnalysisConfigTest, OverridesAccumulateSelectorsAndReplaceFileValues) {
    AnalysisConfig config;
    config.request.filter.foods = {"FromFile"};
    AnalysisConfig::applyOverrides(config, {
        {"--food", "Milho"},
        {"--food", "Soja, Silagem"},
        {"--weight", "Volumoso=0.25"},
        {"--tolerance", "4"},
    });
    EXPECT_EQ(config.request.filter.foods, (std::vector<std::string>{"Milho", "Soja", "Silagem"}));
    EXPECT_DOUBLE_EQ(config.request.weights.weightFor("Volumoso"), 0.25);
    EXPECT_DOUBLE_EQ(config.request.toleranceThreshold, 4.0);
}

TEST(AnalysisConfigTest, InvalidOverridesAreRejected) {
    AnalysisConfig config;
    EXPECT_THROW(AnalysisConfig::applyOverrides(config, {{"--weight", "Milho"}}), FeedMix::ConfigurationException);
    EXPECT_THROW(AnalysisConfig::applyOverrides(config, {{"--weight", "Milho=2"}}), FeedMix::ConfigurationException);
    EXPECT_THROW(AnalysisConfig::applyOverrides(config, {{"--no-such-option", "1"}}), FeedMix::ConfigurationException);
    EXPECT_THROW(AnalysisConfig::applyOverrides(config, {{"--bucket-count", "0"}}), FeedMix::ConfigurationException);
    EXPECT_THROW(AnalysisConfig::applyOverrides(config, {{"--delimiter", ";;"}}), FeedMix::ConfigurationException);
    EXPECT_THROW(AnalysisConfig::applyOverrides(config, {{"--start", "someday"}}), FeedMix::ConfigurationException);
}

TEST(AnalysisConfigTest, ValidateRejectsInconsistentSettings) {
    AnalysisConfig config;
    EXPECT_THROW(config.validate(), FeedMix::ConfigurationException);

    config.datasetPath = "batidas.csv";
    EXPECT_NO_THROW(config.validate());

    AnalysisConfig negative = config;
    negative.request.toleranceThreshold = -1.0;
    EXPECT_THROW(negative.validate(), FeedMix::ConfigurationException);

    AnalysisConfig reversed = config;
    reversed.request.filter.startDate = CalendarDate::fromYmd(2024, 3, 10);
    reversed.request.filter.endDate = CalendarDate::fromYmd(2024, 3, 1);
    EXPECT_THROW(reversed.validate(), FeedMix::ConfigurationException);

    AnalysisConfig badFormat = config;
    badFormat.plotConfig.format = "bmp";
    EXPECT_THROW(badFormat.validate(), FeedMix::ConfigurationException);

    AnalysisConfig serveOnly;
    serveOnly.serve = true;
    EXPECT_NO_THROW(serveOnly.validate());
}

TEST(AnalysisConfigTest, CommandLineOverridesConfigFile) {
    const TempConfigFile file("tolerance: 5\noperators: Pedro\nplot: false\n");
    const AnalysisConfig config = parseArgs(
        {"batidas.csv", "--config", file.path(), "--tolerance", "2", "--operator", "Ana", "--list-options"});

    EXPECT_EQ(config.datasetPath, "batidas.csv");
    EXPECT_DOUBLE_EQ(config.request.toleranceThreshold, 2.0);
    EXPECT_EQ(config.request.filter.operators, (std::vector<std::string>{"Ana"}));
    EXPECT_FALSE(config.plot);
    EXPECT_TRUE(config.listOptions);
}

TEST(AnalysisConfigTest, CommandLineErrors) {
    EXPECT_THROW(parseArgs({}), FeedMix::ConfigurationException);
    EXPECT_THROW(parseArgs({"batidas.csv", "--tolerance"}), FeedMix::ConfigurationException);
    EXPECT_THROW(parseArgs({"batidas.csv", "stray"}), FeedMix::ConfigurationException);

    const AnalysisConfig serve = parseArgs({"--serve", "--port", "9090"});
    EXPECT_TRUE(serve.serve);
    EXPECT_EQ(serve.port, 9090);
}
