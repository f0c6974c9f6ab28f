#include "FeedMixExceptions.h"
#include "TestRecords.h"
#include "WeightedAggregator.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using feedmix_test::ingredient;

TEST(WeightedAggregatorTest, WeightsScalePlannedQuantity) {
    RelativeWeightMap weights;
    weights.set("Concentrado", 1.0);
    weights.set("Volumoso", 0.5);

    const auto result = WeightedAggregator::aggregate(
        {ingredient("B1", "Concentrado", 100, 4), ingredient("B1", "Volumoso", 50, -2)}, weights);

    ASSERT_EQ(result.aggregates.size(), 1u);
    const BatchAggregate& b1 = result.aggregates[0];
    EXPECT_EQ(b1.batchCode, "B1");
    EXPECT_DOUBLE_EQ(b1.totalAdjustedQty, 125.0);
    EXPECT_DOUBLE_EQ(b1.totalContribution, 450.0);
    EXPECT_NEAR(b1.weightedAvgPct, 3.6, 1e-12);
    EXPECT_EQ(b1.ingredientCount, 2u);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(WeightedAggregatorTest, AverageTimesQuantityEqualsContribution) {
    RelativeWeightMap weights;
    weights.set("Mineral", 0.3);
    const auto result = WeightedAggregator::aggregate(
        {ingredient("A", "Milho", 812.4, -3.17),
         ingredient("A", "Mineral", 12.75, 11.2),
         ingredient("A", "Silagem", 2210.0, 0.41),
         ingredient("B", "Milho", 0.001, 99.0)},
        weights);

    ASSERT_EQ(result.aggregates.size(), 2u);
    for (const auto& agg : result.aggregates) {
        EXPECT_NEAR(agg.weightedAvgPct * agg.totalAdjustedQty, agg.totalContribution, 1e-9);
        EXPECT_GE(agg.weightedAvgPct, 0.0);
    }
}

TEST(WeightedAggregatorTest, UnlistedFoodTypesUseDefaultWeight) {
    const RelativeWeightMap weights;
    EXPECT_DOUBLE_EQ(weights.weightFor("Anything"), RelativeWeightMap::kDefaultWeight);

    const auto result = WeightedAggregator::aggregate(
        {ingredient("B1", "Milho", 100, 2), ingredient("B1", "Soja", 100, -6)}, weights);
    ASSERT_EQ(result.aggregates.size(), 1u);
    EXPECT_DOUBLE_EQ(result.aggregates[0].weightedAvgPct, 4.0);
}

TEST(WeightedAggregatorTest, ZeroAdjustedQuantityIsReportedNotAggregated) {
    RelativeWeightMap weights;
    weights.set("Agua", 0.0);
    const auto result = WeightedAggregator::aggregate(
        {ingredient("B1", "Agua", 500, 5), ingredient("B1", "Agua", 300, 2), ingredient("B2", "Milho", 10, 1)},
        weights);

    ASSERT_EQ(result.aggregates.size(), 1u);
    EXPECT_EQ(result.aggregates[0].batchCode, "B2");
    ASSERT_EQ(result.diagnostics.entries().size(), 1u);
    EXPECT_EQ(result.diagnostics.entries()[0].kind, DiagnosticKind::DIVISION_UNDEFINED);
    EXPECT_EQ(result.diagnostics.entries()[0].subject, "B1");
}

TEST(WeightedAggregatorTest, OutputIsSortedByBatchCodeWithFirstRowMetadata) {
    const auto result = WeightedAggregator::aggregate(
        {ingredient("C9", "Milho", 10, 1, "Ana", "Recria", CalendarDate::fromYmd(2024, 3, 9)),
         ingredient("A1", "Milho", 10, 1, "Joao", "Lactacao", CalendarDate::fromYmd(2024, 3, 1)),
         ingredient("C9", "Soja", 10, 1, "Pedro", "Outra", CalendarDate::fromYmd(2024, 3, 10)),
         ingredient("B5", "Milho", 10, 1)},
        RelativeWeightMap{});

    ASSERT_EQ(result.aggregates.size(), 3u);
    EXPECT_EQ(result.aggregates[0].batchCode, "A1");
    EXPECT_EQ(result.aggregates[1].batchCode, "B5");
    EXPECT_EQ(result.aggregates[2].batchCode, "C9");
    EXPECT_EQ(result.aggregates[2].operatorName, "Ana");
    EXPECT_EQ(result.aggregates[2].dietName, "Recria");
    EXPECT_EQ(result.aggregates[2].date, CalendarDate::fromYmd(2024, 3, 9));
}

TEST(WeightedAggregatorTest, EmptyInputGivesEmptyOutput) {
    const auto result = WeightedAggregator::aggregate({}, RelativeWeightMap{});
    EXPECT_TRUE(result.aggregates.empty());
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(WeightedAggregatorTest, WeightsOutsideUnitIntervalAreRejected) {
    RelativeWeightMap weights;
    EXPECT_THROW(weights.set("Milho", 1.5), FeedMix::ConfigurationException);
    EXPECT_THROW(weights.set("Milho", -0.1), FeedMix::ConfigurationException);
    EXPECT_THROW(weights.set("Milho", std::numeric_limits<double>::quiet_NaN()), FeedMix::ConfigurationException);
    EXPECT_FALSE(weights.contains("Milho"));
    EXPECT_NO_THROW(weights.set("Milho", 0.0));
    EXPECT_NO_THROW(weights.set("Milho", 1.0));
}
