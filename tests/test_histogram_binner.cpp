#include "HistogramBinner.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace {
const std::vector<double> kSpread = {1, 2, 3, 4, 5, 6, 7, 9};
}

TEST(HistogramBinnerTest, FreedmanDiaconisWidthAndEdges) {
    const HistogramBinSet set = HistogramBinner::bins(kSpread, 3.0);
    EXPECT_FALSE(set.degenerate);
    EXPECT_NEAR(set.binWidth, 3.5, 1e-9);
    ASSERT_EQ(set.bins.size(), 3u);
    EXPECT_DOUBLE_EQ(set.bins.front().lowerEdge, 1.0);
    EXPECT_NEAR(set.bins[1].lowerEdge, 4.5, 1e-9);
    EXPECT_GE(set.bins.back().upperEdge, 9.0);
    EXPECT_EQ(set.bins[0].count, 4u);
    EXPECT_EQ(set.bins[1].count, 3u);
    EXPECT_EQ(set.bins[2].count, 1u);
}

TEST(HistogramBinnerTest, CountsSumToFiniteSampleSize) {
    std::vector<double> values = kSpread;
    values.push_back(std::numeric_limits<double>::quiet_NaN());
    values.push_back(std::numeric_limits<double>::infinity());
    const HistogramBinSet set = HistogramBinner::bins(values, 3.0);
    EXPECT_EQ(set.totalCount(), kSpread.size());
}

TEST(HistogramBinnerTest, BinCountIsCapped) {
    HistogramOptions options;
    options.maxBins = 2;
    const HistogramBinSet set = HistogramBinner::bins(kSpread, 3.0, options);
    ASSERT_EQ(set.bins.size(), 2u);
    EXPECT_DOUBLE_EQ(set.binWidth, 4.0);
    EXPECT_EQ(set.bins[0].count, 4u);
    EXPECT_EQ(set.bins[1].count, 4u);
    EXPECT_DOUBLE_EQ(set.bins[1].upperEdge, 9.0);
}

TEST(HistogramBinnerTest, ConstantSampleCollapsesToOneBin) {
    const HistogramBinSet set = HistogramBinner::bins({5.0, 5.0, 5.0}, 3.0);
    EXPECT_TRUE(set.degenerate);
    ASSERT_EQ(set.bins.size(), 1u);
    EXPECT_DOUBLE_EQ(set.bins[0].lowerEdge, 4.5);
    EXPECT_DOUBLE_EQ(set.bins[0].upperEdge, 5.5);
    EXPECT_EQ(set.bins[0].count, 3u);
    EXPECT_EQ(set.bins[0].colorClass, BinColorClass::ABOVE_TOLERANCE);
}

TEST(HistogramBinnerTest, EmptySampleHasNoBins) {
    const HistogramBinSet set = HistogramBinner::bins({}, 3.0);
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.totalCount(), 0u);
    EXPECT_DOUBLE_EQ(set.toleranceThreshold, 3.0);
}

TEST(HistogramBinnerTest, ColorClassFollowsMidpointAgainstTolerance) {
    const HistogramBinSet set = HistogramBinner::bins(kSpread, 3.0);
    ASSERT_EQ(set.bins.size(), 3u);
    EXPECT_EQ(set.bins[0].colorClass, BinColorClass::WITHIN_TOLERANCE);
    EXPECT_EQ(set.bins[1].colorClass, BinColorClass::ABOVE_TOLERANCE);
    EXPECT_EQ(set.bins[2].colorClass, BinColorClass::ABOVE_TOLERANCE);
    EXPECT_LT(set.bins[1].intensity, set.bins[2].intensity);
    for (const auto& bin : set.bins) {
        EXPECT_GE(bin.intensity, 0.0);
        EXPECT_LE(bin.intensity, 1.0);
    }
}

TEST(HistogramBinnerTest, FillColorRampsFromWhite) {
    HistogramBin bin;
    bin.colorClass = BinColorClass::ABOVE_TOLERANCE;
    bin.intensity = 1.0;
    EXPECT_EQ(HistogramBinner::fillColor(bin), "#ff0000");
    bin.intensity = 0.0;
    EXPECT_EQ(HistogramBinner::fillColor(bin), "#ffffff");

    bin.colorClass = BinColorClass::WITHIN_TOLERANCE;
    bin.intensity = 1.0;
    EXPECT_EQ(HistogramBinner::fillColor(bin), "#00ff00");

    EXPECT_STREQ(HistogramBinner::colorClassName(BinColorClass::ABOVE_TOLERANCE), "above-tolerance");
    EXPECT_STREQ(HistogramBinner::colorClassName(BinColorClass::WITHIN_TOLERANCE), "within-tolerance");
}
