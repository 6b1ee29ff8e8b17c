#include <gtest/gtest.h>
#include "../include/harmony.hpp"
#include <opencv2/core.hpp>
#include <initializer_list>
#include <utility>

// Palette of fully saturated, bright hues with the given ratios
static Palette huePalette(std::initializer_list<std::pair<double, double>> hueRatios) {
    Palette palette;
    for (const auto& hr : hueRatios) palette.push_back(PaletteEntry{ cv::Vec3d(hr.first, 255.0, 255.0), hr.second });
    return palette;
}

class HarmonyTest : public ::testing::Test {
protected:
    void SetUp() override {
        complementary = huePalette({ { 0.0, 0.5 }, { 90.0, 0.5 } });
        analogous = huePalette({ { 20.0, 0.5 }, { 30.0, 0.5 } });
        triadic = huePalette({ { 0.0, 1.0 / 3 }, { 60.0, 1.0 / 3 }, { 120.0, 1.0 / 3 } });
        split = huePalette({ { 0.0, 1.0 / 3 }, { 75.0, 1.0 / 3 }, { 105.0, 1.0 / 3 } });
    }

    Palette complementary;
    Palette analogous;
    Palette triadic;
    Palette split;
};

TEST_F(HarmonyTest, ComplementaryPeaksAtOppositeHues) {
    EXPECT_NEAR(complementaryScore(complementary), 1.0, 1e-9);
    EXPECT_NEAR(complementaryScore(huePalette({ { 90.0, 0.5 }, { 0.0, 0.5 } })), 1.0, 1e-9);
}

TEST_F(HarmonyTest, ComplementaryDecaysMonotonicallyAwayFromOpposite) {
    double previousBelow = complementaryScore(complementary);
    double previousAbove = previousBelow;
    for (int offset = 1; offset <= 60; ++offset) {
        double below = complementaryScore(huePalette({ { 0.0, 0.5 }, { 90.0 - offset, 0.5 } }));
        double above = complementaryScore(huePalette({ { 0.0, 0.5 }, { 90.0 + offset, 0.5 } }));
        EXPECT_LT(below, previousBelow) << "offset " << offset;
        EXPECT_LT(above, previousAbove) << "offset " << offset;
        previousBelow = below;
        previousAbove = above;
    }
}

TEST_F(HarmonyTest, AnalogousRewardsNeighbouringHues) {
    EXPECT_NEAR(analogousScore(analogous), 1.0, 1e-9);
    EXPECT_LT(analogousScore(complementary), 1e-6);
    EXPECT_GT(analogousScore(huePalette({ { 0.0, 0.5 }, { 20.0, 0.5 } })), analogousScore(huePalette({ { 0.0, 0.5 }, { 30.0, 0.5 } })));
}

TEST_F(HarmonyTest, MonochromaticSingleEntryIsAlwaysOne) {
    for (double s : { 0.0, 37.0, 128.0, 255.0 }) {
        for (double v : { 0.0, 90.0, 255.0 }) {
            Palette single;
            single.push_back(PaletteEntry{ cv::Vec3d(45.0, s, v), 1.0 });
            EXPECT_DOUBLE_EQ(monochromaticScore(single), 1.0);
        }
    }
}

TEST_F(HarmonyTest, MonochromaticPenalizesWideSaturationValueSpread) {
    Palette tight, wide;
    tight.push_back(PaletteEntry{ cv::Vec3d(30.0, 200.0, 200.0), 0.5 });
    tight.push_back(PaletteEntry{ cv::Vec3d(31.0, 210.0, 190.0), 0.5 });
    wide.push_back(PaletteEntry{ cv::Vec3d(30.0, 20.0, 20.0), 0.5 });
    wide.push_back(PaletteEntry{ cv::Vec3d(31.0, 255.0, 255.0), 0.5 });

    EXPECT_GT(monochromaticScore(tight), 0.95);
    EXPECT_LT(monochromaticScore(wide), monochromaticScore(tight));
}

TEST_F(HarmonyTest, MonochromaticPenalizesHueSpread) {
    EXPECT_LT(monochromaticScore(complementary), 1e-6);
    EXPECT_GT(monochromaticScore(huePalette({ { 40.0, 0.5 }, { 42.0, 0.5 } })), 0.9);
}

TEST_F(HarmonyTest, TriadicRewardsEvenSpacing) {
    EXPECT_NEAR(triadicScore(triadic), 1.0, 1e-9);
    EXPECT_LT(triadicScore(split), 0.5);
    EXPECT_EQ(triadicScore(complementary), 0.0); // needs three hues
}

TEST_F(HarmonyTest, SplitComplementaryRewardsFlankingPair) {
    EXPECT_NEAR(splitComplementaryScore(split), 1.0, 1e-9);
    EXPECT_NEAR(splitComplementaryScore(huePalette({ { 75.0, 0.2 }, { 0.0, 0.5 }, { 105.0, 0.3 } })), 1.0, 1e-9);
    EXPECT_LT(splitComplementaryScore(triadic), 0.5);
    EXPECT_EQ(splitComplementaryScore(complementary), 0.0);
}

TEST_F(HarmonyTest, NegligibleEntriesAreIgnored) {
    Palette noisy = huePalette({ { 0.0, 0.5 }, { 90.0, 0.49 }, { 45.0, 0.01 } });
    HarmonyScores withNoise = computeHarmonyScores(noisy, 0.02);
    HarmonyScores clean = computeHarmonyScores(huePalette({ { 0.0, 0.5 }, { 90.0, 0.49 } }), 0.0);

    for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) EXPECT_NEAR(withNoise[i], clean[i], 1e-12);
}

TEST_F(HarmonyTest, SignificantEntriesKeepDominantAndRenormalize) {
    Palette spread = huePalette({ { 0.0, 0.3 }, { 30.0, 0.3 }, { 60.0, 0.2 }, { 90.0, 0.2 } });
    Palette kept = significantEntries(spread, 0.5);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_DOUBLE_EQ(kept[0].ratio, 1.0);

    Palette some = significantEntries(spread, 0.25);
    ASSERT_EQ(some.size(), 2u);
    EXPECT_DOUBLE_EQ(some[0].ratio + some[1].ratio, 1.0);
}

TEST_F(HarmonyTest, ScoresStayInUnitRange) {
    cv::RNG rng(2024);
    for (int trial = 0; trial < 50; ++trial) {
        Palette palette;
        int n = rng.uniform(1, 8);
        double total = 0.0;
        for (int i = 0; i < n; ++i) {
            PaletteEntry e{ cv::Vec3d(rng.uniform(0.0, 180.0), rng.uniform(0.0, 255.0), rng.uniform(0.0, 255.0)), rng.uniform(0.05, 1.0) };
            total += e.ratio;
            palette.push_back(e);
        }
        for (auto& e : palette) e.ratio /= total;

        HarmonyScores scores = computeHarmonyScores(palette, 0.02);
        for (int i = 0; i < HARMONY_METRIC_COUNT; ++i) {
            EXPECT_GE(scores[i], 0.0);
            EXPECT_LE(scores[i], 1.0);
        }
    }
}

TEST_F(HarmonyTest, MetricNames) {
    EXPECT_STREQ(harmonyMetricName(HARMONY_COMPLEMENTARY), "complementary");
    EXPECT_STREQ(harmonyMetricName(HARMONY_SPLIT_COMPLEMENTARY), "split_complementary");
    EXPECT_STREQ(harmonyMetricName(HARMONY_TRIADIC), "triadic");
}

TEST_F(HarmonyTest, EmptyPaletteThrows) {
    EXPECT_THROW(computeHarmonyScores(Palette(), 0.02), EmptyPaletteError);
}

TEST_F(HarmonyTest, GreyWithCyanIsNotComplementary) {
    // OpenCV reports H = 0 for grey, which would otherwise read as red opposite cyan
    Palette palette;
    palette.push_back(PaletteEntry{ cv::Vec3d(0.0, 0.0, 128.0), 0.5 });
    palette.push_back(PaletteEntry{ cv::Vec3d(90.0, 255.0, 255.0), 0.5 });

    HarmonyScores scores = computeHarmonyScores(palette, 0.02, 25.0, 25.0);
    EXPECT_LT(scores[HARMONY_COMPLEMENTARY], 0.1);
    EXPECT_LT(scores[HARMONY_TRIADIC], 0.1);

    // Without thresholds the grey entry still counts as red
    EXPECT_GT(computeHarmonyScores(palette, 0.02)[HARMONY_COMPLEMENTARY], 0.9);
}

TEST_F(HarmonyTest, GreyWithRedIsNotAnalogous) {
    Palette palette;
    palette.push_back(PaletteEntry{ cv::Vec3d(0.0, 0.0, 128.0), 0.5 });
    palette.push_back(PaletteEntry{ cv::Vec3d(0.0, 255.0, 255.0), 0.5 });

    HarmonyScores scores = computeHarmonyScores(palette, 0.02, 25.0, 25.0);
    EXPECT_LT(scores[HARMONY_ANALOGOUS], 0.1);
}

TEST_F(HarmonyTest, BlackEntriesStillCountInMonochromaticSpread) {
    Palette tight = huePalette({ { 60.0, 0.5 }, { 61.0, 0.5 } });
    Palette withBlack = huePalette({ { 60.0, 0.4 }, { 61.0, 0.4 } });
    withBlack.push_back(PaletteEntry{ cv::Vec3d(0.0, 255.0, 5.0), 0.2 });

    // The dark entry does not break the hue term but widens the value spread
    EXPECT_LT(monochromaticScore(withBlack, 25.0, 25.0), monochromaticScore(tight, 25.0, 25.0));
    EXPECT_GT(monochromaticScore(withBlack, 25.0, 25.0), 0.0);
}

TEST_F(HarmonyTest, AllAchromaticPaletteHasNoHueRelationships) {
    Palette greys;
    greys.push_back(PaletteEntry{ cv::Vec3d(0.0, 0.0, 40.0), 0.5 });
    greys.push_back(PaletteEntry{ cv::Vec3d(0.0, 0.0, 220.0), 0.5 });

    HarmonyScores scores = computeHarmonyScores(greys, 0.02, 25.0, 25.0);
    EXPECT_EQ(scores[HARMONY_COMPLEMENTARY], 0.0);
    EXPECT_EQ(scores[HARMONY_ANALOGOUS], 0.0);
    EXPECT_EQ(scores[HARMONY_SPLIT_COMPLEMENTARY], 0.0);
    EXPECT_EQ(scores[HARMONY_TRIADIC], 0.0);
}
