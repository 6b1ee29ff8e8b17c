#include <gtest/gtest.h>
#include "../include/hsv_stats.hpp"
#include <vector>

class HsvStatsTest : public ::testing::Test {
protected:
    void SetUp() override {
        two_tone.push_back(PaletteEntry{ cv::Vec3d(10.0, 200.0, 100.0), 0.6 });
        two_tone.push_back(PaletteEntry{ cv::Vec3d(20.0, 100.0, 200.0), 0.4 });
    }

    Palette two_tone;
};

TEST_F(HsvStatsTest, CircularMeanWrapsAround) {
    double mean = circularMeanHue({ 2.0, 177.0 }, { 1.0, 1.0 });
    EXPECT_NEAR(hueDistance(mean, 179.5), 0.0, 1e-9);
    EXPECT_GT(hueDistance(mean, 89.5), 80.0);
}

TEST_F(HsvStatsTest, CircularMeanOfIdenticalHuesIsExact) {
    EXPECT_EQ(circularMeanHue({ 37.0, 37.0, 37.0 }, { 0.2, 0.3, 0.5 }), 37.0);
}

TEST_F(HsvStatsTest, CircularMeanFollowsWeights) {
    double mean = circularMeanHue({ 0.0, 30.0 }, { 3.0, 1.0 });
    EXPECT_GT(mean, 0.0);
    EXPECT_LT(mean, 15.0);
}

TEST_F(HsvStatsTest, CircularMeanDegenerateInputs) {
    EXPECT_EQ(circularMeanHue({}, {}), 0.0);
    EXPECT_EQ(circularMeanHue({ 10.0, 20.0 }, { 0.0, 0.0 }), 0.0);
    EXPECT_EQ(circularMeanHue({ 0.0, 90.0 }, { 1.0, 1.0 }), 0.0); // opposite hues cancel out
    EXPECT_THROW(circularMeanHue({ 1.0 }, { 1.0, 2.0 }), std::invalid_argument);
}

TEST_F(HsvStatsTest, HueDistanceAndDeltaWrap) {
    EXPECT_DOUBLE_EQ(hueDistance(2.0, 177.0), 5.0);
    EXPECT_DOUBLE_EQ(hueDistance(0.0, 90.0), 90.0);
    EXPECT_DOUBLE_EQ(hueDistance(45.0, 45.0), 0.0);

    EXPECT_DOUBLE_EQ(hueDelta(2.0, 177.0), 5.0);
    EXPECT_DOUBLE_EQ(hueDelta(177.0, 2.0), -5.0);
    EXPECT_DOUBLE_EQ(hueDelta(90.0, 0.0), 90.0);
    EXPECT_DOUBLE_EQ(hueDelta(0.0, 90.0), 90.0);
}

TEST_F(HsvStatsTest, StatisticsOfTwoTonePalette) {
    HsvStatistics stats = computeHsvStatistics(two_tone);

    EXPECT_EQ(stats.dominant, cv::Vec3d(10.0, 200.0, 100.0));
    EXPECT_DOUBLE_EQ(stats.dominant_ratio, 0.6);
    EXPECT_NEAR(stats.mean[0], 14.0, 0.05); // close hues: circular mean ~ linear mean
    EXPECT_NEAR(stats.mean[1], 160.0, 1e-9);
    EXPECT_NEAR(stats.mean[2], 140.0, 1e-9);
}

TEST_F(HsvStatsTest, MeanHueWrapsForRedPalette) {
    Palette reds;
    reds.push_back(PaletteEntry{ cv::Vec3d(2.0, 255.0, 255.0), 0.5 });
    reds.push_back(PaletteEntry{ cv::Vec3d(177.0, 255.0, 255.0), 0.5 });

    HsvStatistics stats = computeHsvStatistics(reds);
    EXPECT_NEAR(hueDistance(stats.mean[0], 179.5), 0.0, 1e-9);
}

TEST_F(HsvStatsTest, SingleEntryStatistics) {
    Palette single;
    single.push_back(PaletteEntry{ cv::Vec3d(120.0, 50.0, 60.0), 1.0 });

    HsvStatistics stats = computeHsvStatistics(single);
    EXPECT_EQ(stats.dominant, stats.mean);
    EXPECT_DOUBLE_EQ(stats.dominant_ratio, 1.0);
}

TEST_F(HsvStatsTest, EmptyPaletteThrows) {
    EXPECT_THROW(computeHsvStatistics(Palette()), EmptyPaletteError);
}

TEST_F(HsvStatsTest, MeanHueSkipsAchromaticEntries) {
    Palette palette;
    palette.push_back(PaletteEntry{ cv::Vec3d(0.0, 0.0, 128.0), 0.5 });   // grey, reported as H = 0
    palette.push_back(PaletteEntry{ cv::Vec3d(90.0, 255.0, 255.0), 0.5 }); // cyan

    HsvStatistics stats = computeHsvStatistics(palette, 25.0, 25.0);
    EXPECT_NEAR(stats.mean[0], 90.0, 1e-9);
    // Saturation and value still average every entry
    EXPECT_NEAR(stats.mean[1], 127.5, 1e-9);
    EXPECT_NEAR(stats.mean[2], 191.5, 1e-9);
}

TEST_F(HsvStatsTest, AchromaticThresholds) {
    EXPECT_FALSE(hasHue(cv::Vec3d(0.0, 10.0, 200.0), 25.0, 25.0));  // near white
    EXPECT_FALSE(hasHue(cv::Vec3d(60.0, 255.0, 10.0), 25.0, 25.0)); // near black
    EXPECT_TRUE(hasHue(cv::Vec3d(60.0, 25.0, 25.0), 25.0, 25.0));
    EXPECT_TRUE(hasHue(cv::Vec3d(0.0, 0.0, 0.0), 0.0, 0.0));

    EXPECT_EQ(chromaticEntries(two_tone, 150.0, 0.0).size(), 1u);
}
