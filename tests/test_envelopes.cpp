/**
 * @file test_envelopes.cpp
 * @brief 布林带 / ATR / 线性回归通道测试
 */

#include <gtest/gtest.h>
#include "ta/tacore.hpp"
#include "test_util.hpp"

using namespace ta;
using testutil::expectSeriesNear;

class EnvelopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        bars = testutil::randomWalkBars(120, 5);
        prices = testutil::closes(bars);
    }

    std::vector<OHLCV> bars;
    std::vector<Value> prices;
};

// ==================== Bollinger Bands ====================

TEST_F(EnvelopeTest, BollingerConstantSeries) {
    BollingerBands bb(3, 2.0);
    auto out = bb.calculate({10, 10, 10, 10, 10});
    EXPECT_TRUE(testutil::allNaN(out[0]));
    EXPECT_TRUE(testutil::allNaN(out[1]));
    for (Size i = 2; i < out.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[i].upper, 10.0);
        EXPECT_DOUBLE_EQ(out[i].middle, 10.0);
        EXPECT_DOUBLE_EQ(out[i].lower, 10.0);
        EXPECT_DOUBLE_EQ(out[i].percentB, 0.5);
        EXPECT_DOUBLE_EQ(out[i].bandwidth, 0.0);
    }
}

TEST_F(EnvelopeTest, BollingerKnownValues) {
    BollingerBands bb(3, 2.0);
    auto out = bb.calculate({1, 2, 3});
    Value sd = std::sqrt(2.0 / 3.0);
    EXPECT_NEAR(out[2].middle, 2.0, 1e-12);
    EXPECT_NEAR(out[2].upper, 2.0 + 2.0 * sd, 1e-9);
    EXPECT_NEAR(out[2].lower, 2.0 - 2.0 * sd, 1e-9);
    EXPECT_NEAR(out[2].percentB, (3.0 - (2.0 - 2.0 * sd)) / (4.0 * sd), 1e-9);
    EXPECT_NEAR(out[2].bandwidth, 4.0 * sd / 2.0, 1e-9);
}

TEST_F(EnvelopeTest, BollingerZeroMiddleBandwidth) {
    BollingerBands bb(3, 2.0);
    auto out = bb.calculate({-1, 0, 1});
    EXPECT_DOUBLE_EQ(out[2].middle, 0.0);
    EXPECT_DOUBLE_EQ(out[2].bandwidth, 0.0);
}

TEST_F(EnvelopeTest, BollingerMiddleIsSMA) {
    BollingerBands bb(20, 2.0);
    auto out = bb.calculate(prices);
    auto sma = SMA(20).calculate(prices);
    for (Size i = 19; i < out.size(); ++i) {
        EXPECT_NEAR(out[i].middle, sma[i], 1e-9);
        EXPECT_GE(out[i].upper, out[i].middle);
        EXPECT_LE(out[i].lower, out[i].middle);
    }
}

TEST_F(EnvelopeTest, BollingerRejects) {
    EXPECT_THROW(BollingerBands(0, 2.0), InvalidParameter);
    EXPECT_THROW(BollingerBands(20, 0.0), InvalidParameter);
    EXPECT_THROW(BollingerBands(20, -1.0), InvalidParameter);
    EXPECT_THROW(BollingerBands(20, NaN), InvalidParameter);
    EXPECT_THROW(BollingerBands(20, Inf), InvalidParameter);
}

// ==================== ATR ====================

TEST_F(EnvelopeTest, ATRConstantRange) {
    ATR atr(3);
    std::vector<HLC> data(8, HLC{110.0, 100.0, 105.0});
    auto out = atr.calculate(data);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    for (Size i = 2; i < out.size(); ++i) {
        EXPECT_NEAR(out[i], 10.0, 1e-9);
    }
}

TEST_F(EnvelopeTest, ATRTrueRangeWithGaps) {
    ATR atr(2);
    auto out = atr.calculate({10, 12, 11}, {8, 10, 9}, {9, 11, 10});
    // TR0 = 2, TR1 = max(2, |12-9|, |10-9|) = 3, TR2 = max(2, 0, 2) = 2
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_NEAR(out[1], 2.5, 1e-12);
    EXPECT_NEAR(out[2], 2.25, 1e-12);
}

TEST_F(EnvelopeTest, ATRTrueRangeHelper) {
    EXPECT_DOUBLE_EQ(indicators::trueRange(12, 10, 9), 3.0);
    EXPECT_DOUBLE_EQ(indicators::trueRange(12, 10, 13), 3.0);
    EXPECT_DOUBLE_EQ(indicators::trueRange(12, 10, 11), 2.0);
    EXPECT_TRUE(std::isnan(indicators::trueRange(12, 10, NaN)));
    EXPECT_TRUE(std::isnan(indicators::trueRange(NaN, 10, 11)));
}

TEST_F(EnvelopeTest, ATRRejects) {
    EXPECT_THROW(ATR(0), InvalidParameter);
    ATR atr(3);
    EXPECT_THROW(atr.calculate({1, 2, 3}, {1, 2}, {1, 2, 3}), InvalidParameter);
}

// ==================== Linear Regression ====================

TEST_F(EnvelopeTest, LinRegPerfectLine) {
    std::vector<Value> line;
    for (int i = 0; i < 12; ++i) {
        line.push_back(2.0 * i + 1.0);
    }
    LinReg lr(5, 2.0);
    auto out = lr.calculate(line);
    for (Size i = 0; i < 4; ++i) {
        EXPECT_TRUE(testutil::allNaN(out[i]));
    }
    for (Size i = 4; i < out.size(); ++i) {
        EXPECT_NEAR(out[i].slope, 2.0, 1e-9);
        EXPECT_NEAR(out[i].intercept, 2.0 * (i - 4) + 1.0, 1e-9);
        EXPECT_NEAR(out[i].value, line[i], 1e-9);
        EXPECT_NEAR(out[i].r, 1.0, 1e-12);
        EXPECT_NEAR(out[i].rSquared, 1.0, 1e-12);
        EXPECT_NEAR(out[i].upper, line[i], 1e-9);
        EXPECT_NEAR(out[i].lower, line[i], 1e-9);
    }
}

TEST_F(EnvelopeTest, LinRegDescendingLine) {
    LinReg lr(3, 1.0);
    auto out = lr.calculate({9, 6, 3});
    EXPECT_NEAR(out[2].slope, -3.0, 1e-12);
    EXPECT_NEAR(out[2].r, -1.0, 1e-12);
}

TEST_F(EnvelopeTest, LinRegConstantHasZeroCorrelation) {
    LinReg lr(4);
    auto out = lr.calculate({5, 5, 5, 5, 5});
    EXPECT_DOUBLE_EQ(out[3].slope, 0.0);
    EXPECT_DOUBLE_EQ(out[3].r, 0.0);
    EXPECT_DOUBLE_EQ(out[3].rSquared, 0.0);
    EXPECT_DOUBLE_EQ(out[3].value, 5.0);
}

TEST_F(EnvelopeTest, LinRegResidualChannel) {
    // x = 0..3, y = [0, 2, 0, 2] -> slope 0.4, intercept 0.4
    LinReg lr(4, 1.0);
    auto out = lr.calculate({0, 2, 0, 2});
    EXPECT_NEAR(out[3].slope, 0.4, 1e-12);
    EXPECT_NEAR(out[3].intercept, 0.4, 1e-12);
    EXPECT_NEAR(out[3].value, 1.6, 1e-12);
    // 残差 [-0.4, 1.2, -1.2, 0.4]
    Value sigma = std::sqrt((0.16 + 1.44 + 1.44 + 0.16) / 4.0);
    EXPECT_NEAR(out[3].upper, 1.6 + sigma, 1e-9);
    EXPECT_NEAR(out[3].lower, 1.6 - sigma, 1e-9);
}

TEST_F(EnvelopeTest, LinRegZeroMultiplierCollapsesChannel) {
    LinReg lr(10, 0.0);
    auto out = lr.calculate(prices);
    for (Size i = 9; i < out.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[i].upper, out[i].value);
        EXPECT_DOUBLE_EQ(out[i].lower, out[i].value);
    }
}

TEST_F(EnvelopeTest, LinRegRejects) {
    EXPECT_THROW(LinReg(0), InvalidParameter);
    EXPECT_THROW(LinReg(1), InvalidParameter);
    EXPECT_THROW(LinReg(10, -0.5), InvalidParameter);
    EXPECT_THROW(LinReg(10, NaN), InvalidParameter);
    EXPECT_THROW(LinReg(10, Inf), InvalidParameter);
    EXPECT_NO_THROW(LinReg(2, 0.0));
}
