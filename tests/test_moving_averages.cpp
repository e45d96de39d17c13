/**
 * @file test_moving_averages.cpp
 * @brief SMA / EMA / WMA / HMA 测试
 */

#include <gtest/gtest.h>
#include "ta/tacore.hpp"
#include "test_util.hpp"

using namespace ta;
using testutil::expectSeriesNear;

class MovingAverageTest : public ::testing::Test {
protected:
    void SetUp() override {
        priceData = {
            100.0, 101.0, 102.0, 103.0, 104.0,
            105.0, 104.0, 103.0, 102.0, 101.0,
            100.0, 101.0, 102.0, 103.0, 104.0,
            105.0, 106.0, 107.0, 108.0, 109.0,
            110.0, 109.0, 108.0, 107.0, 106.0,
            105.0, 104.0, 103.0, 102.0, 101.0
        };
    }

    std::vector<Value> priceData;

    // 朴素 SMA
    Value expectedSMA(Size end, Size period) const {
        Value sum = 0;
        for (Size i = 0; i < period; ++i) {
            sum += priceData[end - i];
        }
        return sum / static_cast<Value>(period);
    }

    // 朴素 WMA
    static Value expectedWMA(const std::vector<Value>& data, Size end, Size period) {
        Value weighted = 0;
        for (Size i = 0; i < period; ++i) {
            weighted += data[end - i] * static_cast<Value>(period - i);
        }
        return weighted / (static_cast<Value>(period) * (period + 1) / 2.0);
    }
};

// ==================== SMA ====================

TEST_F(MovingAverageTest, SMASeed) {
    SMA sma(3);
    expectSeriesNear(sma.calculate({1, 2, 3, 4, 5}), {NaN, NaN, 2, 3, 4});
}

TEST_F(MovingAverageTest, SMAMatchesNaiveMean) {
    SMA sma(5);
    auto out = sma.calculate(priceData);
    ASSERT_EQ(out.size(), priceData.size());
    for (Size i = 0; i < 4; ++i) {
        EXPECT_TRUE(std::isnan(out[i]));
    }
    for (Size i = 4; i < out.size(); ++i) {
        EXPECT_NEAR(out[i], expectedSMA(i, 5), 1e-9);
    }
}

TEST_F(MovingAverageTest, SMAPeriodOneIsIdentity) {
    SMA sma(1);
    expectSeriesNear(sma.calculate({3, 1, 4, 1, 5}), {3, 1, 4, 1, 5});
}

TEST_F(MovingAverageTest, SMAStreaming) {
    SMA sma(3);
    EXPECT_FALSE(sma.isReady());
    EXPECT_FALSE(sma.current().has_value());
    EXPECT_THROW(sma.valueOrThrow(), NotInitialized);

    EXPECT_FALSE(sma.next(1.0).has_value());
    EXPECT_FALSE(sma.next(2.0).has_value());
    auto v = sma.next(3.0);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 2.0);
    EXPECT_TRUE(sma.isReady());
    EXPECT_DOUBLE_EQ(sma.valueOrThrow(), 2.0);

    sma.reset();
    EXPECT_FALSE(sma.isReady());
    EXPECT_FALSE(sma.next(10.0).has_value());
}

TEST_F(MovingAverageTest, SMAInitThenContinue) {
    SMA sma(3);
    auto prefix = sma.init({1, 2, 3, 4});
    expectSeriesNear(prefix, {NaN, NaN, 2, 3});
    auto v = sma.next(5.0);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 4.0);
}

TEST_F(MovingAverageTest, CalculateDoesNotTouchStreamState) {
    SMA sma(2);
    sma.next(10.0);
    sma.next(20.0);
    auto batch = sma.calculate({1, 2, 3});
    expectSeriesNear(batch, {NaN, 1.5, 2.5});
    // 流状态保持：窗口仍为 [10, 20]
    EXPECT_DOUBLE_EQ(*sma.next(30.0), 25.0);
}

TEST_F(MovingAverageTest, SMARejectsZeroPeriod) {
    EXPECT_THROW(SMA(0), InvalidParameter);
}

TEST_F(MovingAverageTest, EmptyInput) {
    EXPECT_TRUE(SMA(3).calculate({}).empty());
    EXPECT_TRUE(EMA(3).calculate({}).empty());
    EXPECT_TRUE(WMA(3).calculate({}).empty());
    EXPECT_TRUE(HMA(4).calculate({}).empty());
}

// ==================== EMA ====================

TEST_F(MovingAverageTest, EMASeed) {
    EMA ema(3);
    EXPECT_DOUBLE_EQ(ema.multiplier(), 0.5);
    expectSeriesNear(ema.calculate({2, 4, 6, 8, 10}), {NaN, NaN, 4, 6, 8});
}

TEST_F(MovingAverageTest, EMAExplicitMultiplier) {
    EMA ema(3, 0.5);
    expectSeriesNear(ema.calculate({2, 4, 6, 8, 10, 12}), {NaN, NaN, 4, 6, 8, 10});

    EMA slow(2, 0.1);
    auto out = slow.calculate({10, 20, 30});
    EXPECT_DOUBLE_EQ(out[1], 15.0);
    EXPECT_NEAR(out[2], 30.0 * 0.1 + 15.0 * 0.9, 1e-12);
}

TEST_F(MovingAverageTest, EMASeededBySMA) {
    EMA ema(5);
    auto out = ema.calculate(priceData);
    EXPECT_NEAR(out[4], expectedSMA(4, 5), 1e-9);
    Value alpha = 2.0 / 6.0;
    EXPECT_NEAR(out[5], priceData[5] * alpha + out[4] * (1 - alpha), 1e-9);
}

TEST_F(MovingAverageTest, EMARejects) {
    EXPECT_THROW(EMA(0), InvalidParameter);
    EXPECT_THROW(EMA(3, 0.0), InvalidParameter);
    EXPECT_THROW(EMA(3, -0.5), InvalidParameter);
    EXPECT_THROW(EMA(3, 1.5), InvalidParameter);
    EXPECT_THROW(EMA(3, NaN), InvalidParameter);
    EXPECT_NO_THROW(EMA(3, 1.0));
}

// ==================== WMA ====================

TEST_F(MovingAverageTest, WMASeed) {
    WMA wma(3);
    expectSeriesNear(wma.calculate({1, 2, 3, 4, 5}), {NaN, NaN, 14.0 / 6, 20.0 / 6, 26.0 / 6});
}

TEST_F(MovingAverageTest, WMAMatchesNaive) {
    WMA wma(7);
    auto out = wma.calculate(priceData);
    for (Size i = 6; i < out.size(); ++i) {
        EXPECT_NEAR(out[i], expectedWMA(priceData, i, 7), 1e-9);
    }
}

TEST_F(MovingAverageTest, WMARejectsZeroPeriod) {
    EXPECT_THROW(WMA(0), InvalidParameter);
}

// ==================== HMA ====================

TEST_F(MovingAverageTest, HMAPeriods) {
    HMA hma(9);
    EXPECT_EQ(hma.halfPeriod(), 4);
    EXPECT_EQ(hma.sqrtPeriod(), 3);
    EXPECT_EQ(hma.warmup(), 10);

    HMA small(2);
    EXPECT_EQ(small.halfPeriod(), 1);
    EXPECT_EQ(small.sqrtPeriod(), 1);
    EXPECT_EQ(small.warmup(), 1);
}

TEST_F(MovingAverageTest, HMATracksLinearInputWithoutLag) {
    // WMA_n 对线性序列滞后 (n-1)/3，HMA 抵消该滞后
    std::vector<Value> line;
    for (int i = 0; i < 20; ++i) {
        line.push_back(static_cast<Value>(i));
    }
    HMA hma(4);
    auto out = hma.calculate(line);
    for (Size i = 0; i < hma.warmup(); ++i) {
        EXPECT_TRUE(std::isnan(out[i]));
    }
    for (Size i = hma.warmup(); i < out.size(); ++i) {
        EXPECT_NEAR(out[i], static_cast<Value>(i), 1e-9);
    }
}

TEST_F(MovingAverageTest, HMAMatchesComposition) {
    HMA hma(9);
    auto out = hma.calculate(priceData);

    auto half = WMA(4).calculate(priceData);
    auto full = WMA(9).calculate(priceData);
    std::vector<Value> raw;
    for (Size i = 8; i < priceData.size(); ++i) {
        raw.push_back(2.0 * half[i] - full[i]);
    }
    auto hull = WMA(3).calculate(raw);

    for (Size i = 10; i < out.size(); ++i) {
        EXPECT_NEAR(out[i], hull[i - 8], 1e-9);
    }
}

TEST_F(MovingAverageTest, HMARejectsShortPeriod) {
    EXPECT_THROW(HMA(0), InvalidParameter);
    EXPECT_THROW(HMA(1), InvalidParameter);
    EXPECT_NO_THROW(HMA(2));
}
