/**
 * @file test_trend.cpp
 * @brief MACD / Ichimoku / Pivot Points 测试
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "ta/tacore.hpp"
#include "test_util.hpp"

using namespace ta;

namespace {

template<typename F>
std::string rejectionReason(F&& make) {
    try {
        make();
    } catch (const InvalidParameter& e) {
        return e.reason();
    }
    return "";
}

} // namespace

class TrendTest : public ::testing::Test {
protected:
    void SetUp() override {
        bars = testutil::randomWalkBars(150, 23);
        prices = testutil::closes(bars);
    }

    std::vector<OHLCV> bars;
    std::vector<Value> prices;
};

// ==================== MACD ====================

TEST_F(TrendTest, MACDMatchesEMAComposition) {
    MACD macd(5, 10, 4);
    auto out = macd.calculate(prices);
    auto fast = EMA(5).calculate(prices);
    auto slow = EMA(10).calculate(prices);

    ASSERT_EQ(out.size(), prices.size());
    for (Size i = 0; i < macd.warmup(); ++i) {
        EXPECT_TRUE(testutil::allNaN(out[i]));
    }

    std::vector<Value> line;
    for (Size i = macd.warmup(); i < prices.size(); ++i) {
        EXPECT_NEAR(out[i].macd, fast[i] - slow[i], 1e-9);
        line.push_back(fast[i] - slow[i]);
    }

    auto signal = EMA(4).calculate(line);
    for (Size j = 0; j < line.size(); ++j) {
        Size i = j + macd.warmup();
        if (std::isnan(signal[j])) {
            EXPECT_TRUE(std::isnan(out[i].signal));
            EXPECT_TRUE(std::isnan(out[i].histogram));
        } else {
            EXPECT_NEAR(out[i].signal, signal[j], 1e-9);
            EXPECT_NEAR(out[i].histogram, out[i].macd - out[i].signal, 1e-12);
        }
    }
}

TEST_F(TrendTest, MACDWarmup) {
    MACD macd(12, 26, 9);
    EXPECT_EQ(macd.warmup(), 25u);
    EXPECT_EQ(macd.warmupSignal(), 33u);

    auto out = macd.calculate(prices);
    EXPECT_TRUE(std::isnan(out[24].macd));
    EXPECT_FALSE(std::isnan(out[25].macd));
    EXPECT_TRUE(std::isnan(out[32].signal));
    EXPECT_FALSE(std::isnan(out[33].signal));
}

TEST_F(TrendTest, MACDSMASignal) {
    MACD macd(3, 6, 4, SignalType::SMA);
    EXPECT_EQ(macd.signalType(), SignalType::SMA);
    EXPECT_EQ(macd.params().get<std::string>("signal_type"), "sma");

    auto out = macd.calculate(prices);
    for (Size i = macd.warmupSignal(); i < out.size(); ++i) {
        Value mean = 0.0;
        for (Size j = i - 3; j <= i; ++j) {
            mean += out[j].macd;
        }
        EXPECT_NEAR(out[i].signal, mean / 4.0, 1e-9);
    }
    EXPECT_TRUE(std::isnan(out[macd.warmupSignal() - 1].signal));
}

TEST_F(TrendTest, MACDSignalTypeFromParams) {
    Params params;
    params.set("signal_type", "sma");
    MACD macd(params);
    EXPECT_EQ(macd.signalType(), SignalType::SMA);
    EXPECT_EQ(macd.fastPeriod(), 12u);
}

TEST_F(TrendTest, MACDRejects) {
    EXPECT_EQ(rejectionReason([] { MACD(0, 26, 9); }), "all periods must be greater than 0");
    EXPECT_EQ(rejectionReason([] { MACD(12, 26, 0); }), "all periods must be greater than 0");
    EXPECT_EQ(rejectionReason([] { MACD(26, 12, 9); }), "fast_period must be less than slow_period");
    EXPECT_EQ(rejectionReason([] { MACD(12, 12, 9); }), "fast_period must be less than slow_period");

    Params params;
    params.set("signal_type", "wma");
    EXPECT_THROW(MACD{params}, InvalidParameter);
}

// ==================== Ichimoku ====================

TEST_F(TrendTest, IchimokuRisingBars) {
    std::vector<HLC> data;
    for (int i = 0; i < 10; ++i) {
        data.push_back({10.0 + i, 8.0 + i, 9.0 + i});
    }

    Ichimoku ichi(2, 3, 4);
    auto out = ichi.calculate(data);
    ASSERT_EQ(out.size(), data.size());

    EXPECT_TRUE(std::isnan(out[0].tenkanSen));
    EXPECT_DOUBLE_EQ(out[0].chikouSpan, 9.0);
    EXPECT_TRUE(std::isnan(out[1].kijunSen));
    EXPECT_TRUE(std::isnan(out[1].senkouSpanA));
    EXPECT_TRUE(std::isnan(out[2].senkouSpanB));

    for (Size i = 1; i < out.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[i].tenkanSen, 8.5 + i);
        EXPECT_DOUBLE_EQ(out[i].chikouSpan, data[i].close);
    }
    for (Size i = 2; i < out.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[i].kijunSen, 8.0 + i);
        EXPECT_DOUBLE_EQ(out[i].senkouSpanA, (out[i].tenkanSen + out[i].kijunSen) / 2.0);
    }
    for (Size i = 3; i < out.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[i].senkouSpanB, 7.5 + i);
    }
}

TEST_F(TrendTest, IchimokuMatchesBruteForce) {
    auto data = testutil::toHLC(bars);
    Ichimoku ichi(9, 26, 52);
    auto out = ichi.calculate(data);

    for (Size i = 25; i < data.size(); ++i) {
        Value hi = data[i].high;
        Value lo = data[i].low;
        for (Size j = i - 25; j <= i; ++j) {
            hi = std::max(hi, data[j].high);
            lo = std::min(lo, data[j].low);
        }
        EXPECT_DOUBLE_EQ(out[i].kijunSen, (hi + lo) / 2.0);
    }
}

TEST_F(TrendTest, IchimokuDefaultsAndRejects) {
    Ichimoku ichi;
    EXPECT_EQ(ichi.tenkanPeriod(), 9u);
    EXPECT_EQ(ichi.kijunPeriod(), 26u);
    EXPECT_EQ(ichi.senkouPeriod(), 52u);
    EXPECT_THROW(Ichimoku(0, 26, 52), InvalidParameter);

    EXPECT_THROW(ichi.calculate({1, 2}, {1, 2}, {1}), InvalidParameter);
}

// ==================== Pivot Points ====================

TEST_F(TrendTest, PivotStandard) {
    PivotPoints pivots;
    EXPECT_EQ(pivots.type(), PivotType::Standard);

    auto out = pivots.calculate(110.0, 100.0, 105.0);
    EXPECT_DOUBLE_EQ(out.pivot, 105.0);
    EXPECT_DOUBLE_EQ(out.r1, 110.0);
    EXPECT_DOUBLE_EQ(out.s1, 100.0);
    EXPECT_DOUBLE_EQ(out.r2, 115.0);
    EXPECT_DOUBLE_EQ(out.s2, 95.0);
    EXPECT_DOUBLE_EQ(out.r3, 120.0);
    EXPECT_DOUBLE_EQ(out.s3, 90.0);
}

TEST_F(TrendTest, PivotFibonacci) {
    PivotPoints pivots(PivotType::Fibonacci);
    auto out = pivots.calculate(110.0, 100.0, 105.0);
    EXPECT_NEAR(out.pivot, 105.0, 1e-12);
    EXPECT_NEAR(out.r1, 108.82, 1e-9);
    EXPECT_NEAR(out.s1, 101.18, 1e-9);
    EXPECT_NEAR(out.r2, 111.18, 1e-9);
    EXPECT_NEAR(out.s2, 98.82, 1e-9);
    EXPECT_NEAR(out.r3, 115.0, 1e-9);
    EXPECT_NEAR(out.s3, 95.0, 1e-9);
}

TEST_F(TrendTest, PivotWoodie) {
    Params params;
    params.set("type", "woodie");
    PivotPoints pivots(params);
    EXPECT_EQ(pivots.type(), PivotType::Woodie);

    auto out = pivots.calculate(110.0, 100.0, 108.0);
    EXPECT_DOUBLE_EQ(out.pivot, 106.5);
    EXPECT_DOUBLE_EQ(out.r1, 113.0);
    EXPECT_DOUBLE_EQ(out.s1, 103.0);
    EXPECT_DOUBLE_EQ(out.r2, 116.5);
    EXPECT_DOUBLE_EQ(out.s2, 96.5);
}

TEST_F(TrendTest, PivotSeriesAndNaN) {
    PivotPoints pivots;
    auto out = pivots.calculate({110.0, NaN, 120.0}, {100.0, 90.0, 110.0}, {105.0, 95.0, 115.0});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[0].pivot, 105.0);
    EXPECT_TRUE(testutil::allNaN(out[1]));
    EXPECT_DOUBLE_EQ(out[2].pivot, 115.0);

    // 流式：每根 bar 独立计算
    PivotPoints stream;
    EXPECT_FALSE(stream.isReady());
    auto v = stream.next(HLC{120.0, 110.0, 115.0});
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->pivot, 115.0);
    EXPECT_TRUE(stream.isReady());
}

TEST_F(TrendTest, PivotRejectsUnknownType) {
    Params params;
    params.set("type", "camarilla");
    EXPECT_THROW(PivotPoints{params}, InvalidParameter);
    EXPECT_STREQ(PivotPoints::toString(PivotType::Fibonacci), "fibonacci");
}
