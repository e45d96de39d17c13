/**
 * @file test_properties.cpp
 * @brief 所有指标共有性质：长度、预热、因果性、流式与批量一致、reset 幂等、取值范围
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "ta/tacore.hpp"
#include "test_util.hpp"

using namespace ta;
using testutil::primary;
using testutil::sameRecord;

namespace {

constexpr Value kTol = 1e-9;

template<typename Ind>
std::vector<typename Ind::Output> stream(Ind& ind, const std::vector<typename Ind::Input>& data) {
    std::vector<typename Ind::Output> out;
    for (const auto& x : data) {
        auto v = ind.next(x);
        out.push_back(v ? *v : Sentinel<typename Ind::Output>::value());
    }
    return out;
}

/**
 * @brief 对一个指标检查通用性质
 * @param warmup 主输出首次有定义的下标
 */
template<typename Ind>
void checkCommon(const Ind& proto, const std::vector<typename Ind::Input>& data, Size warmup) {
    auto batch = proto.calculate(data);

    // 长度不变
    ASSERT_EQ(batch.size(), data.size());

    // 预热前全部未定义，预热处主输出有定义
    for (Size i = 0; i < warmup && i < batch.size(); ++i) {
        EXPECT_TRUE(testutil::allNaN(batch[i])) << "index " << i;
    }
    ASSERT_LT(warmup, batch.size());
    EXPECT_FALSE(std::isnan(primary(batch[warmup])));

    // 因果性：前缀的结果是整体结果的前缀
    Size cut = data.size() / 2;
    std::vector<typename Ind::Input> prefix(data.begin(), data.begin() + cut);
    auto head = proto.calculate(prefix);
    for (Size i = 0; i < cut; ++i) {
        EXPECT_TRUE(sameRecord(head[i], batch[i], kTol)) << "index " << i;
    }

    // 流式与批量一致
    Ind ind = proto;
    auto streamed = stream(ind, data);
    for (Size i = 0; i < data.size(); ++i) {
        EXPECT_TRUE(sameRecord(streamed[i], batch[i], kTol)) << "index " << i;
    }
    EXPECT_TRUE(ind.isReady());
    ASSERT_TRUE(ind.current().has_value());
    EXPECT_TRUE(sameRecord(*ind.current(), batch.back(), kTol));

    // reset 后回到初始状态
    ind.reset();
    EXPECT_FALSE(ind.isReady());
    EXPECT_THROW(ind.valueOrThrow(), NotInitialized);
    auto again = stream(ind, data);
    for (Size i = 0; i < data.size(); ++i) {
        EXPECT_TRUE(sameRecord(again[i], batch[i], kTol)) << "index " << i;
    }

    // init 与 calculate 一致，且可重复
    auto first = ind.init(data);
    auto second = ind.init(data);
    for (Size i = 0; i < data.size(); ++i) {
        EXPECT_TRUE(sameRecord(first[i], batch[i], kTol));
        EXPECT_TRUE(sameRecord(second[i], batch[i], kTol));
    }
}

void expectWithin(const std::vector<Value>& values, Value lo, Value hi) {
    for (Size i = 0; i < values.size(); ++i) {
        if (!std::isnan(values[i])) {
            EXPECT_GE(values[i], lo - kTol) << "index " << i;
            EXPECT_LE(values[i], hi + kTol) << "index " << i;
        }
    }
}

} // namespace

class PropertyTest : public ::testing::Test {
protected:
    void SetUp() override {
        bars = testutil::randomWalkBars(300, 77);
        prices = testutil::closes(bars);
        hlc = testutil::toHLC(bars);
        hlcv = testutil::toHLCV(bars);
    }

    std::vector<OHLCV> bars;
    std::vector<Value> prices;
    std::vector<HLC> hlc;
    std::vector<HLCV> hlcv;
};

// ==================== 均线 ====================

TEST_F(PropertyTest, MovingAverages) {
    SMA sma(14);
    checkCommon(sma, prices, sma.warmup());
    EMA ema(14);
    checkCommon(ema, prices, ema.warmup());
    WMA wma(14);
    checkCommon(wma, prices, wma.warmup());
    HMA hma(16);
    checkCommon(hma, prices, hma.warmup());
}

TEST_F(PropertyTest, MovingAveragesStayWithinWindowRange) {
    for (const auto& out : {SMA(10).calculate(prices), WMA(10).calculate(prices)}) {
        for (Size i = 9; i < prices.size(); ++i) {
            auto lo = *std::min_element(prices.begin() + (i - 9), prices.begin() + i + 1);
            auto hi = *std::max_element(prices.begin() + (i - 9), prices.begin() + i + 1);
            EXPECT_GE(out[i], lo - kTol);
            EXPECT_LE(out[i], hi + kTol);
        }
    }
}

// ==================== 振荡器 ====================

TEST_F(PropertyTest, RSI) {
    RSI rsi(14);
    checkCommon(rsi, prices, rsi.warmup());
    expectWithin(rsi.calculate(prices), 0.0, 100.0);
}

TEST_F(PropertyTest, Stochastic) {
    Stochastic fast(14, 3);
    checkCommon(fast, hlc, fast.warmup());

    Stochastic slow(14, 3, StochType::Slow, 3);
    checkCommon(slow, hlc, slow.warmup());

    for (const auto& out : slow.calculate(hlc)) {
        expectWithin({out.k, out.d}, 0.0, 100.0);
    }
}

TEST_F(PropertyTest, StochRSI) {
    StochRSI srsi(14, 14, 3, 3);
    checkCommon(srsi, prices, srsi.warmup());
    for (const auto& out : srsi.calculate(prices)) {
        expectWithin({out.k, out.d}, 0.0, 100.0);
    }
}

TEST_F(PropertyTest, MFI) {
    MFI mfi(14);
    checkCommon(mfi, hlcv, mfi.warmup());
    expectWithin(mfi.calculate(hlcv), 0.0, 100.0);
}

TEST_F(PropertyTest, ADX) {
    ADX adx(14);
    checkCommon(adx, hlc, adx.warmup());

    auto out = adx.calculate(hlc);
    EXPECT_TRUE(std::isnan(out[adx.warmupADX() - 1].adx));
    EXPECT_FALSE(std::isnan(out[adx.warmupADX()].adx));
    for (const auto& o : out) {
        expectWithin({o.adx, o.plusDI, o.minusDI}, 0.0, 100.0);
    }
}

// ==================== 趋势与通道 ====================

TEST_F(PropertyTest, MACD) {
    MACD macd(12, 26, 9);
    checkCommon(macd, prices, macd.warmup());
    MACD smaSignal(12, 26, 9, SignalType::SMA);
    checkCommon(smaSignal, prices, smaSignal.warmup());
}

TEST_F(PropertyTest, BollingerBands) {
    BollingerBands bb(20, 2.0);
    checkCommon(bb, prices, bb.warmup());
    for (const auto& o : bb.calculate(prices)) {
        if (std::isnan(o.middle)) continue;
        EXPECT_LE(o.lower, o.middle);
        EXPECT_LE(o.middle, o.upper);
        EXPECT_GE(o.bandwidth, 0.0);
    }
}

TEST_F(PropertyTest, ATR) {
    ATR atr(14);
    checkCommon(atr, hlc, atr.warmup());
    expectWithin(atr.calculate(hlc), 0.0, Inf);
}

TEST_F(PropertyTest, Ichimoku) {
    Ichimoku ichi;
    checkCommon(ichi, hlc, ichi.warmup());
}

TEST_F(PropertyTest, LinReg) {
    LinReg lr(20, 2.0);
    checkCommon(lr, prices, lr.warmup());
    for (const auto& o : lr.calculate(prices)) {
        if (std::isnan(o.value)) continue;
        expectWithin({o.r}, -1.0, 1.0);
        expectWithin({o.rSquared}, 0.0, 1.0);
        EXPECT_LE(o.lower, o.value);
        EXPECT_GE(o.upper, o.value);
    }
}

TEST_F(PropertyTest, PivotPoints) {
    for (auto type : {PivotType::Standard, PivotType::Fibonacci, PivotType::Woodie}) {
        PivotPoints pivots(type);
        checkCommon(pivots, hlc, pivots.warmup());
        for (const auto& o : pivots.calculate(hlc)) {
            EXPECT_LE(o.s3, o.s2);
            EXPECT_LE(o.s2, o.s1);
            EXPECT_LE(o.r1, o.r2);
            EXPECT_LE(o.r2, o.r3);
        }
    }
}

// ==================== 成交量 ====================

TEST_F(PropertyTest, VWAPFamily) {
    SessionVWAP session;
    checkCommon(session, bars, session.warmup());
    RollingVWAP rolling(20);
    checkCommon(rolling, bars, rolling.warmup());
    auto anchored = AnchoredVWAP::atIndex(10);
    checkCommon(anchored, bars, 10);
}

TEST_F(PropertyTest, SessionVolumeIsMonotoneWithinSession) {
    SessionVWAP vwap;
    std::optional<Timestamp> day;
    Value lastVolume = 0.0;
    for (const auto& bar : bars) {
        vwap.next(bar);
        if (day == vwap.sessionDay()) {
            EXPECT_GE(vwap.cumulativeVolume(), lastVolume);
        } else {
            EXPECT_DOUBLE_EQ(vwap.cumulativeVolume(), bar.volume);
        }
        day = vwap.sessionDay();
        lastVolume = vwap.cumulativeVolume();
    }
}

TEST_F(PropertyTest, CVDIsPrefixSum) {
    std::vector<Value> deltas;
    for (const auto& bar : bars) {
        deltas.push_back(CVDOHLCV::delta(bar.high, bar.low, bar.close, bar.volume));
    }

    CVD cvd;
    checkCommon(cvd, deltas, cvd.warmup());
    CVDOHLCV cvdBars;
    checkCommon(cvdBars, hlcv, cvdBars.warmup());

    auto direct = cvd.calculate(deltas);
    auto fromBars = cvdBars.calculate(hlcv);
    Value sum = 0.0;
    for (Size i = 0; i < deltas.size(); ++i) {
        sum += deltas[i];
        EXPECT_DOUBLE_EQ(direct[i], sum);
        EXPECT_DOUBLE_EQ(fromBars[i], sum);
    }
}
