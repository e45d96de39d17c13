/**
 * @file types.hpp
 * @brief 输入 bar 与多值输出记录
 *
 * 每个多值记录提供 nan()：批量/初始化模式中尚未定义的位置用它填充。
 */

#pragma once

#include "ta/common.hpp"
#include <vector>

namespace ta {

/**
 * @brief OHLCV bar
 */
struct OHLCV {
    Timestamp timestamp = 0;
    Value open = 0.0;
    Value high = 0.0;
    Value low = 0.0;
    Value close = 0.0;
    Value volume = 0.0;

    OHLCV() = default;
    OHLCV(Timestamp ts, Value o, Value h, Value l, Value c, Value v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}

    /// (H + L + C) / 3
    Value typicalPrice() const { return (high + low + close) / 3.0; }
    /// (H + L) / 2
    Value medianPrice() const { return (high + low) / 2.0; }
};

/**
 * @brief 高/低/收 bar（ATR、ADX、随机指标等）
 */
struct HLC {
    Value high = 0.0;
    Value low = 0.0;
    Value close = 0.0;
};

/**
 * @brief 高/低/收/量 bar（MFI、CVD-OHLCV）
 */
struct HLCV {
    Value high = 0.0;
    Value low = 0.0;
    Value close = 0.0;
    Value volume = 0.0;
};

// ==================== 输出记录 ====================

struct MACDOutput {
    Value macd = NaN;
    Value signal = NaN;
    Value histogram = NaN;

    static MACDOutput nan() { return {}; }
};

struct BollingerOutput {
    Value upper = NaN;
    Value middle = NaN;
    Value lower = NaN;
    Value percentB = NaN;
    Value bandwidth = NaN;

    static BollingerOutput nan() { return {}; }
};

struct ADXOutput {
    Value adx = NaN;
    Value plusDI = NaN;
    Value minusDI = NaN;

    static ADXOutput nan() { return {}; }
};

struct StochasticOutput {
    Value k = NaN;
    Value d = NaN;

    static StochasticOutput nan() { return {}; }
};

struct IchimokuOutput {
    Value tenkanSen = NaN;
    Value kijunSen = NaN;
    Value senkouSpanA = NaN;
    Value senkouSpanB = NaN;
    Value chikouSpan = NaN;

    static IchimokuOutput nan() { return {}; }
};

struct LinRegOutput {
    Value value = NaN;     // 窗口末端的回归值
    Value upper = NaN;
    Value lower = NaN;
    Value slope = NaN;
    Value intercept = NaN;
    Value r = NaN;
    Value rSquared = NaN;

    static LinRegOutput nan() { return {}; }
};

struct PivotPointsOutput {
    Value pivot = NaN;
    Value r1 = NaN;
    Value r2 = NaN;
    Value r3 = NaN;
    Value s1 = NaN;
    Value s2 = NaN;
    Value s3 = NaN;

    static PivotPointsOutput nan() { return {}; }
};

/**
 * @brief 成交量分布中的一个价格区间
 */
struct VolumeProfileRow {
    Value price = NaN;   // 区间中点
    Value volume = 0.0;
    Value low = NaN;
    Value high = NaN;
};

/**
 * @brief 固定区间成交量分布结果
 */
struct FRVPOutput {
    Value poc = NaN;
    Value vah = NaN;
    Value val = NaN;
    Value totalVolume = 0.0;
    Value pocVolume = 0.0;
    Value valueAreaVolume = 0.0;
    Value rangeHigh = NaN;
    Value rangeLow = NaN;
    std::vector<VolumeProfileRow> histogram;
};

/**
 * @brief 序列模式下“未定义”位置的占位值
 */
template<typename T>
struct Sentinel {
    static T value() { return T::nan(); }
};

template<>
struct Sentinel<Value> {
    static Value value() { return NaN; }
};

} // namespace ta
