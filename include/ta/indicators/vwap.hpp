/**
 * @file indicators/vwap.hpp
 * @brief 成交量加权平均价 (VWAP)：会话、滚动、锚定
 *
 * VWAP = Σ(tp * V) / ΣV，tp = (H + L + C) / 3
 * 累计成交量为 0 时无输出。
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/rolling.hpp"
#include <optional>

namespace ta {
namespace indicators {

/**
 * @brief 时间戳所在的 UTC 日序号（向下取整，负时间戳落在前一天）
 */
inline Timestamp dayNumber(Timestamp ts) {
    Timestamp q = ts / MILLIS_PER_DAY;
    if (ts % MILLIS_PER_DAY != 0 && ts < 0) {
        --q;
    }
    return q;
}

/**
 * @brief 会话 VWAP - 按 UTC 日重置
 */
class TA_API SessionVWAP : public Indicator<SessionVWAP, OHLCV, Value> {
public:
    SessionVWAP() = default;
    explicit SessionVWAP(const Params& params) : Indicator(params) {}

    using Indicator::calculate;
    std::vector<Value> calculate(const std::vector<Timestamp>& timestamp,
                                 const std::vector<Value>& open,
                                 const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close,
                                 const std::vector<Value>& volume) const;

    std::optional<Value> next(const OHLCV& bar) override;
    void reset() override;

    Value cumulativeTpVolume() const { return cumTpVolume_; }
    Value cumulativeVolume() const { return cumVolume_; }
    std::optional<Timestamp> sessionDay() const { return day_; }

    Size warmup() const { return 0; }

private:
    std::optional<Timestamp> day_;
    Value cumTpVolume_ = 0.0;
    Value cumVolume_ = 0.0;
};

/**
 * @brief 滚动 VWAP - 最近 period 个 bar
 */
class TA_API RollingVWAP : public Indicator<RollingVWAP, OHLCV, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 20)
    TA_PARAMS_END()

    explicit RollingVWAP(const Params& params = {});
    explicit RollingVWAP(Size period);

    using Indicator::calculate;
    std::vector<Value> calculate(const std::vector<Timestamp>& timestamp,
                                 const std::vector<Value>& open,
                                 const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close,
                                 const std::vector<Value>& volume) const;

    std::optional<Value> next(const OHLCV& bar) override;
    void reset() override;

    Size period() const { return period_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    RollingSum tpVolume_;
    RollingSum volume_;
};

/**
 * @brief 锚定方式
 */
enum class AnchorMode {
    Timestamp,  // 第一个 timestamp >= anchor 的 bar
    Index,      // 第 anchor 个 bar（从 0 计）
    NextInput   // 下一个输入的 bar
};

/**
 * @brief 锚定 VWAP
 *
 * 锚点之前无输出；自锚点 bar 起单调累计。
 * 参数 anchor_mode 取 "timestamp"、"index" 或 "next"，anchor 为时间戳或下标。
 * reset() 回到配置的锚定方式（"next" 模式重新等待下一个输入）。
 */
class TA_API AnchoredVWAP : public Indicator<AnchoredVWAP, OHLCV, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(anchor_mode, "next")
        TA_PARAM(anchor, 0LL)
    TA_PARAMS_END()

    explicit AnchoredVWAP(const Params& params = {});

    static AnchoredVWAP atTimestamp(Timestamp anchor);
    static AnchoredVWAP atIndex(Size index);
    static AnchoredVWAP atNextInput();

    /**
     * @brief 第一个 timestamp >= anchor 的下标
     */
    static std::optional<Size> fromTimestamp(const std::vector<OHLCV>& data, Timestamp anchor);

    using Indicator::calculate;
    std::vector<Value> calculate(const std::vector<Timestamp>& timestamp,
                                 const std::vector<Value>& open,
                                 const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close,
                                 const std::vector<Value>& volume) const;

    std::optional<Value> next(const OHLCV& bar) override;
    void reset() override;

    /**
     * @brief 重新锚定到时间戳，清空累计
     */
    void setAnchor(Timestamp anchor);

    /**
     * @brief 锚定到下一个输入，清空累计
     */
    void anchorNow();

    AnchorMode anchorMode() const { return mode_; }
    /// 已绑定的锚点 bar 的时间戳
    std::optional<Timestamp> anchorTimestamp() const { return anchoredAt_; }
    Value cumulativeTpVolume() const { return cumTpVolume_; }
    Value cumulativeVolume() const { return cumVolume_; }

private:
    void setup();
    void configure(const char* mode, Timestamp anchor);

    AnchorMode mode_ = AnchorMode::NextInput;
    Timestamp anchor_ = 0;

    Size barIndex_ = 0;
    std::optional<Timestamp> anchoredAt_;
    Value cumTpVolume_ = 0.0;
    Value cumVolume_ = 0.0;
};

} // namespace indicators

using SessionVWAP = indicators::SessionVWAP;
using RollingVWAP = indicators::RollingVWAP;
using AnchoredVWAP = indicators::AnchoredVWAP;
using AnchorMode = indicators::AnchorMode;

} // namespace ta
