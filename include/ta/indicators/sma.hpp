/**
 * @file indicators/sma.hpp
 * @brief 简单移动平均 (SMA) 与加权移动平均 (WMA)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/rolling.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 简单移动平均 (SMA)
 *
 * 计算公式: SMA = sum(x, period) / period
 * 环形缓冲 + 滑动和，每步 O(1)。
 */
class TA_API SMA : public Indicator<SMA, Value, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 30)
    TA_PARAMS_END()

    explicit SMA(const Params& params = {});
    explicit SMA(Size period);

    std::optional<Value> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    RollingSum window_;
};

/**
 * @brief 加权移动平均 (WMA)
 *
 * 权重 1..n（最新值最重），分母 n(n+1)/2。
 * 递推: weighted' = weighted - simple + x * n
 */
class TA_API WMA : public Indicator<WMA, Value, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 30)
    TA_PARAMS_END()

    explicit WMA(const Params& params = {});
    explicit WMA(Size period);

    std::optional<Value> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    Value denominator_ = 1.0;
    RingBuffer buffer_;
    Value weightedSum_ = 0.0;
    Value simpleSum_ = 0.0;
};

} // namespace indicators

using SMA = indicators::SMA;
using WMA = indicators::WMA;

} // namespace ta
