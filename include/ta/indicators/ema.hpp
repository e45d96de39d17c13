/**
 * @file indicators/ema.hpp
 * @brief 指数移动平均 (Exponential Moving Average)
 */

#pragma once

#include "ta/indicator.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 指数移动平均 (EMA)
 *
 * 计算公式:
 * - alpha = 2 / (period + 1)，或显式给定的 multiplier ∈ (0, 1]
 * - 种子 = 前 period 个值的 SMA
 * - EMA = x * alpha + EMA_prev * (1 - alpha)
 *
 * 参数 multiplier 为 0 表示使用默认 alpha。
 */
class TA_API EMA : public Indicator<EMA, Value, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 30)
        TA_PARAM(multiplier, 0.0)
    TA_PARAMS_END()

    explicit EMA(const Params& params = {});
    explicit EMA(Size period);
    EMA(Size period, Value multiplier);

    std::optional<Value> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Value multiplier() const { return alpha_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    Value alpha_ = 0.0;
    Size count_ = 0;
    Value seedSum_ = 0.0;
    Value ema_ = NaN;
};

} // namespace indicators

using EMA = indicators::EMA;

} // namespace ta
