/**
 * @file indicators/hma.hpp
 * @brief Hull 移动平均 (Hull Moving Average)
 */

#pragma once

#include "ta/indicators/sma.hpp"

namespace ta {
namespace indicators {

/**
 * @brief Hull 移动平均 (HMA)
 *
 * raw = 2 * WMA(n/2) - WMA(n)
 * HMA = WMA(raw, floor(sqrt(n)))
 */
class TA_API HMA : public Indicator<HMA, Value, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 9)
    TA_PARAMS_END()

    explicit HMA(const Params& params = {});
    explicit HMA(Size period);

    std::optional<Value> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Size halfPeriod() const { return period_ / 2; }
    Size sqrtPeriod() const { return sqrtPeriod_; }
    Size warmup() const { return period_ + sqrtPeriod_ - 2; }

private:
    void setup();

    Size period_ = 0;
    Size sqrtPeriod_ = 1;
    WMA wmaHalf_;
    WMA wmaFull_;
    WMA wmaSqrt_;
};

} // namespace indicators

using HMA = indicators::HMA;

} // namespace ta
