/**
 * @file indicators/bollinger.hpp
 * @brief 布林带 (Bollinger Bands)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/rolling.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 布林带
 *
 * - middle: SMA(period)
 * - upper/lower: middle ± devfactor * 总体标准差
 * - percentB: (x - lower) / (upper - lower)，带宽为 0 时取 0.5
 * - bandwidth: (upper - lower) / middle，middle 为 0 时取 0
 */
class TA_API BollingerBands : public Indicator<BollingerBands, Value, BollingerOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 20)
        TA_PARAM(devfactor, 2.0)
    TA_PARAMS_END()

    explicit BollingerBands(const Params& params = {});
    BollingerBands(Size period, Value devfactor);

    std::optional<BollingerOutput> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Value k() const { return devfactor_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    Value devfactor_ = 2.0;
    RollingMoments moments_;
};

} // namespace indicators

using BollingerBands = indicators::BollingerBands;

} // namespace ta
