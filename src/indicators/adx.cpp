/**
 * @file indicators/adx.cpp
 * @brief ADX 实现
 */

#include "ta/indicators/adx.hpp"
#include "ta/indicators/atr.hpp"
#include "ta/series.hpp"
#include <cmath>

namespace ta {
namespace indicators {

ADX::ADX(const Params& params) : Indicator(params) {
    setup();
}

ADX::ADX(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void ADX::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "ADX", "period must be greater than 0");
    trSmooth_ = WilderSmoother(period_);
    plusDMSmooth_ = WilderSmoother(period_);
    minusDMSmooth_ = WilderSmoother(period_);
    adxSmooth_ = WilderSmoother(period_);
}

std::vector<ADXOutput> ADX::calculate(const std::vector<Value>& high,
                                      const std::vector<Value>& low,
                                      const std::vector<Value>& close) const {
    return calculate(zipHLC("ADX", high, low, close));
}

std::optional<ADXOutput> ADX::next(const HLC& bar) {
    if (!prev_) {
        prev_ = bar;
        return std::nullopt;
    }

    Value up = bar.high - prev_->high;
    Value down = prev_->low - bar.low;
    Value plusDM = 0.0;
    Value minusDM = 0.0;
    if (isnan(up) || isnan(down)) {
        plusDM = NaN;
        minusDM = NaN;
    } else {
        plusDM = (up > down && up > 0.0) ? up : 0.0;
        minusDM = (down > up && down > 0.0) ? down : 0.0;
    }
    Value tr = trueRange(bar.high, bar.low, prev_->close);
    prev_ = bar;

    auto trS = trSmooth_.update(tr);
    auto plusS = plusDMSmooth_.update(plusDM);
    auto minusS = minusDMSmooth_.update(minusDM);
    if (!trS || !plusS || !minusS) {
        return std::nullopt;
    }

    ADXOutput out;
    Value dx = 0.0;
    if (*trS == 0.0) {
        out.plusDI = 0.0;
        out.minusDI = 0.0;
    } else {
        out.plusDI = 100.0 * *plusS / *trS;
        out.minusDI = 100.0 * *minusS / *trS;
        Value diSum = out.plusDI + out.minusDI;
        dx = diSum == 0.0 ? 0.0 : 100.0 * std::abs(out.plusDI - out.minusDI) / diSum;
    }

    auto adx = adxSmooth_.update(dx);
    if (adx) {
        out.adx = *adx;
    }
    return emit(out);
}

void ADX::reset() {
    prev_.reset();
    trSmooth_.reset();
    plusDMSmooth_.reset();
    minusDMSmooth_.reset();
    adxSmooth_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
