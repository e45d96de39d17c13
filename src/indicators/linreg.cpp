/**
 * @file indicators/linreg.cpp
 * @brief 线性回归通道实现
 */

#include "ta/indicators/linreg.hpp"
#include <algorithm>
#include <cmath>

namespace ta {
namespace indicators {

LinReg::LinReg(const Params& params) : Indicator(params) {
    setup();
}

LinReg::LinReg(Size period, Value multiplier)
    : Indicator(ParamsBuilder()
                    .add("period", static_cast<long>(period))
                    .add("multiplier", multiplier)) {
    setup();
}

void LinReg::setup() {
    period_ = p().getSize("period");
    multiplier_ = p().getNumber<Value>("multiplier");

    require(period_ >= 2, "LinReg", "period must be at least 2");
    require(std::isfinite(multiplier_), "LinReg", "multiplier must be finite");
    require(multiplier_ >= 0.0, "LinReg", "multiplier must be non-negative");

    window_ = RingBuffer(period_);
}

std::optional<LinRegOutput> LinReg::next(const Value& x) {
    window_.push(x);
    if (!window_.full()) {
        return std::nullopt;
    }
    return emit(fit());
}

LinRegOutput LinReg::fit() const {
    const Value n = static_cast<Value>(period_);
    const Value xMean = (n - 1.0) / 2.0;

    Value yMean = 0.0;
    for (Size i = 0; i < period_; ++i) {
        yMean += window_.at(i);
    }
    yMean /= n;

    Value sxy = 0.0;
    Value sxx = 0.0;
    Value syy = 0.0;
    for (Size i = 0; i < period_; ++i) {
        Value dx = static_cast<Value>(i) - xMean;
        Value dy = window_.at(i) - yMean;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    LinRegOutput out;
    out.slope = sxx == 0.0 ? 0.0 : sxy / sxx;
    out.intercept = yMean - out.slope * xMean;
    out.value = out.slope * (n - 1.0) + out.intercept;

    if (sxx == 0.0 || syy == 0.0) {
        out.r = 0.0;
    } else {
        out.r = std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
    }
    out.rSquared = out.r * out.r;

    Value ssr = 0.0;
    for (Size i = 0; i < period_; ++i) {
        Value residual = window_.at(i) - (out.intercept + out.slope * static_cast<Value>(i));
        ssr += residual * residual;
    }
    Value sigma = std::sqrt(ssr / n);
    out.upper = out.value + multiplier_ * sigma;
    out.lower = out.value - multiplier_ * sigma;
    return out;
}

void LinReg::reset() {
    window_.clear();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
