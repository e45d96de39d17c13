/**
 * @file indicators/bollinger.cpp
 * @brief 布林带实现
 */

#include "ta/indicators/bollinger.hpp"
#include <cmath>

namespace ta {
namespace indicators {

BollingerBands::BollingerBands(const Params& params) : Indicator(params) {
    setup();
}

BollingerBands::BollingerBands(Size period, Value devfactor)
    : Indicator(ParamsBuilder()
                    .add("period", static_cast<long>(period))
                    .add("devfactor", devfactor)) {
    setup();
}

void BollingerBands::setup() {
    period_ = p().getSize("period");
    devfactor_ = p().getNumber<Value>("devfactor");

    require(period_ > 0, "BollingerBands", "period must be greater than 0");
    require(std::isfinite(devfactor_) && devfactor_ > 0.0, "BollingerBands",
            "devfactor must be positive and finite");

    moments_ = RollingMoments(period_);
}

std::optional<BollingerOutput> BollingerBands::next(const Value& x) {
    moments_.update(x);
    if (!moments_.full()) {
        return std::nullopt;
    }

    BollingerOutput out;
    out.middle = moments_.mean();
    Value dev = devfactor_ * moments_.stddev();
    out.upper = out.middle + dev;
    out.lower = out.middle - dev;

    Value width = out.upper - out.lower;
    out.percentB = width == 0.0 ? 0.5 : (x - out.lower) / width;
    out.bandwidth = out.middle == 0.0 ? 0.0 : width / out.middle;
    return emit(out);
}

void BollingerBands::reset() {
    moments_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
