/**
 * @file indicators/hma.cpp
 * @brief HMA 实现 - 三个 WMA 流串联
 */

#include "ta/indicators/hma.hpp"
#include <algorithm>
#include <cmath>

namespace ta {
namespace indicators {

HMA::HMA(const Params& params) : Indicator(params) {
    setup();
}

HMA::HMA(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void HMA::setup() {
    period_ = p().getSize("period");
    require(period_ >= 2, "HMA", "period must be at least 2");

    sqrtPeriod_ = std::max<Size>(1, static_cast<Size>(std::floor(std::sqrt(static_cast<Value>(period_)))));
    wmaHalf_ = WMA(period_ / 2);
    wmaFull_ = WMA(period_);
    wmaSqrt_ = WMA(sqrtPeriod_);
}

std::optional<Value> HMA::next(const Value& x) {
    auto half = wmaHalf_.next(x);
    auto full = wmaFull_.next(x);
    if (!half || !full) {
        return std::nullopt;
    }
    auto hull = wmaSqrt_.next(2.0 * *half - *full);
    if (!hull) {
        return std::nullopt;
    }
    return emit(*hull);
}

void HMA::reset() {
    wmaHalf_.reset();
    wmaFull_.reset();
    wmaSqrt_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
