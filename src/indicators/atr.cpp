/**
 * @file indicators/atr.cpp
 * @brief ATR 实现
 */

#include "ta/indicators/atr.hpp"
#include "ta/series.hpp"

namespace ta {
namespace indicators {

ATR::ATR(const Params& params) : Indicator(params) {
    setup();
}

ATR::ATR(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void ATR::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "ATR", "period must be greater than 0");
    smoother_ = WilderSmoother(period_);
}

std::vector<Value> ATR::calculate(const std::vector<Value>& high,
                                  const std::vector<Value>& low,
                                  const std::vector<Value>& close) const {
    return calculate(zipHLC("ATR", high, low, close));
}

std::optional<Value> ATR::next(const HLC& bar) {
    Value tr = prevClose_ ? trueRange(bar.high, bar.low, *prevClose_) : bar.high - bar.low;
    prevClose_ = bar.close;

    auto atr = smoother_.update(tr);
    if (!atr) {
        return std::nullopt;
    }
    return emit(*atr);
}

void ATR::reset() {
    prevClose_.reset();
    smoother_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
