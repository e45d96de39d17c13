/**
 * @file indicators/ema.cpp
 * @brief EMA 实现
 */

#include "ta/indicators/ema.hpp"

namespace ta {
namespace indicators {

EMA::EMA(const Params& params) : Indicator(params) {
    setup();
}

EMA::EMA(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

EMA::EMA(Size period, Value multiplier)
    : Indicator(ParamsBuilder()
                    .add("period", static_cast<long>(period))
                    .add("multiplier", multiplier)) {
    // 显式 multiplier 必须落在 (0, 1]，0 不再表示“默认”
    require(multiplier > 0.0 && multiplier <= 1.0, "EMA",
            "multiplier must be in (0, 1]");
    setup();
}

void EMA::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "EMA", "period must be greater than 0");

    Value m = p().getNumber<Value>("multiplier");
    if (m == 0.0) {
        alpha_ = 2.0 / (static_cast<Value>(period_) + 1.0);
    } else {
        require(m > 0.0 && m <= 1.0, "EMA", "multiplier must be in (0, 1]");
        alpha_ = m;
    }
}

std::optional<Value> EMA::next(const Value& x) {
    if (count_ < period_) {
        seedSum_ += x;
        ++count_;
        if (count_ < period_) {
            return std::nullopt;
        }
        ema_ = seedSum_ / static_cast<Value>(period_);
        return emit(ema_);
    }
    ema_ = x * alpha_ + ema_ * (1.0 - alpha_);
    return emit(ema_);
}

void EMA::reset() {
    count_ = 0;
    seedSum_ = 0.0;
    ema_ = NaN;
    clearCurrent();
}

} // namespace indicators
} // namespace ta
