/**
 * @file indicators/stochastic.cpp
 * @brief 随机指标实现
 */

#include "ta/indicators/stochastic.hpp"
#include "ta/series.hpp"
#include <string>

namespace ta {
namespace indicators {

Stochastic::Stochastic(const Params& params) : Indicator(params) {
    setup();
}

Stochastic::Stochastic(Size kPeriod, Size dPeriod, StochType type, Size slowing)
    : Indicator(ParamsBuilder()
                    .add("k_period", static_cast<long>(kPeriod))
                    .add("d_period", static_cast<long>(dPeriod))
                    .add("slowing", static_cast<long>(slowing))
                    .add("type", type == StochType::Slow ? "slow" : "fast")) {
    setup();
}

void Stochastic::setup() {
    kPeriod_ = p().getSize("k_period");
    dPeriod_ = p().getSize("d_period");
    slowing_ = p().getSize("slowing");

    const std::string type = p().get<std::string>("type");
    require(type == "fast" || type == "slow", "Stochastic", "type must be \"fast\" or \"slow\"");
    type_ = type == "slow" ? StochType::Slow : StochType::Fast;

    require(kPeriod_ > 0, "Stochastic", "k_period must be greater than 0");
    require(dPeriod_ > 0, "Stochastic", "d_period must be greater than 0");
    require(slowing_ > 0, "Stochastic", "slowing must be greater than 0");

    extrema_ = WindowExtrema(kPeriod_);
    kSma_ = SMA(slowing_);
    dSma_ = SMA(dPeriod_);
}

std::vector<StochasticOutput> Stochastic::calculate(const std::vector<Value>& high,
                                                    const std::vector<Value>& low,
                                                    const std::vector<Value>& close) const {
    return calculate(zipHLC("Stochastic", high, low, close));
}

std::optional<StochasticOutput> Stochastic::next(const HLC& bar) {
    extrema_.update(bar.high, bar.low);
    if (!extrema_.ready()) {
        return std::nullopt;
    }

    Value lo = extrema_.lowest();
    Value range = extrema_.highest() - lo;
    Value rawK = range == 0.0 ? 50.0 : 100.0 * (bar.close - lo) / range;

    Value k = rawK;
    if (type_ == StochType::Slow) {
        auto smoothed = kSma_.next(rawK);
        if (!smoothed) {
            return std::nullopt;
        }
        k = *smoothed;
    }

    auto d = dSma_.next(k);
    return emit({k, d ? *d : NaN});
}

void Stochastic::reset() {
    extrema_.reset();
    kSma_.reset();
    dSma_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
