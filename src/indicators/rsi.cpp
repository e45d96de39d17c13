/**
 * @file indicators/rsi.cpp
 * @brief RSI / StochRSI 实现
 */

#include "ta/indicators/rsi.hpp"

namespace ta {
namespace indicators {

// ==================== RSI ====================

RSI::RSI(const Params& params) : Indicator(params) {
    setup();
}

RSI::RSI(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void RSI::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "RSI", "period must be greater than 0");
    gains_ = WilderSmoother(period_);
    losses_ = WilderSmoother(period_);
}

Value RSI::fromAverages(Value avgGain, Value avgLoss) {
    if (isnan(avgGain) || isnan(avgLoss)) {
        return NaN;
    }
    if (avgLoss == 0.0) {
        return avgGain == 0.0 ? 50.0 : 100.0;
    }
    if (avgGain == 0.0) {
        return 0.0;
    }
    Value rs = avgGain / avgLoss;
    return 100.0 - 100.0 / (1.0 + rs);
}

std::optional<Value> RSI::next(const Value& x) {
    if (!prev_) {
        prev_ = x;
        return std::nullopt;
    }

    Value change = x - *prev_;
    prev_ = x;

    // NaN 变化量落入 loss 分支，经平滑一直传播
    Value gain = change > 0.0 ? change : 0.0;
    Value loss = change > 0.0 ? 0.0 : -change;

    auto avgGain = gains_.update(gain);
    auto avgLoss = losses_.update(loss);
    if (!avgGain || !avgLoss) {
        return std::nullopt;
    }
    return emit(fromAverages(*avgGain, *avgLoss));
}

void RSI::reset() {
    prev_.reset();
    gains_.reset();
    losses_.reset();
    clearCurrent();
}

// ==================== StochRSI ====================

StochRSI::StochRSI(const Params& params) : Indicator(params) {
    setup();
}

StochRSI::StochRSI(Size rsiPeriod, Size stochPeriod, Size kSmooth, Size dPeriod)
    : Indicator(ParamsBuilder()
                    .add("rsi_period", static_cast<long>(rsiPeriod))
                    .add("stoch_period", static_cast<long>(stochPeriod))
                    .add("k_smooth", static_cast<long>(kSmooth))
                    .add("d_period", static_cast<long>(dPeriod))) {
    setup();
}

void StochRSI::setup() {
    rsiPeriod_ = p().getSize("rsi_period");
    stochPeriod_ = p().getSize("stoch_period");
    kSmooth_ = p().getSize("k_smooth");
    dPeriod_ = p().getSize("d_period");

    require(rsiPeriod_ > 0, "StochRSI", "RSI period must be > 0");
    require(stochPeriod_ > 0, "StochRSI", "Stochastic period must be > 0");
    require(kSmooth_ > 0, "StochRSI", "K smoothing must be > 0");
    require(dPeriod_ > 0, "StochRSI", "D period must be > 0");

    rsi_ = RSI(rsiPeriod_);
    extrema_ = WindowExtrema(stochPeriod_);
    kSma_ = SMA(kSmooth_);
    dSma_ = SMA(dPeriod_);
}

std::optional<StochasticOutput> StochRSI::next(const Value& x) {
    auto r = rsi_.next(x);
    if (!r) {
        return std::nullopt;
    }

    extrema_.update(*r, *r);
    if (!extrema_.ready()) {
        return std::nullopt;
    }

    Value lo = extrema_.lowest();
    Value range = extrema_.highest() - lo;
    Value stoch = range == 0.0 ? 50.0 : 100.0 * (*r - lo) / range;

    auto k = kSma_.next(stoch);
    if (!k) {
        return std::nullopt;
    }
    auto d = dSma_.next(*k);
    return emit({*k, d ? *d : NaN});
}

void StochRSI::reset() {
    rsi_.reset();
    extrema_.reset();
    kSma_.reset();
    dSma_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
