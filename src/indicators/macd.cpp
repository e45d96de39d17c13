/**
 * @file indicators/macd.cpp
 * @brief MACD 实现 - 两个 EMA 流驱动信号线流
 */

#include "ta/indicators/macd.hpp"

namespace ta {
namespace indicators {

MACD::MACD(const Params& params) : Indicator(params) {
    setup();
}

MACD::MACD(Size fast, Size slow, Size signal, SignalType type)
    : Indicator(ParamsBuilder()
                    .add("fast", static_cast<long>(fast))
                    .add("slow", static_cast<long>(slow))
                    .add("signal", static_cast<long>(signal))
                    .add("signal_type", toString(type))) {
    setup();
}

const char* MACD::toString(SignalType type) {
    return type == SignalType::SMA ? "sma" : "ema";
}

void MACD::setup() {
    fast_ = p().getSize("fast");
    slow_ = p().getSize("slow");
    signal_ = p().getSize("signal");

    const std::string type = p().get<std::string>("signal_type");
    require(type == "ema" || type == "sma", "MACD", "signal_type must be \"ema\" or \"sma\"");
    type_ = type == "sma" ? SignalType::SMA : SignalType::EMA;

    require(fast_ > 0 && slow_ > 0 && signal_ > 0, "MACD", "all periods must be greater than 0");
    require(fast_ < slow_, "MACD", "fast_period must be less than slow_period");

    emaFast_ = EMA(fast_);
    emaSlow_ = EMA(slow_);
    signalEma_ = EMA(signal_);
    signalSma_ = SMA(signal_);
}

std::optional<MACDOutput> MACD::next(const Value& x) {
    auto fast = emaFast_.next(x);
    auto slow = emaSlow_.next(x);
    if (!fast || !slow) {
        return std::nullopt;
    }

    MACDOutput out;
    out.macd = *fast - *slow;

    auto signal = type_ == SignalType::SMA ? signalSma_.next(out.macd) : signalEma_.next(out.macd);
    if (signal) {
        out.signal = *signal;
        out.histogram = out.macd - *signal;
    }
    return emit(out);
}

void MACD::reset() {
    emaFast_.reset();
    emaSlow_.reset();
    signalEma_.reset();
    signalSma_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
