/**
 * @file indicators/sma.cpp
 * @brief SMA / WMA 实现
 */

#include "ta/indicators/sma.hpp"

namespace ta {
namespace indicators {

// ==================== SMA ====================

SMA::SMA(const Params& params) : Indicator(params) {
    setup();
}

SMA::SMA(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void SMA::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "SMA", "period must be greater than 0");
    window_ = RollingSum(period_);
}

std::optional<Value> SMA::next(const Value& x) {
    window_.update(x);
    if (!window_.full()) {
        return std::nullopt;
    }
    return emit(window_.sum() / static_cast<Value>(period_));
}

void SMA::reset() {
    window_.reset();
    clearCurrent();
}

// ==================== WMA ====================

WMA::WMA(const Params& params) : Indicator(params) {
    setup();
}

WMA::WMA(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void WMA::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "WMA", "period must be greater than 0");
    Value n = static_cast<Value>(period_);
    denominator_ = n * (n + 1.0) / 2.0;
    buffer_ = RingBuffer(period_);
}

std::optional<Value> WMA::next(const Value& x) {
    Value n = static_cast<Value>(period_);

    if (!buffer_.full()) {
        buffer_.push(x);
        if (!buffer_.full()) {
            return std::nullopt;
        }
        // 第一个完整窗口：直接求和
        weightedSum_ = 0.0;
        simpleSum_ = 0.0;
        for (Size i = 0; i < period_; ++i) {
            Value v = buffer_.at(i);
            weightedSum_ += v * static_cast<Value>(i + 1);
            simpleSum_ += v;
        }
        return emit(weightedSum_ / denominator_);
    }

    Value oldest = buffer_.push(x);
    weightedSum_ = weightedSum_ - simpleSum_ + x * n;
    simpleSum_ = simpleSum_ - oldest + x;
    return emit(weightedSum_ / denominator_);
}

void WMA::reset() {
    buffer_.clear();
    weightedSum_ = 0.0;
    simpleSum_ = 0.0;
    clearCurrent();
}

} // namespace indicators
} // namespace ta
