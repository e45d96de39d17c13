/**
 * @file indicators/cvd.cpp
 * @brief CVD 实现
 */

#include "ta/indicators/cvd.hpp"
#include "ta/series.hpp"

namespace ta {
namespace indicators {

// ==================== CVD ====================

std::optional<Value> CVD::next(const Value& delta) {
    if (isnan(delta)) {
        return std::nullopt;
    }
    total_ += delta;
    return emit(total_);
}

void CVD::reset() {
    total_ = 0.0;
    clearCurrent();
}

// ==================== CVDOHLCV ====================

Value CVDOHLCV::delta(Value high, Value low, Value close, Value volume) {
    Value range = high - low;
    if (range <= 0.0 || volume <= 0.0) {
        return 0.0;
    }
    return volume * (2.0 * close - high - low) / range;
}

std::vector<Value> CVDOHLCV::calculate(const std::vector<Value>& high,
                                       const std::vector<Value>& low,
                                       const std::vector<Value>& close,
                                       const std::vector<Value>& volume) const {
    return calculate(zipHLCV("CVDOHLCV", high, low, close, volume));
}

std::optional<Value> CVDOHLCV::next(const HLCV& bar) {
    Value d = delta(bar.high, bar.low, bar.close, bar.volume);
    if (isnan(d)) {
        return std::nullopt;
    }
    total_ += d;
    return emit(total_);
}

void CVDOHLCV::reset() {
    total_ = 0.0;
    clearCurrent();
}

} // namespace indicators
} // namespace ta
