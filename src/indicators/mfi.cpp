/**
 * @file indicators/mfi.cpp
 * @brief MFI 实现
 */

#include "ta/indicators/mfi.hpp"
#include "ta/series.hpp"

namespace ta {
namespace indicators {

MFI::MFI(const Params& params) : Indicator(params) {
    setup();
}

MFI::MFI(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void MFI::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "MFI", "period must be greater than 0");
    positiveFlow_ = RollingSum(period_);
    negativeFlow_ = RollingSum(period_);
}

std::vector<Value> MFI::calculate(const std::vector<Value>& high,
                                  const std::vector<Value>& low,
                                  const std::vector<Value>& close,
                                  const std::vector<Value>& volume) const {
    return calculate(zipHLCV("MFI", high, low, close, volume));
}

std::optional<Value> MFI::next(const HLCV& bar) {
    Value tp = (bar.high + bar.low + bar.close) / 3.0;
    if (!prevTypical_) {
        prevTypical_ = tp;
        return std::nullopt;
    }

    Value flow = tp * bar.volume;
    Value up = 0.0;
    Value down = 0.0;
    if (isnan(flow) || isnan(*prevTypical_)) {
        up = NaN;
        down = NaN;
    } else if (tp > *prevTypical_) {
        up = flow;
    } else if (tp < *prevTypical_) {
        down = flow;
    }
    positiveFlow_.update(up);
    negativeFlow_.update(down);
    prevTypical_ = tp;

    if (!positiveFlow_.full()) {
        return std::nullopt;
    }

    // 滑动和的舍入误差可能留下极小的负数，按 0 处理
    Value pos = positiveFlow_.sum();
    Value neg = negativeFlow_.sum();
    if (isnan(pos) || isnan(neg)) {
        return emit(NaN);
    }
    if (neg <= 0.0) {
        return emit(100.0);
    }
    if (pos <= 0.0) {
        return emit(0.0);
    }
    return emit(100.0 - 100.0 / (1.0 + pos / neg));
}

void MFI::reset() {
    prevTypical_.reset();
    positiveFlow_.reset();
    negativeFlow_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
