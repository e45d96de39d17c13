/**
 * @file indicators/pivot.cpp
 * @brief 枢轴点实现
 */

#include "ta/indicators/pivot.hpp"
#include "ta/series.hpp"
#include <string>

namespace ta {
namespace indicators {

PivotPoints::PivotPoints(const Params& params) : Indicator(params) {
    const std::string type = p().get<std::string>("type");
    if (type == "standard") {
        type_ = PivotType::Standard;
    } else if (type == "fibonacci") {
        type_ = PivotType::Fibonacci;
    } else {
        require(type == "woodie", "PivotPoints",
                "type must be \"standard\", \"fibonacci\" or \"woodie\"");
        type_ = PivotType::Woodie;
    }
}

PivotPoints::PivotPoints(PivotType type)
    : Indicator(ParamsBuilder().add("type", toString(type)))
    , type_(type) {}

const char* PivotPoints::toString(PivotType type) {
    switch (type) {
        case PivotType::Fibonacci: return "fibonacci";
        case PivotType::Woodie: return "woodie";
        default: return "standard";
    }
}

PivotPointsOutput PivotPoints::compute(Value high, Value low, Value close, PivotType type) {
    if (isnan(high) || isnan(low) || isnan(close)) {
        return PivotPointsOutput::nan();
    }

    PivotPointsOutput out;
    Value range = high - low;

    if (type == PivotType::Fibonacci) {
        Value p = (high + low + close) / 3.0;
        out.pivot = p;
        out.r1 = p + 0.382 * range;
        out.s1 = p - 0.382 * range;
        out.r2 = p + 0.618 * range;
        out.s2 = p - 0.618 * range;
        out.r3 = p + range;
        out.s3 = p - range;
        return out;
    }

    Value p = type == PivotType::Woodie
        ? (high + low + 2.0 * close) / 4.0
        : (high + low + close) / 3.0;
    out.pivot = p;
    out.r1 = 2.0 * p - low;
    out.s1 = 2.0 * p - high;
    out.r2 = p + range;
    out.s2 = p - range;
    out.r3 = high + 2.0 * (p - low);
    out.s3 = low - 2.0 * (high - p);
    return out;
}

PivotPointsOutput PivotPoints::calculate(Value high, Value low, Value close) const {
    return compute(high, low, close, type_);
}

std::vector<PivotPointsOutput> PivotPoints::calculate(const std::vector<Value>& high,
                                                      const std::vector<Value>& low,
                                                      const std::vector<Value>& close) const {
    return calculate(zipHLC("PivotPoints", high, low, close));
}

std::optional<PivotPointsOutput> PivotPoints::next(const HLC& bar) {
    return emit(compute(bar.high, bar.low, bar.close, type_));
}

void PivotPoints::reset() {
    clearCurrent();
}

} // namespace indicators
} // namespace ta
