/**
 * @file indicators/cvd.hpp
 * @brief 累计成交量差 (Cumulative Volume Delta)
 */

#pragma once

#include "ta/indicator.hpp"

namespace ta {
namespace indicators {

/**
 * @brief CVD - 直接输入每个 bar 的有符号成交量差
 *
 * 输出为前缀和。NaN 输入对应的输出为 NaN，不影响累计值。
 */
class TA_API CVD : public Indicator<CVD, Value, Value> {
public:
    CVD() = default;
    explicit CVD(const Params& params) : Indicator(params) {}

    std::optional<Value> next(const Value& delta) override;
    void reset() override;

    Value total() const { return total_; }
    Size warmup() const { return 0; }

private:
    Value total_ = 0.0;
};

/**
 * @brief CVD - 由 OHLCV 近似每个 bar 的买卖差
 *
 * delta = V * (2C - H - L) / (H - L)；区间 <= 0 或 V <= 0 时 delta = 0
 */
class TA_API CVDOHLCV : public Indicator<CVDOHLCV, HLCV, Value> {
public:
    CVDOHLCV() = default;
    explicit CVDOHLCV(const Params& params) : Indicator(params) {}

    using Indicator::calculate;
    std::vector<Value> calculate(const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close,
                                 const std::vector<Value>& volume) const;

    std::optional<Value> next(const HLCV& bar) override;
    void reset() override;

    Value total() const { return total_; }
    Size warmup() const { return 0; }

    static Value delta(Value high, Value low, Value close, Value volume);

private:
    Value total_ = 0.0;
};

} // namespace indicators

using CVD = indicators::CVD;
using CVDOHLCV = indicators::CVDOHLCV;

} // namespace ta
