/**
 * @file indicators/pivot.hpp
 * @brief 枢轴点 (Pivot Points)
 */

#pragma once

#include "ta/indicator.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 枢轴点算法
 */
enum class PivotType {
    Standard,   // P = (H + L + C) / 3
    Fibonacci,  // P 同上，阻力/支撑按 0.382 / 0.618 / 1.0 倍区间
    Woodie      // P = (H + L + 2C) / 4
};

/**
 * @brief 枢轴点 - 逐 bar 无状态变换
 *
 * 任一输入为 NaN 时输出全 NaN。参数 type 取 "standard"、"fibonacci" 或 "woodie"。
 */
class TA_API PivotPoints : public Indicator<PivotPoints, HLC, PivotPointsOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(type, "standard")
    TA_PARAMS_END()

    explicit PivotPoints(const Params& params = {});
    explicit PivotPoints(PivotType type);

    using Indicator::calculate;

    /**
     * @brief 单个 bar 的枢轴点
     */
    PivotPointsOutput calculate(Value high, Value low, Value close) const;

    std::vector<PivotPointsOutput> calculate(const std::vector<Value>& high,
                                             const std::vector<Value>& low,
                                             const std::vector<Value>& close) const;

    std::optional<PivotPointsOutput> next(const HLC& bar) override;
    void reset() override;

    PivotType type() const { return type_; }
    Size warmup() const { return 0; }

    static PivotPointsOutput compute(Value high, Value low, Value close, PivotType type);
    static const char* toString(PivotType type);

private:
    PivotType type_ = PivotType::Standard;
};

} // namespace indicators

using PivotPoints = indicators::PivotPoints;
using PivotType = indicators::PivotType;

} // namespace ta
