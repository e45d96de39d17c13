/**
 * @file indicators/mfi.hpp
 * @brief 资金流量指标 (Money Flow Index)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/rolling.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 资金流量指标 (MFI)
 *
 * - 典型价 tp = (H + L + C) / 3，原始资金流 = tp * V
 * - tp 高于前一 bar 记为正流量，低于则为负流量，相等不计
 * - MFI = 100 - 100 / (1 + 正流量和 / 负流量和)，窗口为最近 period 个流量
 *
 * 负流量和为 0 时 MFI = 100；正流量和为 0 时 MFI = 0。
 */
class TA_API MFI : public Indicator<MFI, HLCV, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 14)
    TA_PARAMS_END()

    explicit MFI(const Params& params = {});
    explicit MFI(Size period);

    using Indicator::calculate;
    std::vector<Value> calculate(const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close,
                                 const std::vector<Value>& volume) const;

    std::optional<Value> next(const HLCV& bar) override;
    void reset() override;

    Size period() const { return period_; }
    Size warmup() const { return period_; }

private:
    void setup();

    Size period_ = 0;
    std::optional<Value> prevTypical_;
    RollingSum positiveFlow_;
    RollingSum negativeFlow_;
};

} // namespace indicators

using MFI = indicators::MFI;

} // namespace ta
