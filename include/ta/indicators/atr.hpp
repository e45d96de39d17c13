/**
 * @file indicators/atr.hpp
 * @brief 平均真实波幅 (Average True Range)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/wilder.hpp"
#include <algorithm>
#include <cmath>

namespace ta {
namespace indicators {

/**
 * @brief 真实波幅
 *
 * TR = max(H - L, |H - prevC|, |L - prevC|)
 */
inline Value trueRange(Value high, Value low, Value prevClose) {
    if (isnan(high) || isnan(low) || isnan(prevClose)) {
        return NaN;
    }
    Value hl = high - low;
    Value hc = std::abs(high - prevClose);
    Value lc = std::abs(low - prevClose);
    return std::max(hl, std::max(hc, lc));
}

/**
 * @brief 平均真实波幅 (ATR)
 *
 * 第一个 bar 的 TR = H - L；前 period 个 TR 的均值为种子（下标 period-1），
 * 之后 Wilder 平滑。
 */
class TA_API ATR : public Indicator<ATR, HLC, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 14)
    TA_PARAMS_END()

    explicit ATR(const Params& params = {});
    explicit ATR(Size period);

    using Indicator::calculate;
    std::vector<Value> calculate(const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close) const;

    std::optional<Value> next(const HLC& bar) override;
    void reset() override;

    Size period() const { return period_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    std::optional<Value> prevClose_;
    WilderSmoother smoother_;
};

} // namespace indicators

using ATR = indicators::ATR;

} // namespace ta
