/**
 * @file indicators/linreg.hpp
 * @brief 线性回归通道 (Linear Regression Channel)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/ringbuffer.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 线性回归通道
 *
 * 对窗口内 n 个值以 x = 0..n-1 做最小二乘拟合：
 * - value = slope * (n - 1) + intercept（窗口末端）
 * - r 为 Pearson 相关系数（任一离差平方和为 0 时取 0）
 * - upper/lower = value ± multiplier * 残差标准差
 *
 * 每步 O(n) 重算整个窗口。
 */
class TA_API LinReg : public Indicator<LinReg, Value, LinRegOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 20)
        TA_PARAM(multiplier, 2.0)
    TA_PARAMS_END()

    explicit LinReg(const Params& params = {});
    explicit LinReg(Size period, Value multiplier = 2.0);

    std::optional<LinRegOutput> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Value multiplier() const { return multiplier_; }
    Size warmup() const { return period_ - 1; }

private:
    void setup();
    LinRegOutput fit() const;

    Size period_ = 0;
    Value multiplier_ = 2.0;
    RingBuffer window_;
};

} // namespace indicators

using LinReg = indicators::LinReg;

} // namespace ta
