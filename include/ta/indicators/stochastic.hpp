/**
 * @file indicators/stochastic.hpp
 * @brief 随机指标 (Stochastic Oscillator)
 */

#pragma once

#include "ta/indicators/sma.hpp"
#include "ta/monotonic_deque.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 随机指标类型
 */
enum class StochType {
    Fast,   // %K = 原始 %K
    Slow    // %K = SMA(原始 %K, slowing)
};

/**
 * @brief 随机指标 (Stochastic)
 *
 * 原始 %K = 100 * (C - LL) / (HH - LL)，区间为 0 时取 50
 * %D = SMA(%K, d_period)；%D 未就绪时输出 {k, NaN}
 *
 * 参数 type 取 "fast" 或 "slow"。
 */
class TA_API Stochastic : public Indicator<Stochastic, HLC, StochasticOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(k_period, 14)
        TA_PARAM(d_period, 3)
        TA_PARAM(slowing, 3)
        TA_PARAM(type, "fast")
    TA_PARAMS_END()

    explicit Stochastic(const Params& params = {});
    Stochastic(Size kPeriod, Size dPeriod, StochType type = StochType::Fast, Size slowing = 3);

    using Indicator::calculate;
    std::vector<StochasticOutput> calculate(const std::vector<Value>& high,
                                            const std::vector<Value>& low,
                                            const std::vector<Value>& close) const;

    std::optional<StochasticOutput> next(const HLC& bar) override;
    void reset() override;

    Size kPeriod() const { return kPeriod_; }
    Size dPeriod() const { return dPeriod_; }
    Size slowing() const { return slowing_; }
    StochType type() const { return type_; }

    /// %K 首次出现的下标
    Size warmup() const {
        return type_ == StochType::Slow ? kPeriod_ + slowing_ - 2 : kPeriod_ - 1;
    }
    /// %D 首次出现的下标
    Size warmupD() const { return warmup() + dPeriod_ - 1; }

private:
    void setup();

    Size kPeriod_ = 0;
    Size dPeriod_ = 0;
    Size slowing_ = 0;
    StochType type_ = StochType::Fast;

    WindowExtrema extrema_;
    SMA kSma_;
    SMA dSma_;
};

} // namespace indicators

using Stochastic = indicators::Stochastic;
using StochType = indicators::StochType;

} // namespace ta
