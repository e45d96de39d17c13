/**
 * @file indicators/rsi.hpp
 * @brief RSI 相对强弱指标与随机 RSI
 */

#pragma once

#include "ta/indicators/sma.hpp"
#include "ta/monotonic_deque.hpp"
#include "ta/wilder.hpp"

namespace ta {
namespace indicators {

/**
 * @brief RSI 相对强弱指标
 *
 * 计算公式:
 * - RS = 平均涨幅 / 平均跌幅
 * - RSI = 100 - 100 / (1 + RS)
 *
 * 使用 Wilder 平滑（alpha = 1/period），种子为前 period 个变化量的均值。
 * 第一个值出现在下标 period（第一个输入只作为基准）。
 */
class TA_API RSI : public Indicator<RSI, Value, Value> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 14)
    TA_PARAMS_END()

    explicit RSI(const Params& params = {});
    explicit RSI(Size period);

    std::optional<Value> next(const Value& x) override;
    void reset() override;

    Size period() const { return period_; }
    Size warmup() const { return period_; }

    /**
     * @brief 由平均涨跌幅计算 RSI（含零分母边界规则）
     */
    static Value fromAverages(Value avgGain, Value avgLoss);

private:
    void setup();

    Size period_ = 0;
    std::optional<Value> prev_;
    WilderSmoother gains_;
    WilderSmoother losses_;
};

/**
 * @brief 随机 RSI (Stochastic RSI)
 *
 * RSI -> 窗口 stoch_period 内的随机值 -> SMA(k_smooth) 得 %K -> SMA(d_period) 得 %D
 * %D 未就绪时输出 {k, NaN}。
 */
class TA_API StochRSI : public Indicator<StochRSI, Value, StochasticOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(rsi_period, 14)
        TA_PARAM(stoch_period, 14)
        TA_PARAM(k_smooth, 3)
        TA_PARAM(d_period, 3)
    TA_PARAMS_END()

    explicit StochRSI(const Params& params = {});
    StochRSI(Size rsiPeriod, Size stochPeriod, Size kSmooth, Size dPeriod);

    std::optional<StochasticOutput> next(const Value& x) override;
    void reset() override;

    Size rsiPeriod() const { return rsiPeriod_; }
    Size stochPeriod() const { return stochPeriod_; }
    Size kSmooth() const { return kSmooth_; }
    Size dPeriod() const { return dPeriod_; }

    /// %K 首次出现的下标
    Size warmup() const { return rsiPeriod_ + stochPeriod_ + kSmooth_ - 2; }
    /// %D 首次出现的下标
    Size warmupD() const { return warmup() + dPeriod_ - 1; }

private:
    void setup();

    Size rsiPeriod_ = 0;
    Size stochPeriod_ = 0;
    Size kSmooth_ = 0;
    Size dPeriod_ = 0;

    RSI rsi_;
    WindowExtrema extrema_;
    SMA kSma_;
    SMA dSma_;
};

} // namespace indicators

using RSI = indicators::RSI;
using StochRSI = indicators::StochRSI;

} // namespace ta
