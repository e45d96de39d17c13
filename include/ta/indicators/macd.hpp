/**
 * @file indicators/macd.hpp
 * @brief MACD 指标 (Moving Average Convergence Divergence)
 */

#pragma once

#include "ta/indicators/ema.hpp"
#include "ta/indicators/sma.hpp"
#include <string>

namespace ta {
namespace indicators {

/**
 * @brief MACD 信号线的平滑方式
 */
enum class SignalType {
    EMA,
    SMA
};

/**
 * @brief MACD 指标
 *
 * 输出:
 * - macd: 快线 EMA - 慢线 EMA（自下标 slow-1 起有效）
 * - signal: MACD 有效子序列的 EMA 或 SMA
 * - histogram: MACD - Signal（signal 未就绪时为 NaN）
 *
 * 参数 signal_type 取 "ema" 或 "sma"。
 */
class TA_API MACD : public Indicator<MACD, Value, MACDOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(fast, 12)
        TA_PARAM(slow, 26)
        TA_PARAM(signal, 9)
        TA_PARAM(signal_type, "ema")
    TA_PARAMS_END()

    explicit MACD(const Params& params = {});
    MACD(Size fast, Size slow, Size signal, SignalType type = SignalType::EMA);

    std::optional<MACDOutput> next(const Value& x) override;
    void reset() override;

    Size fastPeriod() const { return fast_; }
    Size slowPeriod() const { return slow_; }
    Size signalPeriod() const { return signal_; }
    SignalType signalType() const { return type_; }

    /// MACD 线首次出现的下标
    Size warmup() const { return slow_ - 1; }
    /// Signal 线首次出现的下标
    Size warmupSignal() const { return slow_ + signal_ - 2; }

    static const char* toString(SignalType type);

private:
    void setup();

    Size fast_ = 0;
    Size slow_ = 0;
    Size signal_ = 0;
    SignalType type_ = SignalType::EMA;

    EMA emaFast_;
    EMA emaSlow_;
    EMA signalEma_;
    SMA signalSma_;
};

} // namespace indicators

using MACD = indicators::MACD;
using SignalType = indicators::SignalType;

} // namespace ta
