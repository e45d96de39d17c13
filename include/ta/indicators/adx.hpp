/**
 * @file indicators/adx.hpp
 * @brief 平均趋向指数 (Average Directional Index)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/wilder.hpp"

namespace ta {
namespace indicators {

/**
 * @brief ADX / +DI / -DI
 *
 * - +DM = up (up > down 且 up > 0)，-DM = down (down > up 且 down > 0)
 * - TR、+DM、-DM 各自 Wilder 平滑
 * - +DI = 100 * sm(+DM) / sm(TR)，-DI 同理
 * - DX = 100 * |+DI - -DI| / (+DI + -DI)，分母为 0 时 DX = 0
 * - ADX = DX 的 Wilder 平滑，种子为前 period 个 DX 的均值
 *
 * 下标 period 起输出 {NaN, +DI, -DI}，下标 2*period-1 起 ADX 有效。
 */
class TA_API ADX : public Indicator<ADX, HLC, ADXOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(period, 14)
    TA_PARAMS_END()

    explicit ADX(const Params& params = {});
    explicit ADX(Size period);

    using Indicator::calculate;
    std::vector<ADXOutput> calculate(const std::vector<Value>& high,
                                     const std::vector<Value>& low,
                                     const std::vector<Value>& close) const;

    std::optional<ADXOutput> next(const HLC& bar) override;
    void reset() override;

    Size period() const { return period_; }
    /// +DI/-DI 首次出现的下标
    Size warmup() const { return period_; }
    /// ADX 首次出现的下标
    Size warmupADX() const { return 2 * period_ - 1; }

private:
    void setup();

    Size period_ = 0;
    std::optional<HLC> prev_;
    WilderSmoother trSmooth_;
    WilderSmoother plusDMSmooth_;
    WilderSmoother minusDMSmooth_;
    WilderSmoother adxSmooth_;
};

} // namespace indicators

using ADX = indicators::ADX;

} // namespace ta
