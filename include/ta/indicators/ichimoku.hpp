/**
 * @file indicators/ichimoku.hpp
 * @brief 一目均衡表 (Ichimoku Kinko Hyo)
 */

#pragma once

#include "ta/indicator.hpp"
#include "ta/monotonic_deque.hpp"

namespace ta {
namespace indicators {

/**
 * @brief 一目均衡表
 *
 * - 转换线 tenkan = (最高 + 最低) / 2，窗口 tenkan
 * - 基准线 kijun  = 同上，窗口 kijun
 * - 先行 A = (tenkan + kijun) / 2，两者都可用时
 * - 先行 B = 中点，窗口 senkou
 * - 迟行线 chikou = 当前收盘价
 *
 * 输出不做时间平移：先行 A/B 前移 kijun、迟行线后移 kijun 由调用方处理。
 * 从第一个 bar 起即有输出（chikou 总是有定义）。
 */
class TA_API Ichimoku : public Indicator<Ichimoku, HLC, IchimokuOutput> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(tenkan, 9)
        TA_PARAM(kijun, 26)
        TA_PARAM(senkou, 52)
    TA_PARAMS_END()

    explicit Ichimoku(const Params& params = {});
    Ichimoku(Size tenkan, Size kijun, Size senkou);

    using Indicator::calculate;
    std::vector<IchimokuOutput> calculate(const std::vector<Value>& high,
                                          const std::vector<Value>& low,
                                          const std::vector<Value>& close) const;

    std::optional<IchimokuOutput> next(const HLC& bar) override;
    void reset() override;

    Size tenkanPeriod() const { return tenkan_.window(); }
    Size kijunPeriod() const { return kijun_.window(); }
    Size senkouPeriod() const { return senkou_.window(); }

    Size warmup() const { return 0; }

private:
    void setup();

    WindowExtrema tenkan_;
    WindowExtrema kijun_;
    WindowExtrema senkou_;
};

} // namespace indicators

using Ichimoku = indicators::Ichimoku;

} // namespace ta
