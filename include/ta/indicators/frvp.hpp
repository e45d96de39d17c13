/**
 * @file indicators/frvp.hpp
 * @brief 固定区间成交量分布 (Fixed Range Volume Profile)
 */

#pragma once

#include "ta/params.hpp"
#include "ta/types.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace ta {
namespace indicators {

/**
 * @brief 固定区间成交量分布
 *
 * 把所有 bar 的成交量按价格重叠比例分配到 bins 个等宽区间，得到：
 * - POC: 成交量最大的区间中点（并列时取最低区间）
 * - VAL/VAH: 从 POC 向两侧扩展（取成交量较大的一侧，相等向下）
 *   直到覆盖 value_area 比例的成交量
 *
 * 输出是整个区间的一份分布而不是逐 bar 序列。
 * 流式模式保存全部 bar，每次追加后重新计算（O(bar 数)）。
 */
class TA_API FRVP : public Parametrized<FRVP> {
public:
    TA_PARAMS_BEGIN()
        TA_PARAM(bins, 100)
        TA_PARAM(value_area, 0.70)
    TA_PARAMS_END()

    explicit FRVP(const Params& params = {});
    explicit FRVP(Size bins, Value valueArea = 0.70);

    /**
     * @brief 批量计算；空输入抛出 InsufficientData
     */
    FRVPOutput calculate(const std::vector<OHLCV>& data) const;
    FRVPOutput calculate(const std::vector<Timestamp>& timestamp,
                         const std::vector<Value>& open,
                         const std::vector<Value>& high,
                         const std::vector<Value>& low,
                         const std::vector<Value>& close,
                         const std::vector<Value>& volume) const;

    /**
     * @brief 重置并载入前缀，返回与批量相同的分布
     */
    FRVPOutput init(const std::vector<OHLCV>& data);

    /**
     * @brief 追加一个 bar 并返回最新分布
     */
    std::optional<FRVPOutput> next(const OHLCV& bar);

    void reset();
    bool isReady() const { return current_.has_value(); }
    std::optional<FRVPOutput> current() const { return current_; }

    Size bins() const { return bins_; }
    Value valueAreaFraction() const { return valueArea_; }
    Size barCount() const { return bars_.size(); }

    /**
     * @brief 从 POC 向外扩展价值区，返回 [低区间下标, 高区间下标]
     */
    static std::pair<Size, Size> valueArea(const std::vector<Value>& volumes, Size poc, Value target);

private:
    void setup();

    Size bins_ = 100;
    Value valueArea_ = 0.70;
    std::vector<OHLCV> bars_;
    std::optional<FRVPOutput> current_;
};

} // namespace indicators

using FRVP = indicators::FRVP;

} // namespace ta
