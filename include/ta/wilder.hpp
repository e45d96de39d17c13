/**
 * @file wilder.hpp
 * @brief Wilder 平滑器
 *
 * 前 period 个输入取算术平均作为种子，之后
 *   s = s * (1 - α) + x * α,  α = 1 / period
 * RSI、ATR、ADX 共用此平滑方式。
 */

#pragma once

#include "ta/common.hpp"
#include <optional>

namespace ta {

class WilderSmoother {
public:
    explicit WilderSmoother(Size period = 1)
        : period_(period > 0 ? period : 1)
        , alpha_(1.0 / static_cast<Value>(period_))
        , count_(0)
        , seedSum_(0.0)
        , value_(NaN)
    {}

    /**
     * @brief 输入一个值；种子形成后返回平滑值
     */
    std::optional<Value> update(Value x) {
        if (count_ < period_) {
            seedSum_ += x;
            ++count_;
            if (count_ < period_) {
                return std::nullopt;
            }
            value_ = seedSum_ / static_cast<Value>(period_);
            return value_;
        }
        value_ = value_ * (1.0 - alpha_) + x * alpha_;
        return value_;
    }

    bool ready() const { return count_ >= period_; }
    Value value() const { return value_; }
    Size period() const { return period_; }

    void reset() {
        count_ = 0;
        seedSum_ = 0.0;
        value_ = NaN;
    }

private:
    Size period_;
    Value alpha_;
    Size count_;
    Value seedSum_;
    Value value_;
};

} // namespace ta
