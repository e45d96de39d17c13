/**
 * @file indicator.hpp
 * @brief 指标基类 - 批量/流式双模式
 *
 * 所有指标共享同一个逐 bar 内核 next()：
 * - next(x)     流式推进一个 bar，未就绪时返回空
 * - init(data)  重置后回放前缀，返回与批量模式相同的序列
 * - calculate   拷贝当前配置得到新实例，对其 init，自身状态不变
 *
 * 序列模式中“未定义”位置填充 Sentinel<Out>::value()（NaN 或全 NaN 记录）。
 */

#pragma once

#include "ta/params.hpp"
#include "ta/types.hpp"
#include "ta/logging.hpp"
#include <optional>
#include <vector>

namespace ta {

/**
 * @brief 流式指标接口
 */
template<typename In, typename Out>
class StreamingIndicator {
public:
    using Input = In;
    using Output = Out;

    virtual ~StreamingIndicator() = default;

    /**
     * @brief 推进一个 bar
     */
    virtual std::optional<Out> next(const In& input) = 0;

    /**
     * @brief 回到刚构造时的状态（参数保留）
     */
    virtual void reset() = 0;

    /**
     * @brief 是否已经产生过至少一个值
     */
    virtual bool isReady() const = 0;

    /**
     * @brief 重置并回放前缀，返回逐 bar 结果
     */
    std::vector<Out> init(const std::vector<In>& data) {
        reset();
        auto lg = log::logger();
        if (lg->should_log(spdlog::level::trace)) {
            lg->trace("init: replaying {} bars", data.size());
        }
        std::vector<Out> out;
        out.reserve(data.size());
        for (const auto& x : data) {
            auto v = next(x);
            out.push_back(v ? *v : Sentinel<Out>::value());
        }
        return out;
    }
};

/**
 * @brief 指标基类（CRTP）
 *
 * Derived 必须可拷贝；批量计算在拷贝上进行。
 */
template<typename Derived, typename In, typename Out>
class Indicator : public Parametrized<Derived>, public StreamingIndicator<In, Out> {
public:
    Indicator() = default;
    explicit Indicator(const Params& params) : Parametrized<Derived>(params) {}

    /**
     * @brief 批量计算，输出长度与输入相同
     */
    std::vector<Out> calculate(const std::vector<In>& data) const {
        Derived fresh(static_cast<const Derived&>(*this));
        return fresh.init(data);
    }

    /**
     * @brief 最近一次产生的值
     */
    std::optional<Out> current() const { return current_; }

    /**
     * @brief 最近一次产生的值；尚无值时抛出 NotInitialized
     */
    Out valueOrThrow() const {
        if (!current_) {
            throw NotInitialized();
        }
        return *current_;
    }

    bool isReady() const override { return current_.has_value(); }

protected:
    /**
     * @brief 记录并返回本 bar 的输出
     */
    std::optional<Out> emit(const Out& value) {
        current_ = value;
        return current_;
    }

    void clearCurrent() { current_.reset(); }

private:
    std::optional<Out> current_;
};

} // namespace ta
