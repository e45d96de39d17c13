/**
 * @file monotonic_deque.hpp
 * @brief 单调双端队列 - 滑动窗口最大/最小值，摊还 O(1)
 */

#pragma once

#include "ta/common.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <utility>

namespace ta {

/**
 * @brief 单调队列
 *
 * 队首保存窗口内的极值。Compare 为 std::greater 时维护最大值，
 * std::less 时维护最小值。元素带 bar 序号，按序号淘汰出窗口。
 */
template<typename Compare>
class MonotonicDeque {
public:
    using Entry = std::pair<Size, Value>;

    /**
     * @brief 加入第 index 个 bar 的值
     */
    void push(Size index, Value v) {
        while (!deque_.empty() && !compare_(deque_.back().second, v)) {
            deque_.pop_back();
        }
        deque_.emplace_back(index, v);
    }

    /**
     * @brief current 为最新 bar 的序号，淘汰所有 index + window <= current 的元素
     */
    void evict(Size current, Size window) {
        while (!deque_.empty() && deque_.front().first + window <= current) {
            deque_.pop_front();
        }
    }

    Value front() const { return deque_.empty() ? NaN : deque_.front().second; }
    Size size() const { return deque_.size(); }
    bool empty() const { return deque_.empty(); }
    void clear() { deque_.clear(); }

private:
    std::deque<Entry> deque_;
    Compare compare_;
};

using MaxDeque = MonotonicDeque<std::greater<Value>>;
using MinDeque = MonotonicDeque<std::less<Value>>;

/**
 * @brief 窗口最高价/最低价
 *
 * 每个 bar 递增内部序号；窗口满 window 个 bar 后 ready()。
 * 窗口内含 NaN 时 highest()/lowest() 返回 NaN。
 */
class WindowExtrema {
public:
    explicit WindowExtrema(Size window = 1)
        : window_(window), index_(0) {}

    void update(Value high, Value low) {
        if (isnan(high) || isnan(low)) {
            lastNaN_ = index_;
        } else {
            highs_.push(index_, high);
            lows_.push(index_, low);
        }
        highs_.evict(index_, window_);
        lows_.evict(index_, window_);
        ++index_;
    }

    Value highest() const { return tainted() ? NaN : highs_.front(); }
    Value lowest() const { return tainted() ? NaN : lows_.front(); }
    Value midpoint() const { return (highest() + lowest()) / 2.0; }

    bool ready() const { return index_ >= window_; }
    Size window() const { return window_; }

    void reset() {
        highs_.clear();
        lows_.clear();
        index_ = 0;
        lastNaN_.reset();
    }

private:
    bool tainted() const { return lastNaN_ && *lastNaN_ + window_ >= index_; }

    Size window_;
    Size index_;
    MaxDeque highs_;
    MinDeque lows_;
    std::optional<Size> lastNaN_;
};

} // namespace ta
