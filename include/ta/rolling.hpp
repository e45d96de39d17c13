/**
 * @file rolling.hpp
 * @brief 增量窗口统计：滑动和、滑动平方和
 *
 * 每次 update 为 O(1)：加入新值、减去被挤出的旧值。
 */

#pragma once

#include "ta/ringbuffer.hpp"

namespace ta {

/**
 * @brief 长度为 window 的滑动和
 */
class RollingSum {
public:
    explicit RollingSum(Size window = 1)
        : buffer_(window), sum_(0.0) {}

    /**
     * @brief 加入新值，返回当前窗口和
     */
    Value update(Value x) {
        if (buffer_.full()) {
            sum_ -= buffer_.oldest();
        }
        buffer_.push(x);
        sum_ += x;
        return sum_;
    }

    Value sum() const { return sum_; }
    Value mean() const { return buffer_.empty() ? NaN : sum_ / static_cast<Value>(buffer_.size()); }
    Size count() const { return buffer_.size(); }
    Size window() const { return buffer_.capacity(); }
    bool full() const { return buffer_.full(); }
    const RingBuffer& buffer() const { return buffer_; }

    void reset() {
        buffer_.clear();
        sum_ = 0.0;
    }

private:
    RingBuffer buffer_;
    Value sum_;
};

/**
 * @brief 滑动一阶/二阶矩（和与平方和），用于总体方差
 */
class RollingMoments {
public:
    explicit RollingMoments(Size window = 1)
        : buffer_(window), sum_(0.0), sumSq_(0.0) {}

    void update(Value x) {
        if (buffer_.full()) {
            Value old = buffer_.oldest();
            sum_ -= old;
            sumSq_ -= old * old;
        }
        buffer_.push(x);
        sum_ += x;
        sumSq_ += x * x;
    }

    Value sum() const { return sum_; }
    Value sumSq() const { return sumSq_; }

    Value mean() const {
        return buffer_.empty() ? NaN : sum_ / static_cast<Value>(buffer_.size());
    }

    /**
     * @brief 总体方差 E[x²] - E[x]²，下限截断为 0
     */
    Value variance() const {
        if (buffer_.empty()) return NaN;
        Value n = static_cast<Value>(buffer_.size());
        Value m = sum_ / n;
        Value var = sumSq_ / n - m * m;
        return var < 0.0 ? 0.0 : var;
    }

    Value stddev() const { return std::sqrt(variance()); }

    Size count() const { return buffer_.size(); }
    bool full() const { return buffer_.full(); }

    void reset() {
        buffer_.clear();
        sum_ = 0.0;
        sumSq_ = 0.0;
    }

private:
    RingBuffer buffer_;
    Value sum_;
    Value sumSq_;
};

} // namespace ta
