/**
 * @file ringbuffer.hpp
 * @brief 固定容量环形缓冲区 - 滑动窗口的基础结构
 *
 * - 索引 [0] 表示最新值，[1], [2]... 表示更早的值
 * - at(i) 按时间顺序访问，at(0) 为窗口中最旧的值
 * - 写满后每次 push 覆盖最旧的值，内存恒为 capacity
 */

#pragma once

#include "ta/common.hpp"
#include <vector>
#include <stdexcept>

namespace ta {

class RingBuffer {
public:
    explicit RingBuffer(Size capacity = 1)
        : data_(capacity > 0 ? capacity : 1, 0.0)
        , head_(0)
        , count_(0)
    {}

    TA_DEFAULT_COPY(RingBuffer)
    TA_DEFAULT_MOVE(RingBuffer)

    /**
     * @brief 写入新值，返回被挤出的旧值（未满时返回 NaN）
     */
    Value push(Value v) {
        Value evicted = NaN;
        if (count_ == data_.size()) {
            evicted = data_[head_];
        } else {
            ++count_;
        }
        data_[head_] = v;
        head_ = (head_ + 1) % data_.size();
        return evicted;
    }

    /**
     * @brief 最新优先索引 - [0] 是最新值
     */
    Value operator[](Size idx) const {
        if (idx >= count_) {
            return NaN;  // 越界返回 NaN
        }
        Size pos = (head_ + data_.size() - 1 - idx) % data_.size();
        return data_[pos];
    }

    /**
     * @brief 时间顺序索引 - at(0) 是最旧值
     */
    Value at(Size idx) const {
        if (idx >= count_) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        Size start = (head_ + data_.size() - count_) % data_.size();
        return data_[(start + idx) % data_.size()];
    }

    /**
     * @brief 窗口中最旧的值
     */
    Value oldest() const { return count_ > 0 ? at(0) : NaN; }
    Value newest() const { return (*this)[0]; }

    /**
     * @brief 按时间顺序复制窗口内容
     */
    std::vector<Value> ordered() const {
        std::vector<Value> out;
        out.reserve(count_);
        for (Size i = 0; i < count_; ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    Size size() const { return count_; }
    Size capacity() const { return data_.size(); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == data_.size(); }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

private:
    std::vector<Value> data_;
    Size head_;
    Size count_;
};

} // namespace ta
