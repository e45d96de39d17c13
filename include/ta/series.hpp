/**
 * @file series.hpp
 * @brief 列式 OHLCV 数据容器与并行数组组装
 *
 * 批量接口接受若干等长数组（high/low/close/...），在此组装成 bar 序列；
 * 长度不一致时抛出 InvalidParameter。
 */

#pragma once

#include "ta/types.hpp"
#include "ta/errors.hpp"
#include <vector>

namespace ta {

/**
 * @brief 列式 OHLCV 序列
 */
class TA_API OHLCVSeries {
public:
    OHLCVSeries() = default;

    /**
     * @brief 由等长列构造
     */
    static OHLCVSeries fromColumns(const std::vector<Timestamp>& timestamp,
                                   const std::vector<Value>& open,
                                   const std::vector<Value>& high,
                                   const std::vector<Value>& low,
                                   const std::vector<Value>& close,
                                   const std::vector<Value>& volume);

    /**
     * @brief 添加一个完整的 bar
     */
    void addBar(Timestamp ts, Value o, Value h, Value l, Value c, Value v = 0.0) {
        timestamp_.push_back(ts);
        open_.push_back(o);
        high_.push_back(h);
        low_.push_back(l);
        close_.push_back(c);
        volume_.push_back(v);
    }

    void addBar(const OHLCV& bar) {
        addBar(bar.timestamp, bar.open, bar.high, bar.low, bar.close, bar.volume);
    }

    OHLCV bar(Size i) const {
        return OHLCV(timestamp_.at(i), open_.at(i), high_.at(i), low_.at(i), close_.at(i), volume_.at(i));
    }

    // 列访问器
    const std::vector<Timestamp>& timestamp() const { return timestamp_; }
    const std::vector<Value>& open() const { return open_; }
    const std::vector<Value>& high() const { return high_; }
    const std::vector<Value>& low() const { return low_; }
    const std::vector<Value>& close() const { return close_; }
    const std::vector<Value>& volume() const { return volume_; }

    /**
     * @brief 转为行式 bar 序列
     */
    std::vector<OHLCV> bars() const;
    std::vector<HLC> hlc() const;
    std::vector<HLCV> hlcv() const;

    Size size() const { return close_.size(); }
    bool empty() const { return close_.empty(); }

    void clear();

private:
    std::vector<Timestamp> timestamp_;
    std::vector<Value> open_;
    std::vector<Value> high_;
    std::vector<Value> low_;
    std::vector<Value> close_;
    std::vector<Value> volume_;
};

// ==================== 并行数组组装 ====================

TA_API std::vector<HLC> zipHLC(const char* indicator,
                               const std::vector<Value>& high,
                               const std::vector<Value>& low,
                               const std::vector<Value>& close);

TA_API std::vector<HLCV> zipHLCV(const char* indicator,
                                 const std::vector<Value>& high,
                                 const std::vector<Value>& low,
                                 const std::vector<Value>& close,
                                 const std::vector<Value>& volume);

TA_API std::vector<OHLCV> zipOHLCV(const char* indicator,
                                   const std::vector<Timestamp>& timestamp,
                                   const std::vector<Value>& open,
                                   const std::vector<Value>& high,
                                   const std::vector<Value>& low,
                                   const std::vector<Value>& close,
                                   const std::vector<Value>& volume);

} // namespace ta
