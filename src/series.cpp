/**
 * @file series.cpp
 * @brief OHLCVSeries 与并行数组组装实现
 */

#include "ta/series.hpp"

namespace ta {

OHLCVSeries OHLCVSeries::fromColumns(const std::vector<Timestamp>& timestamp,
                                     const std::vector<Value>& open,
                                     const std::vector<Value>& high,
                                     const std::vector<Value>& low,
                                     const std::vector<Value>& close,
                                     const std::vector<Value>& volume) {
    requireSameLength("OHLCVSeries", timestamp.size(), open.size(), high.size(),
                      low.size(), close.size(), volume.size());
    OHLCVSeries s;
    s.timestamp_ = timestamp;
    s.open_ = open;
    s.high_ = high;
    s.low_ = low;
    s.close_ = close;
    s.volume_ = volume;
    return s;
}

std::vector<OHLCV> OHLCVSeries::bars() const {
    std::vector<OHLCV> out;
    out.reserve(size());
    for (Size i = 0; i < size(); ++i) {
        out.emplace_back(timestamp_[i], open_[i], high_[i], low_[i], close_[i], volume_[i]);
    }
    return out;
}

std::vector<HLC> OHLCVSeries::hlc() const {
    std::vector<HLC> out;
    out.reserve(size());
    for (Size i = 0; i < size(); ++i) {
        out.push_back({high_[i], low_[i], close_[i]});
    }
    return out;
}

std::vector<HLCV> OHLCVSeries::hlcv() const {
    std::vector<HLCV> out;
    out.reserve(size());
    for (Size i = 0; i < size(); ++i) {
        out.push_back({high_[i], low_[i], close_[i], volume_[i]});
    }
    return out;
}

void OHLCVSeries::clear() {
    timestamp_.clear();
    open_.clear();
    high_.clear();
    low_.clear();
    close_.clear();
    volume_.clear();
}

std::vector<HLC> zipHLC(const char* indicator,
                        const std::vector<Value>& high,
                        const std::vector<Value>& low,
                        const std::vector<Value>& close) {
    requireSameLength(indicator, high.size(), low.size(), close.size());
    std::vector<HLC> out;
    out.reserve(close.size());
    for (Size i = 0; i < close.size(); ++i) {
        out.push_back({high[i], low[i], close[i]});
    }
    return out;
}

std::vector<HLCV> zipHLCV(const char* indicator,
                          const std::vector<Value>& high,
                          const std::vector<Value>& low,
                          const std::vector<Value>& close,
                          const std::vector<Value>& volume) {
    requireSameLength(indicator, high.size(), low.size(), close.size(), volume.size());
    std::vector<HLCV> out;
    out.reserve(close.size());
    for (Size i = 0; i < close.size(); ++i) {
        out.push_back({high[i], low[i], close[i], volume[i]});
    }
    return out;
}

std::vector<OHLCV> zipOHLCV(const char* indicator,
                            const std::vector<Timestamp>& timestamp,
                            const std::vector<Value>& open,
                            const std::vector<Value>& high,
                            const std::vector<Value>& low,
                            const std::vector<Value>& close,
                            const std::vector<Value>& volume) {
    requireSameLength(indicator, timestamp.size(), open.size(), high.size(),
                      low.size(), close.size(), volume.size());
    std::vector<OHLCV> out;
    out.reserve(close.size());
    for (Size i = 0; i < close.size(); ++i) {
        out.emplace_back(timestamp[i], open[i], high[i], low[i], close[i], volume[i]);
    }
    return out;
}

} // namespace ta
