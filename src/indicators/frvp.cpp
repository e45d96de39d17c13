/**
 * @file indicators/frvp.cpp
 * @brief 固定区间成交量分布实现
 */

#include "ta/indicators/frvp.hpp"
#include "ta/logging.hpp"
#include "ta/series.hpp"
#include <algorithm>
#include <cmath>

namespace ta {
namespace indicators {

FRVP::FRVP(const Params& params) : Parametrized(params) {
    setup();
}

FRVP::FRVP(Size bins, Value valueArea)
    : Parametrized(ParamsBuilder()
                       .add("bins", static_cast<long>(bins))
                       .add("value_area", valueArea)) {
    setup();
}

void FRVP::setup() {
    bins_ = p().getSize("bins");
    valueArea_ = p().getNumber<Value>("value_area");

    require(bins_ > 0, "FRVP", "bins must be at least 1");
    require(valueArea_ >= 0.0 && valueArea_ <= 1.0, "FRVP",
            "value_area must be between 0.0 and 1.0");
}

std::pair<Size, Size> FRVP::valueArea(const std::vector<Value>& volumes, Size poc, Value target) {
    Size lo = poc;
    Size hi = poc;
    Value enclosed = volumes[poc];

    while (enclosed < target) {
        bool canDown = lo > 0;
        bool canUp = hi + 1 < volumes.size();
        if (!canDown && !canUp) {
            break;
        }

        Value down = canDown ? volumes[lo - 1] : 0.0;
        Value up = canUp ? volumes[hi + 1] : 0.0;

        if (canDown && (!canUp || down >= up)) {
            --lo;
            enclosed += down;
        } else {
            ++hi;
            enclosed += up;
        }
    }
    return {lo, hi};
}

FRVPOutput FRVP::calculate(const std::vector<OHLCV>& data) const {
    if (data.empty()) {
        log::logger()->warn("FRVP: empty input");
        throw InsufficientData(1, 0);
    }

    Value rangeHigh = -Inf;
    Value rangeLow = Inf;
    for (const auto& bar : data) {
        rangeHigh = std::max(rangeHigh, bar.high);
        rangeLow = std::min(rangeLow, bar.low);
    }

    FRVPOutput out;
    out.rangeHigh = rangeHigh;
    out.rangeLow = rangeLow;

    // 价格区间退化：所有成交量归入单个区间
    if (std::abs(rangeHigh - rangeLow) < EPSILON) {
        log::logger()->debug("FRVP: price range collapsed to {}", rangeHigh);
        Value total = 0.0;
        for (const auto& bar : data) {
            total += bar.volume;
        }
        out.poc = rangeHigh;
        out.vah = rangeHigh;
        out.val = rangeLow;
        out.totalVolume = total;
        out.pocVolume = total;
        out.valueAreaVolume = total;
        out.histogram.push_back({rangeHigh, total, rangeLow, rangeHigh});
        return out;
    }

    const Value width = (rangeHigh - rangeLow) / static_cast<Value>(bins_);
    const Size last = bins_ - 1;
    std::vector<Value> volumes(bins_, 0.0);

    auto binOf = [&](Value price) -> Size {
        Value idx = std::floor((price - rangeLow) / width);
        if (!(idx > 0.0)) {
            return 0;
        }
        return std::min(static_cast<Size>(idx), last);
    };

    for (const auto& bar : data) {
        if (!(bar.volume > 0.0)) {
            continue;
        }
        Size start = binOf(bar.low);
        Size end = binOf(bar.high);
        Value barRange = bar.high - bar.low;

        if (barRange < EPSILON) {
            volumes[start] += bar.volume;
            continue;
        }
        for (Size i = start; i <= end; ++i) {
            Value binLow = rangeLow + static_cast<Value>(i) * width;
            Value binHigh = binLow + width;
            Value overlap = std::min(bar.high, binHigh) - std::max(bar.low, binLow);
            if (overlap > 0.0) {
                volumes[i] += bar.volume * overlap / barRange;
            }
        }
    }

    Size poc = 0;
    Value pocVolume = 0.0;
    Value total = 0.0;
    for (Size i = 0; i < bins_; ++i) {
        total += volumes[i];
        if (volumes[i] > pocVolume) {
            pocVolume = volumes[i];
            poc = i;
        }
    }

    auto [lo, hi] = valueArea(volumes, poc, total * valueArea_);

    Value enclosed = 0.0;
    for (Size i = lo; i <= hi; ++i) {
        enclosed += volumes[i];
    }

    out.histogram.reserve(bins_);
    for (Size i = 0; i < bins_; ++i) {
        Value binLow = rangeLow + static_cast<Value>(i) * width;
        Value binHigh = binLow + width;
        out.histogram.push_back({(binLow + binHigh) / 2.0, volumes[i], binLow, binHigh});
    }

    out.poc = rangeLow + (static_cast<Value>(poc) + 0.5) * width;
    out.val = rangeLow + static_cast<Value>(lo) * width;
    out.vah = rangeLow + static_cast<Value>(hi + 1) * width;
    out.totalVolume = total;
    out.pocVolume = pocVolume;
    out.valueAreaVolume = enclosed;
    return out;
}

FRVPOutput FRVP::calculate(const std::vector<Timestamp>& timestamp,
                           const std::vector<Value>& open,
                           const std::vector<Value>& high,
                           const std::vector<Value>& low,
                           const std::vector<Value>& close,
                           const std::vector<Value>& volume) const {
    return calculate(zipOHLCV("FRVP", timestamp, open, high, low, close, volume));
}

FRVPOutput FRVP::init(const std::vector<OHLCV>& data) {
    reset();
    FRVPOutput out = calculate(data);
    bars_ = data;
    current_ = out;
    return out;
}

std::optional<FRVPOutput> FRVP::next(const OHLCV& bar) {
    bars_.push_back(bar);
    current_ = calculate(bars_);
    return current_;
}

void FRVP::reset() {
    bars_.clear();
    current_.reset();
}

} // namespace indicators
} // namespace ta
