/**
 * @file indicators/vwap.cpp
 * @brief VWAP 系列实现
 */

#include "ta/indicators/vwap.hpp"
#include "ta/series.hpp"
#include <string>

namespace ta {
namespace indicators {

// ==================== SessionVWAP ====================

std::vector<Value> SessionVWAP::calculate(const std::vector<Timestamp>& timestamp,
                                          const std::vector<Value>& open,
                                          const std::vector<Value>& high,
                                          const std::vector<Value>& low,
                                          const std::vector<Value>& close,
                                          const std::vector<Value>& volume) const {
    return calculate(zipOHLCV("SessionVWAP", timestamp, open, high, low, close, volume));
}

std::optional<Value> SessionVWAP::next(const OHLCV& bar) {
    Timestamp day = dayNumber(bar.timestamp);
    if (!day_ || *day_ != day) {
        day_ = day;
        cumTpVolume_ = 0.0;
        cumVolume_ = 0.0;
    }

    cumTpVolume_ += bar.typicalPrice() * bar.volume;
    cumVolume_ += bar.volume;

    if (cumVolume_ == 0.0) {
        return std::nullopt;
    }
    return emit(cumTpVolume_ / cumVolume_);
}

void SessionVWAP::reset() {
    day_.reset();
    cumTpVolume_ = 0.0;
    cumVolume_ = 0.0;
    clearCurrent();
}

// ==================== RollingVWAP ====================

RollingVWAP::RollingVWAP(const Params& params) : Indicator(params) {
    setup();
}

RollingVWAP::RollingVWAP(Size period)
    : Indicator(ParamsBuilder().add("period", static_cast<long>(period))) {
    setup();
}

void RollingVWAP::setup() {
    period_ = p().getSize("period");
    require(period_ > 0, "RollingVWAP", "period must be greater than 0");
    tpVolume_ = RollingSum(period_);
    volume_ = RollingSum(period_);
}

std::vector<Value> RollingVWAP::calculate(const std::vector<Timestamp>& timestamp,
                                          const std::vector<Value>& open,
                                          const std::vector<Value>& high,
                                          const std::vector<Value>& low,
                                          const std::vector<Value>& close,
                                          const std::vector<Value>& volume) const {
    return calculate(zipOHLCV("RollingVWAP", timestamp, open, high, low, close, volume));
}

std::optional<Value> RollingVWAP::next(const OHLCV& bar) {
    tpVolume_.update(bar.typicalPrice() * bar.volume);
    volume_.update(bar.volume);

    if (!volume_.full() || volume_.sum() == 0.0) {
        return std::nullopt;
    }
    return emit(tpVolume_.sum() / volume_.sum());
}

void RollingVWAP::reset() {
    tpVolume_.reset();
    volume_.reset();
    clearCurrent();
}

// ==================== AnchoredVWAP ====================

AnchoredVWAP::AnchoredVWAP(const Params& params) : Indicator(params) {
    setup();
}

AnchoredVWAP AnchoredVWAP::atTimestamp(Timestamp anchor) {
    return AnchoredVWAP(ParamsBuilder()
                            .add("anchor_mode", "timestamp")
                            .add("anchor", static_cast<long long>(anchor)));
}

AnchoredVWAP AnchoredVWAP::atIndex(Size index) {
    return AnchoredVWAP(ParamsBuilder()
                            .add("anchor_mode", "index")
                            .add("anchor", static_cast<long long>(index)));
}

AnchoredVWAP AnchoredVWAP::atNextInput() {
    return AnchoredVWAP(ParamsBuilder().add("anchor_mode", "next"));
}

std::optional<Size> AnchoredVWAP::fromTimestamp(const std::vector<OHLCV>& data, Timestamp anchor) {
    for (Size i = 0; i < data.size(); ++i) {
        if (data[i].timestamp >= anchor) {
            return i;
        }
    }
    return std::nullopt;
}

void AnchoredVWAP::setup() {
    const std::string mode = p().get<std::string>("anchor_mode");
    anchor_ = p().getNumber<Timestamp>("anchor");

    if (mode == "timestamp") {
        mode_ = AnchorMode::Timestamp;
    } else if (mode == "index") {
        require(anchor_ >= 0, "AnchoredVWAP", "anchor index must be non-negative");
        mode_ = AnchorMode::Index;
    } else {
        require(mode == "next", "AnchoredVWAP",
                "anchor_mode must be \"timestamp\", \"index\" or \"next\"");
        mode_ = AnchorMode::NextInput;
    }
}

void AnchoredVWAP::configure(const char* mode, Timestamp anchor) {
    params_.set("anchor_mode", mode);
    params_.set("anchor", static_cast<long long>(anchor));
    reset();
}

void AnchoredVWAP::setAnchor(Timestamp anchor) {
    configure("timestamp", anchor);
}

void AnchoredVWAP::anchorNow() {
    configure("next", 0L);
}

std::vector<Value> AnchoredVWAP::calculate(const std::vector<Timestamp>& timestamp,
                                           const std::vector<Value>& open,
                                           const std::vector<Value>& high,
                                           const std::vector<Value>& low,
                                           const std::vector<Value>& close,
                                           const std::vector<Value>& volume) const {
    return calculate(zipOHLCV("AnchoredVWAP", timestamp, open, high, low, close, volume));
}

std::optional<Value> AnchoredVWAP::next(const OHLCV& bar) {
    Size index = barIndex_++;

    if (!anchoredAt_) {
        bool reached = false;
        switch (mode_) {
            case AnchorMode::Timestamp:
                reached = bar.timestamp >= anchor_;
                break;
            case AnchorMode::Index:
                reached = index >= static_cast<Size>(anchor_);
                break;
            case AnchorMode::NextInput:
                reached = true;
                break;
        }
        if (!reached) {
            return std::nullopt;
        }
        anchoredAt_ = bar.timestamp;
        log::logger()->debug("AnchoredVWAP: anchored at bar {} (timestamp {})", index, bar.timestamp);
    }

    cumTpVolume_ += bar.typicalPrice() * bar.volume;
    cumVolume_ += bar.volume;

    if (cumVolume_ == 0.0) {
        return std::nullopt;
    }
    return emit(cumTpVolume_ / cumVolume_);
}

void AnchoredVWAP::reset() {
    setup();
    barIndex_ = 0;
    anchoredAt_.reset();
    cumTpVolume_ = 0.0;
    cumVolume_ = 0.0;
    clearCurrent();
}

} // namespace indicators
} // namespace ta
