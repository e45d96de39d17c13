/**
 * @file indicators/ichimoku.cpp
 * @brief 一目均衡表实现 - 三组单调队列并行
 */

#include "ta/indicators/ichimoku.hpp"
#include "ta/series.hpp"

namespace ta {
namespace indicators {

Ichimoku::Ichimoku(const Params& params) : Indicator(params) {
    setup();
}

Ichimoku::Ichimoku(Size tenkan, Size kijun, Size senkou)
    : Indicator(ParamsBuilder()
                    .add("tenkan", static_cast<long>(tenkan))
                    .add("kijun", static_cast<long>(kijun))
                    .add("senkou", static_cast<long>(senkou))) {
    setup();
}

void Ichimoku::setup() {
    Size t = p().getSize("tenkan");
    Size j = p().getSize("kijun");
    Size b = p().getSize("senkou");
    require(t > 0 && j > 0 && b > 0, "Ichimoku", "all periods must be greater than 0");

    tenkan_ = WindowExtrema(t);
    kijun_ = WindowExtrema(j);
    senkou_ = WindowExtrema(b);
}

std::vector<IchimokuOutput> Ichimoku::calculate(const std::vector<Value>& high,
                                                const std::vector<Value>& low,
                                                const std::vector<Value>& close) const {
    return calculate(zipHLC("Ichimoku", high, low, close));
}

std::optional<IchimokuOutput> Ichimoku::next(const HLC& bar) {
    tenkan_.update(bar.high, bar.low);
    kijun_.update(bar.high, bar.low);
    senkou_.update(bar.high, bar.low);

    IchimokuOutput out;
    out.chikouSpan = bar.close;
    if (tenkan_.ready()) {
        out.tenkanSen = tenkan_.midpoint();
    }
    if (kijun_.ready()) {
        out.kijunSen = kijun_.midpoint();
    }
    if (tenkan_.ready() && kijun_.ready()) {
        out.senkouSpanA = (out.tenkanSen + out.kijunSen) / 2.0;
    }
    if (senkou_.ready()) {
        out.senkouSpanB = senkou_.midpoint();
    }
    return emit(out);
}

void Ichimoku::reset() {
    tenkan_.reset();
    kijun_.reset();
    senkou_.reset();
    clearCurrent();
}

} // namespace indicators
} // namespace ta
