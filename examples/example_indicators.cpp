/**
 * @file example_indicators.cpp
 * @brief 指标使用示例：批量计算、流式推进、成交量分布
 */

#include <iostream>
#include <iomanip>
#include <algorithm>
#include "ta/tacore.hpp"

namespace {

void printValue(ta::Value v) {
    if (ta::isnan(v)) {
        std::cout << "N/A";
    } else {
        std::cout << v;
    }
}

} // namespace

int main() {
    std::cout << "=== tacore Indicator Example ===" << std::endl;
    std::cout << "Version: " << ta::version() << std::endl << std::endl;

    // 创建测试价格数据
    std::vector<ta::Value> prices = {
        100.0, 101.5, 102.0, 101.0, 103.0,
        104.5, 105.0, 104.0, 106.0, 107.5,
        108.0, 107.0, 109.0, 110.5, 111.0,
        110.0, 112.0, 113.5, 114.0, 113.0
    };

    // 由收盘价构造 OHLCV，每小时一根
    ta::OHLCVSeries series;
    ta::Timestamp ts = 1700000000000;
    ta::Value prev = prices.front();
    for (ta::Value close : prices) {
        ta::Value high = std::max(prev, close) + 0.5;
        ta::Value low = std::min(prev, close) - 0.5;
        series.addBar(ts, prev, high, low, close, 1000.0 + 10.0 * (close - 100.0));
        prev = close;
        ts += 3600000;
    }

    std::cout << "Price data loaded: " << series.size() << " bars" << std::endl << std::endl;

    // 批量计算
    const int period = 5;
    ta::SMA sma(period);
    ta::EMA ema(period);
    ta::RSI rsi(period);
    auto smaValues = sma.calculate(prices);
    auto emaValues = ema.calculate(prices);
    auto rsiValues = rsi.calculate(prices);

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Bar\tPrice\tSMA\tEMA\tRSI" << std::endl;
    std::cout << "---\t-----\t---\t---\t---" << std::endl;
    for (size_t i = 0; i < prices.size(); ++i) {
        std::cout << i << "\t" << prices[i] << "\t";
        printValue(smaValues[i]);
        std::cout << "\t";
        printValue(emaValues[i]);
        std::cout << "\t";
        printValue(rsiValues[i]);
        std::cout << std::endl;
    }
    std::cout << std::endl;

    // 流式：逐 bar 推进
    std::cout << "=== Streaming MACD(3, 6, 3) ===" << std::endl;
    ta::MACD macd(3, 6, 3);
    for (ta::Value price : prices) {
        if (auto out = macd.next(price)) {
            std::cout << "macd=" << out->macd << " signal=";
            printValue(out->signal);
            std::cout << std::endl;
        }
    }
    std::cout << std::endl;

    // 布林带
    std::cout << "=== Bollinger Bands (5, 2.0) ===" << std::endl;
    ta::BollingerBands bb(period, 2.0);
    auto last = bb.calculate(prices).back();
    std::cout << "  upper: " << last.upper << std::endl;
    std::cout << "  mid:   " << last.middle << std::endl;
    std::cout << "  lower: " << last.lower << std::endl;
    std::cout << "  %B:    " << last.percentB << std::endl;
    std::cout << std::endl;

    // 高低收类指标
    auto hlc = series.hlc();
    auto atr = ta::ATR(period).calculate(hlc).back();
    auto adx = ta::ADX(period).calculate(hlc).back();
    std::cout << "=== HLC Indicators ===" << std::endl;
    std::cout << "  ATR(5): " << atr << std::endl;
    std::cout << "  ADX(5): ";
    printValue(adx.adx);
    std::cout << " (+DI " << adx.plusDI << ", -DI " << adx.minusDI << ")" << std::endl;
    std::cout << std::endl;

    // VWAP 与成交量分布
    std::cout << "=== Volume ===" << std::endl;
    auto vwap = ta::SessionVWAP().calculate(series.bars()).back();
    std::cout << "  Session VWAP: " << vwap << std::endl;

    ta::FRVP frvp(12);
    auto profile = frvp.calculate(series.bars());
    std::cout << "  POC: " << profile.poc
              << "  VAL: " << profile.val
              << "  VAH: " << profile.vah << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done ===" << std::endl;

    return 0;
}
