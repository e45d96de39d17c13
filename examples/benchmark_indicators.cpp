/**
 * @file benchmark_indicators.cpp
 * @brief 指标性能基准测试
 */

#include <iostream>
#include <iomanip>
#include <algorithm>
#include <chrono>
#include <vector>
#include <random>
#include "ta/tacore.hpp"

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

// 生成随机 bar 数据
std::vector<ta::OHLCV> generateRandomBars(size_t count, ta::Value startPrice = 100.0) {
    std::vector<ta::OHLCV> bars;
    bars.reserve(count);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::normal_distribution<> dis(0.0, 1.0);
    std::uniform_real_distribution<> wick(0.0, 0.5);
    std::uniform_real_distribution<> vol(100.0, 1000.0);

    ta::Value price = startPrice;
    ta::Timestamp ts = 1700000000000;
    for (size_t i = 0; i < count; ++i) {
        ta::Value open = price;
        price = std::max(1.0, price + dis(gen));
        ta::Value high = std::max(open, price) + wick(gen);
        ta::Value low = std::min(open, price) - wick(gen);
        bars.emplace_back(ts, open, high, low, price, vol(gen));
        ts += 60000;
    }

    return bars;
}

template<typename Indicator, typename Input, typename... Args>
Duration benchmarkIndicator(const std::vector<Input>& data, int iterations, Args&&... args) {
    Duration total(0);
    Indicator ind(std::forward<Args>(args)...);

    for (int i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        auto out = ind.calculate(data);
        auto end = Clock::now();
        total += std::chrono::duration_cast<Duration>(end - start);
        if (out.size() != data.size()) {
            std::cerr << "unexpected output size" << std::endl;
        }
    }

    return total / iterations;
}

int main() {
    std::cout << "=== tacore Performance Benchmark ===" << std::endl;
    std::cout << "Version: " << ta::version() << std::endl << std::endl;

    // 测试不同数据规模
    std::vector<size_t> dataSizes = {1000, 10000, 100000, 1000000};
    int iterations = 10;

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Data Size\tSMA(20)\t\tEMA(20)\t\tRSI(14)\t\tBollinger(20)\tADX(14)\t\tVWAP(20)" << std::endl;
    std::cout << "---------\t-------\t\t-------\t\t-------\t\t-------------\t-------\t\t--------" << std::endl;

    for (size_t size : dataSizes) {
        std::cout << size << "\t\t";

        auto bars = generateRandomBars(size);
        ta::OHLCVSeries series;
        for (const auto& bar : bars) {
            series.addBar(bar);
        }
        const auto& closes = series.close();
        auto hlc = series.hlc();

        auto smaDuration = benchmarkIndicator<ta::SMA>(closes, iterations, ta::Size(20));
        std::cout << smaDuration.count() << " ms\t";

        auto emaDuration = benchmarkIndicator<ta::EMA>(closes, iterations, ta::Size(20));
        std::cout << emaDuration.count() << " ms\t";

        auto rsiDuration = benchmarkIndicator<ta::RSI>(closes, iterations, ta::Size(14));
        std::cout << rsiDuration.count() << " ms\t";

        auto bbDuration = benchmarkIndicator<ta::BollingerBands>(closes, iterations, ta::Size(20), 2.0);
        std::cout << bbDuration.count() << " ms\t";

        auto adxDuration = benchmarkIndicator<ta::ADX>(hlc, iterations, ta::Size(14));
        std::cout << adxDuration.count() << " ms\t";

        auto vwapDuration = benchmarkIndicator<ta::RollingVWAP>(bars, iterations, ta::Size(20));
        std::cout << vwapDuration.count() << " ms";

        std::cout << std::endl;
    }

    std::cout << std::endl;

    // 详细的单次测试（100万数据点，流式推进）
    std::cout << "=== Streaming Benchmark (1M bars) ===" << std::endl;

    auto bars = generateRandomBars(1000000);

    {
        ta::Stochastic stoch(14, 3, ta::StochType::Slow, 3);
        std::vector<ta::HLC> hlc;
        hlc.reserve(bars.size());
        for (const auto& b : bars) {
            hlc.push_back({b.high, b.low, b.close});
        }

        size_t produced = 0;
        auto start = Clock::now();
        for (const auto& bar : hlc) {
            if (stoch.next(bar)) {
                ++produced;
            }
        }
        auto end = Clock::now();
        auto duration = std::chrono::duration_cast<Duration>(end - start);

        std::cout << "Stochastic slow(14, 3, 3): " << duration.count() << " ms" << std::endl;
        std::cout << "  Values produced: " << produced << std::endl;
        std::cout << "  Throughput: " << (1000000.0 / duration.count() * 1000.0)
                  << " bars/sec" << std::endl;
    }

    std::cout << std::endl;

    // 成交量分布：全量重算
    std::cout << "=== FRVP (100 bins) ===" << std::endl;
    for (size_t size : {1000, 10000, 100000}) {
        std::vector<ta::OHLCV> window(bars.begin(), bars.begin() + size);
        ta::FRVP frvp(100);
        auto start = Clock::now();
        auto profile = frvp.calculate(window);
        auto end = Clock::now();
        auto duration = std::chrono::duration_cast<Duration>(end - start);
        std::cout << size << " bars: " << duration.count() << " ms (POC " << profile.poc << ")" << std::endl;
    }

    std::cout << std::endl;
    std::cout << "=== Benchmark Complete ===" << std::endl;

    return 0;
}
