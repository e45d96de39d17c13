/**
 * @file bindings.cpp
 * @brief Python 绑定 (pybind11)
 *
 * 将指标库暴露给 Python：批量 calculate 与流式 next/reset
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ta/tacore.hpp"

namespace py = pybind11;

namespace {

/**
 * @brief 为指标类绑定通用的批量/流式接口
 */
template<typename T>
py::class_<T> bindIndicator(py::module_& m, const char* name) {
    using In = typename T::Input;
    return py::class_<T>(m, name)
        .def(py::init<const ta::Params&>())
        .def("calculate", [](const T& self, const std::vector<In>& data) {
            return self.calculate(data);
        }, py::arg("data"), "Batch compute, output has the same length as input")
        .def("init", [](T& self, const std::vector<In>& data) {
            return self.init(data);
        }, py::arg("data"), "Reset and replay a prefix")
        .def("next", [](T& self, const In& x) {
            return self.next(x);
        }, py::arg("x"), "Advance by one bar")
        .def("reset", &T::reset)
        .def("is_ready", &T::isReady)
        .def("current", &T::current)
        .def("params", [](const T& self) { return self.params(); });
}

} // namespace

PYBIND11_MODULE(_tacore, m) {
    m.doc() = "tacore technical analysis indicators";

    // 版本信息
    m.def("version", &ta::version, "Get library version");

    // 异常映射
    auto base = py::register_exception<ta::IndicatorError>(m, "IndicatorError", PyExc_RuntimeError);
    py::register_exception<ta::InvalidParameter>(m, "InvalidParameter", base.ptr());
    py::register_exception<ta::InsufficientData>(m, "InsufficientData", base.ptr());
    py::register_exception<ta::NotInitialized>(m, "NotInitialized", base.ptr());

    m.def("set_log_level", [](const std::string& level) {
        ta::log::setLevel(spdlog::level::from_str(level));
    }, py::arg("level"), "Set tacore log level (trace/debug/info/warn/error/off)");

    // ==================== Params ====================
    py::class_<ta::Params>(m, "Params")
        .def(py::init<>())
        .def("set_int", [](ta::Params& self, const std::string& name, long val) {
            self.set<long>(name, val);
        })
        .def("set_double", [](ta::Params& self, const std::string& name, double val) {
            self.set<double>(name, val);
        })
        .def("set_string", [](ta::Params& self, const std::string& name, const std::string& val) {
            self.set<std::string>(name, val);
        })
        .def("set_bool", [](ta::Params& self, const std::string& name, bool val) {
            self.set<bool>(name, val);
        })
        .def("get_double", [](const ta::Params& self, const std::string& name) {
            return self.getNumber<double>(name);
        })
        .def("get_string", [](const ta::Params& self, const std::string& name) {
            return self.get<std::string>(name);
        })
        .def("has", &ta::Params::has)
        .def("keys", &ta::Params::keys);

    // ==================== Bars ====================
    py::class_<ta::OHLCV>(m, "OHLCV")
        .def(py::init<>())
        .def(py::init<ta::Timestamp, ta::Value, ta::Value, ta::Value, ta::Value, ta::Value>(),
             py::arg("timestamp"), py::arg("open"), py::arg("high"),
             py::arg("low"), py::arg("close"), py::arg("volume"))
        .def_readwrite("timestamp", &ta::OHLCV::timestamp)
        .def_readwrite("open", &ta::OHLCV::open)
        .def_readwrite("high", &ta::OHLCV::high)
        .def_readwrite("low", &ta::OHLCV::low)
        .def_readwrite("close", &ta::OHLCV::close)
        .def_readwrite("volume", &ta::OHLCV::volume)
        .def("typical_price", &ta::OHLCV::typicalPrice);

    py::class_<ta::HLC>(m, "HLC")
        .def(py::init([](ta::Value h, ta::Value l, ta::Value c) { return ta::HLC{h, l, c}; }),
             py::arg("high"), py::arg("low"), py::arg("close"))
        .def_readwrite("high", &ta::HLC::high)
        .def_readwrite("low", &ta::HLC::low)
        .def_readwrite("close", &ta::HLC::close);

    py::class_<ta::HLCV>(m, "HLCV")
        .def(py::init([](ta::Value h, ta::Value l, ta::Value c, ta::Value v) {
            return ta::HLCV{h, l, c, v};
        }), py::arg("high"), py::arg("low"), py::arg("close"), py::arg("volume"))
        .def_readwrite("high", &ta::HLCV::high)
        .def_readwrite("low", &ta::HLCV::low)
        .def_readwrite("close", &ta::HLCV::close)
        .def_readwrite("volume", &ta::HLCV::volume);

    // ==================== Output records ====================
    py::class_<ta::MACDOutput>(m, "MACDOutput")
        .def_readonly("macd", &ta::MACDOutput::macd)
        .def_readonly("signal", &ta::MACDOutput::signal)
        .def_readonly("histogram", &ta::MACDOutput::histogram);

    py::class_<ta::BollingerOutput>(m, "BollingerOutput")
        .def_readonly("upper", &ta::BollingerOutput::upper)
        .def_readonly("middle", &ta::BollingerOutput::middle)
        .def_readonly("lower", &ta::BollingerOutput::lower)
        .def_readonly("percent_b", &ta::BollingerOutput::percentB)
        .def_readonly("bandwidth", &ta::BollingerOutput::bandwidth);

    py::class_<ta::ADXOutput>(m, "ADXOutput")
        .def_readonly("adx", &ta::ADXOutput::adx)
        .def_readonly("plus_di", &ta::ADXOutput::plusDI)
        .def_readonly("minus_di", &ta::ADXOutput::minusDI);

    py::class_<ta::StochasticOutput>(m, "StochasticOutput")
        .def_readonly("k", &ta::StochasticOutput::k)
        .def_readonly("d", &ta::StochasticOutput::d);

    py::class_<ta::IchimokuOutput>(m, "IchimokuOutput")
        .def_readonly("tenkan_sen", &ta::IchimokuOutput::tenkanSen)
        .def_readonly("kijun_sen", &ta::IchimokuOutput::kijunSen)
        .def_readonly("senkou_span_a", &ta::IchimokuOutput::senkouSpanA)
        .def_readonly("senkou_span_b", &ta::IchimokuOutput::senkouSpanB)
        .def_readonly("chikou_span", &ta::IchimokuOutput::chikouSpan);

    py::class_<ta::LinRegOutput>(m, "LinRegOutput")
        .def_readonly("value", &ta::LinRegOutput::value)
        .def_readonly("upper", &ta::LinRegOutput::upper)
        .def_readonly("lower", &ta::LinRegOutput::lower)
        .def_readonly("slope", &ta::LinRegOutput::slope)
        .def_readonly("intercept", &ta::LinRegOutput::intercept)
        .def_readonly("r", &ta::LinRegOutput::r)
        .def_readonly("r_squared", &ta::LinRegOutput::rSquared);

    py::class_<ta::PivotPointsOutput>(m, "PivotPointsOutput")
        .def_readonly("pivot", &ta::PivotPointsOutput::pivot)
        .def_readonly("r1", &ta::PivotPointsOutput::r1)
        .def_readonly("r2", &ta::PivotPointsOutput::r2)
        .def_readonly("r3", &ta::PivotPointsOutput::r3)
        .def_readonly("s1", &ta::PivotPointsOutput::s1)
        .def_readonly("s2", &ta::PivotPointsOutput::s2)
        .def_readonly("s3", &ta::PivotPointsOutput::s3);

    py::class_<ta::VolumeProfileRow>(m, "VolumeProfileRow")
        .def_readonly("price", &ta::VolumeProfileRow::price)
        .def_readonly("volume", &ta::VolumeProfileRow::volume)
        .def_readonly("low", &ta::VolumeProfileRow::low)
        .def_readonly("high", &ta::VolumeProfileRow::high);

    py::class_<ta::FRVPOutput>(m, "FRVPOutput")
        .def_readonly("poc", &ta::FRVPOutput::poc)
        .def_readonly("vah", &ta::FRVPOutput::vah)
        .def_readonly("val", &ta::FRVPOutput::val)
        .def_readonly("total_volume", &ta::FRVPOutput::totalVolume)
        .def_readonly("poc_volume", &ta::FRVPOutput::pocVolume)
        .def_readonly("value_area_volume", &ta::FRVPOutput::valueAreaVolume)
        .def_readonly("range_high", &ta::FRVPOutput::rangeHigh)
        .def_readonly("range_low", &ta::FRVPOutput::rangeLow)
        .def_readonly("histogram", &ta::FRVPOutput::histogram);

    // ==================== Moving averages ====================
    bindIndicator<ta::SMA>(m, "SMA")
        .def(py::init<ta::Size>(), py::arg("period") = 30);
    bindIndicator<ta::EMA>(m, "EMA")
        .def(py::init<ta::Size>(), py::arg("period") = 30)
        .def(py::init<ta::Size, ta::Value>(), py::arg("period"), py::arg("multiplier"));
    bindIndicator<ta::WMA>(m, "WMA")
        .def(py::init<ta::Size>(), py::arg("period") = 30);
    bindIndicator<ta::HMA>(m, "HMA")
        .def(py::init<ta::Size>(), py::arg("period") = 9);

    // ==================== Oscillators ====================
    bindIndicator<ta::RSI>(m, "RSI")
        .def(py::init<ta::Size>(), py::arg("period") = 14);
    bindIndicator<ta::StochRSI>(m, "StochRSI")
        .def(py::init<ta::Size, ta::Size, ta::Size, ta::Size>(),
             py::arg("rsi_period") = 14, py::arg("stoch_period") = 14,
             py::arg("k_smooth") = 3, py::arg("d_period") = 3);
    bindIndicator<ta::MFI>(m, "MFI")
        .def(py::init<ta::Size>(), py::arg("period") = 14);
    bindIndicator<ta::Stochastic>(m, "Stochastic")
        .def(py::init([](ta::Size k, ta::Size d, bool slow, ta::Size slowing) {
            return ta::Stochastic(k, d, slow ? ta::StochType::Slow : ta::StochType::Fast, slowing);
        }), py::arg("k_period") = 14, py::arg("d_period") = 3,
            py::arg("slow") = false, py::arg("slowing") = 3);
    bindIndicator<ta::ADX>(m, "ADX")
        .def(py::init<ta::Size>(), py::arg("period") = 14);

    // ==================== Trend / envelopes ====================
    bindIndicator<ta::MACD>(m, "MACD")
        .def(py::init([](ta::Size fast, ta::Size slow, ta::Size signal, bool smaSignal) {
            return ta::MACD(fast, slow, signal, smaSignal ? ta::SignalType::SMA : ta::SignalType::EMA);
        }), py::arg("fast") = 12, py::arg("slow") = 26, py::arg("signal") = 9,
            py::arg("sma_signal") = false);
    bindIndicator<ta::BollingerBands>(m, "BollingerBands")
        .def(py::init<ta::Size, ta::Value>(), py::arg("period") = 20, py::arg("devfactor") = 2.0);
    bindIndicator<ta::ATR>(m, "ATR")
        .def(py::init<ta::Size>(), py::arg("period") = 14);
    bindIndicator<ta::Ichimoku>(m, "Ichimoku")
        .def(py::init<ta::Size, ta::Size, ta::Size>(),
             py::arg("tenkan") = 9, py::arg("kijun") = 26, py::arg("senkou") = 52);
    bindIndicator<ta::LinReg>(m, "LinReg")
        .def(py::init<ta::Size, ta::Value>(), py::arg("period") = 20, py::arg("multiplier") = 2.0);

    py::enum_<ta::PivotType>(m, "PivotType")
        .value("STANDARD", ta::PivotType::Standard)
        .value("FIBONACCI", ta::PivotType::Fibonacci)
        .value("WOODIE", ta::PivotType::Woodie);
    bindIndicator<ta::PivotPoints>(m, "PivotPoints")
        .def(py::init<ta::PivotType>(), py::arg("type") = ta::PivotType::Standard)
        .def("compute", [](const ta::PivotPoints& self, ta::Value h, ta::Value l, ta::Value c) {
            return self.calculate(h, l, c);
        }, py::arg("high"), py::arg("low"), py::arg("close"));

    // ==================== Volume ====================
    bindIndicator<ta::SessionVWAP>(m, "SessionVWAP")
        .def(py::init<>())
        .def("cumulative_volume", &ta::SessionVWAP::cumulativeVolume);
    bindIndicator<ta::RollingVWAP>(m, "RollingVWAP")
        .def(py::init<ta::Size>(), py::arg("period") = 20);
    bindIndicator<ta::AnchoredVWAP>(m, "AnchoredVWAP")
        .def(py::init<>())
        .def_static("at_timestamp", &ta::AnchoredVWAP::atTimestamp, py::arg("anchor"))
        .def_static("at_index", &ta::AnchoredVWAP::atIndex, py::arg("index"))
        .def_static("at_next_input", &ta::AnchoredVWAP::atNextInput)
        .def_static("from_timestamp", &ta::AnchoredVWAP::fromTimestamp,
                    py::arg("data"), py::arg("anchor"))
        .def("set_anchor", &ta::AnchoredVWAP::setAnchor, py::arg("anchor"))
        .def("anchor_now", &ta::AnchoredVWAP::anchorNow)
        .def("anchor_timestamp", &ta::AnchoredVWAP::anchorTimestamp);
    bindIndicator<ta::CVD>(m, "CVD")
        .def(py::init<>())
        .def("total", &ta::CVD::total);
    bindIndicator<ta::CVDOHLCV>(m, "CVDOHLCV")
        .def(py::init<>())
        .def("total", &ta::CVDOHLCV::total)
        .def_static("delta", &ta::CVDOHLCV::delta,
                    py::arg("high"), py::arg("low"), py::arg("close"), py::arg("volume"));

    py::class_<ta::FRVP>(m, "FRVP")
        .def(py::init<const ta::Params&>())
        .def(py::init<ta::Size, ta::Value>(), py::arg("bins") = 100, py::arg("value_area") = 0.70)
        .def("calculate", [](const ta::FRVP& self, const std::vector<ta::OHLCV>& data) {
            return self.calculate(data);
        }, py::arg("data"))
        .def("init", &ta::FRVP::init, py::arg("data"))
        .def("next", &ta::FRVP::next, py::arg("bar"))
        .def("reset", &ta::FRVP::reset)
        .def("is_ready", &ta::FRVP::isReady)
        .def("current", &ta::FRVP::current)
        .def("bar_count", &ta::FRVP::barCount);
}
