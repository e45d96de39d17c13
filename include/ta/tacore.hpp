/**
 * @file tacore.hpp
 * @brief tacore 主头文件
 *
 * 包含所有核心功能的单一入口点
 */

#pragma once

// 核心组件
#include "ta/common.hpp"
#include "ta/errors.hpp"
#include "ta/logging.hpp"
#include "ta/params.hpp"
#include "ta/types.hpp"
#include "ta/series.hpp"
#include "ta/indicator.hpp"

// 增量原语
#include "ta/ringbuffer.hpp"
#include "ta/rolling.hpp"
#include "ta/monotonic_deque.hpp"
#include "ta/wilder.hpp"

// 移动平均
#include "ta/indicators/sma.hpp"
#include "ta/indicators/ema.hpp"
#include "ta/indicators/hma.hpp"

// 振荡器
#include "ta/indicators/rsi.hpp"
#include "ta/indicators/stochastic.hpp"
#include "ta/indicators/mfi.hpp"
#include "ta/indicators/adx.hpp"

// 通道
#include "ta/indicators/bollinger.hpp"
#include "ta/indicators/atr.hpp"
#include "ta/indicators/linreg.hpp"

// 趋势
#include "ta/indicators/macd.hpp"
#include "ta/indicators/ichimoku.hpp"
#include "ta/indicators/pivot.hpp"

// 成交量
#include "ta/indicators/vwap.hpp"
#include "ta/indicators/cvd.hpp"
#include "ta/indicators/frvp.hpp"

namespace ta {

/**
 * @brief 版本字符串
 */
inline const char* version() {
    return "0.3.0";
}

} // namespace ta
