/**
 * @file common.hpp
 * @brief tacore 通用定义和宏
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <cmath>

namespace ta {

// 版本信息
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// 基础类型别名
using Size = std::size_t;
using Index = std::ptrdiff_t;
using Value = double;           // 价格/成交量数值类型
using Timestamp = std::int64_t; // 毫秒级 Unix 时间戳

// 特殊值
constexpr Value NaN = std::numeric_limits<Value>::quiet_NaN();
constexpr Value Inf = std::numeric_limits<Value>::infinity();
constexpr Value EPSILON = std::numeric_limits<Value>::epsilon();

// 一天的毫秒数（会话 VWAP 按 UTC 日切分）
constexpr Timestamp MILLIS_PER_DAY = 86400000;

// 检查 NaN
inline bool isnan(Value v) { return std::isnan(v); }

// 导出宏（静态库由构建系统定义 TA_STATIC）
#if defined(TA_STATIC)
    #define TA_API
#elif defined(_WIN32) || defined(_WIN64)
    #ifdef TA_BUILDING_LIBRARY
        #define TA_API __declspec(dllexport)
    #else
        #define TA_API __declspec(dllimport)
    #endif
#else
    #define TA_API __attribute__((visibility("default")))
#endif

// 默认拷贝/移动宏（流式指标是值类型，可拷贝）
#define TA_DEFAULT_COPY(Class) \
    Class(const Class&) = default; \
    Class& operator=(const Class&) = default;

#define TA_DEFAULT_MOVE(Class) \
    Class(Class&&) = default; \
    Class& operator=(Class&&) = default;

} // namespace ta
