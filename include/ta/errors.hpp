/**
 * @file errors.hpp
 * @brief 指标错误类型
 *
 * 构造函数和 init/calculate 可能抛出；next() 从不抛出。
 */

#pragma once

#include "ta/common.hpp"
#include <stdexcept>
#include <string>

namespace ta {

/**
 * @brief 错误类别
 */
enum class ErrorKind {
    InvalidParameter,
    InsufficientData,
    NotInitialized
};

/**
 * @brief 所有指标错误的基类
 */
class IndicatorError : public std::runtime_error {
public:
    IndicatorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief 参数超出定义域，或并行输入数组长度不一致
 */
class InvalidParameter : public IndicatorError {
public:
    explicit InvalidParameter(const std::string& reason)
        : IndicatorError(ErrorKind::InvalidParameter, "Invalid parameter: " + reason)
        , reason_(reason) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

/**
 * @brief 输入数据不足
 */
class InsufficientData : public IndicatorError {
public:
    InsufficientData(Size required, Size provided)
        : IndicatorError(ErrorKind::InsufficientData,
                         "Insufficient data: required " + std::to_string(required) +
                         ", provided " + std::to_string(provided))
        , required_(required), provided_(provided) {}

    Size required() const { return required_; }
    Size provided() const { return provided_; }

private:
    Size required_;
    Size provided_;
};

/**
 * @brief 在产生第一个值之前读取当前值
 */
class NotInitialized : public IndicatorError {
public:
    NotInitialized()
        : IndicatorError(ErrorKind::NotInitialized, "Indicator not initialized") {}
};

/**
 * @brief 参数校验：条件不满足时记录并抛出 InvalidParameter
 *
 * 定义于 src/errors.cpp（需要日志）。
 */
TA_API void require(bool condition, const char* indicator, const std::string& reason);

/**
 * @brief 并行输入数组长度校验
 */
template<typename... Ns>
void requireSameLength(const char* indicator, Size first, Ns... rest) {
    bool same = ((static_cast<Size>(rest) == first) && ...);
    require(same, indicator, "all input arrays must have the same length");
}

} // namespace ta
