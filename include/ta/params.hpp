/**
 * @file params.hpp
 * @brief 参数系统 - 指标的可配置参数
 *
 * - 编译期声明默认值（TA_PARAMS_BEGIN/TA_PARAM/TA_PARAMS_END）
 * - 用户参数覆盖默认值
 * - 数值参数在 int/long/long long/double 之间自动转换
 */

#pragma once

#include "ta/common.hpp"
#include "ta/errors.hpp"
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <stdexcept>
#include <type_traits>

namespace ta {

/**
 * @brief 参数值类型
 */
using ParamValue = std::variant<
    bool,
    int,
    long,
    long long,  // 毫秒时间戳
    double,
    std::string
>;

/**
 * @brief 参数存储容器
 */
class Params {
public:
    Params() = default;

    /**
     * @brief 设置参数
     */
    template<typename T>
    void set(const std::string& name, T value) {
        params_[name] = ParamValue(value);
    }

    void set(const std::string& name, const char* value) {
        params_[name] = ParamValue(std::string(value));
    }

    /**
     * @brief 获取参数（类型必须精确匹配）
     */
    template<typename T>
    T get(const std::string& name) const {
        return std::get<T>(find(name));
    }

    /**
     * @brief 获取参数（缺失或类型不符时返回默认值）
     */
    template<typename T>
    T get(const std::string& name, T defaultValue) const {
        auto it = params_.find(name);
        if (it == params_.end()) {
            return defaultValue;
        }
        const T* value = std::get_if<T>(&it->second);
        return value ? *value : defaultValue;
    }

    /**
     * @brief 获取数值参数，int/long/long long/double 之间自动转换
     */
    template<typename T>
    T getNumber(const std::string& name) const {
        static_assert(std::is_arithmetic<T>::value, "numeric parameter expected");
        return std::visit([&name](const auto& v) -> T {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_arithmetic<V>::value && !std::is_same<V, bool>::value) {
                return static_cast<T>(v);
            } else {
                throw InvalidParameter(name + " must be numeric");
            }
        }, find(name));
    }

    /**
     * @brief 获取窗口长度类参数（拒绝负数和非整数）
     */
    Size getSize(const std::string& name) const {
        const ParamValue& v = find(name);
        if (const double* d = std::get_if<double>(&v)) {
            if (!(*d >= 0.0) || std::floor(*d) != *d) {
                throw InvalidParameter(name + " must be a non-negative integer");
            }
            return static_cast<Size>(*d);
        }
        long long n = getNumber<long long>(name);
        if (n < 0) {
            throw InvalidParameter(name + " must be a non-negative integer");
        }
        return static_cast<Size>(n);
    }

    /**
     * @brief 检查参数是否存在
     */
    bool has(const std::string& name) const {
        return params_.find(name) != params_.end();
    }

    /**
     * @brief 合并另一个参数集（仅补充缺失项）
     */
    void merge(const Params& other) {
        for (const auto& [key, value] : other.params_) {
            if (params_.find(key) == params_.end()) {
                params_[key] = value;
            }
        }
    }

    /**
     * @brief 覆盖参数
     */
    void override(const Params& other) {
        for (const auto& [key, value] : other.params_) {
            params_[key] = value;
        }
    }

    /**
     * @brief 获取所有参数名
     */
    std::vector<std::string> keys() const {
        std::vector<std::string> result;
        result.reserve(params_.size());
        for (const auto& [key, _] : params_) {
            result.push_back(key);
        }
        return result;
    }

    Size size() const { return params_.size(); }

private:
    const ParamValue& find(const std::string& name) const {
        auto it = params_.find(name);
        if (it == params_.end()) {
            throw std::runtime_error("Parameter not found: " + name);
        }
        return it->second;
    }

    std::unordered_map<std::string, ParamValue> params_;
};

/**
 * @brief 参数化基类
 *
 * CRTP：若 Derived 定义了 getDefaultParams()，先装入默认值再用用户参数覆盖。
 */
template<typename Derived>
class Parametrized {
public:
    using ParamsType = Params;

    Parametrized() {
        initDefaultParams();
    }

    explicit Parametrized(const Params& userParams) {
        initDefaultParams();
        params_.override(userParams);
    }

    Params& p() { return params_; }
    const Params& p() const { return params_; }

    Params& params() { return params_; }
    const Params& params() const { return params_; }

protected:
    Params params_;

private:
    template<typename T, typename = void>
    struct has_default_params : std::false_type {};

    template<typename T>
    struct has_default_params<T, std::void_t<decltype(T::getDefaultParams())>> : std::true_type {};

    void initDefaultParams() {
        if constexpr (has_default_params<Derived>::value) {
            params_ = Derived::getDefaultParams();
        }
    }
};

/**
 * @brief 参数构建器 - 流式 API 设置参数
 */
class ParamsBuilder {
public:
    ParamsBuilder() = default;

    template<typename T>
    ParamsBuilder& add(const std::string& name, T value) {
        params_.set(name, value);
        return *this;
    }

    Params build() const { return params_; }

    operator Params() const { return params_; }

private:
    Params params_;
};

// 便捷宏：定义默认参数
#define TA_PARAMS_BEGIN() \
    static ::ta::Params getDefaultParams() { \
        return ::ta::ParamsBuilder()

#define TA_PARAM(name, value) \
        .add(#name, value)

#define TA_PARAMS_END() \
        .build(); \
    }

} // namespace ta
