/**
 * @file logging.hpp
 * @brief 库内日志 - 基于 spdlog 的命名 logger
 */

#pragma once

#include "ta/common.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace ta {
namespace log {

/**
 * @brief 获取库 logger（名称 "tacore"，首次调用时创建，默认级别 warn）
 */
TA_API std::shared_ptr<spdlog::logger> logger();

/**
 * @brief 设置日志级别
 */
TA_API void setLevel(spdlog::level::level_enum level);

} // namespace log
} // namespace ta
