/**
 * @file logging.cpp
 * @brief 库 logger 实现
 */

#include "ta/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace ta {
namespace log {

namespace {
constexpr const char* LOGGER_NAME = "tacore";
std::once_flag initFlag;
}

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(initFlag, [] {
        if (!spdlog::get(LOGGER_NAME)) {
            auto lg = spdlog::stderr_color_mt(LOGGER_NAME);
            lg->set_level(spdlog::level::warn);
            lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        }
    });
    return spdlog::get(LOGGER_NAME);
}

void setLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace log

} // namespace ta
