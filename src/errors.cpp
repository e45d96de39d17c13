/**
 * @file errors.cpp
 * @brief 参数校验辅助
 */

#include "ta/errors.hpp"
#include "ta/logging.hpp"

namespace ta {

void require(bool condition, const char* indicator, const std::string& reason) {
    if (condition) {
        return;
    }
    log::logger()->debug("{}: rejected parameters ({})", indicator, reason);
    throw InvalidParameter(reason);
}

} // namespace ta
