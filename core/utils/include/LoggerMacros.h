/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Chunk " + std::to_string(i) + " sealed", "TransferManager");
 */

#pragma once

#include "Logger.h"
#include <chrono>

namespace CubeLink {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::CubeLink::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::CubeLink::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::CubeLink::Logger::instance().error(msg, component)

// Logs elapsed time at DEBUG when it goes out of scope
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();

        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::CubeLink::ScopedTimer timer__(name, component)

} // namespace CubeLink
