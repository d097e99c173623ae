/**
 * @file log.cpp
 * @brief 共享 logger 的创建与替换
 */

#include <vesta_device/log.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vesta_device {

namespace {

std::mutex g_loggerMutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> CreateDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("vesta", sink);
    logger->set_level(spdlog::level::warn);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (!g_logger) g_logger = CreateDefaultLogger();
    return g_logger;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    g_logger = std::move(logger);
}

}  // namespace vesta_device
