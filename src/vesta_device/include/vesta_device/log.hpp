/**
 * @file log.hpp
 * @brief 设备层诊断事件日志（spdlog）
 *
 * 核心只发出 error/warn 级事件；sink 由宿主通过 SetLogger 安装。
 */

#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace vesta_device {

/** 名为 "vesta" 的共享 logger；未安装时惰性创建（stderr 彩色 sink） */
std::shared_ptr<spdlog::logger> GetLogger();

/** 替换共享 logger；传 nullptr 恢复默认 */
void SetLogger(std::shared_ptr<spdlog::logger> logger);

}  // namespace vesta_device
