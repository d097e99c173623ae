/**
 * @file device_settings.hpp
 * @brief 设备层 JSON 配置：日志级别、描述符堆容量、GL 调试输出
 *
 * 文件示例：
 * {
 *   "log_level": "warn",
 *   "descriptor_heaps": { "rtv": 256, "dsv": 64, "cbv_srv_uav": 4096, "sampler": 256 },
 *   "opengl": { "debug_output": false }
 * }
 * 缺省键使用默认值。
 */

#pragma once

#include <cstdint>
#include <string>

#include <spdlog/common.h>

namespace vesta_device {

struct DescriptorHeapCapacities {
    std::uint32_t renderTargets = 256;
    std::uint32_t depthStencils = 64;
    std::uint32_t shaderResources = 4096;  // CBV/SRV/UAV
    std::uint32_t samplers = 256;
};

struct DeviceSettings {
    spdlog::level::level_enum logLevel = spdlog::level::warn;
    DescriptorHeapCapacities descriptorHeaps;
    bool glDebugOutput = false;
};

/**
 * 从 JSON 文件加载设置。
 * @return 成功返回 true；文件不可读、JSON 语法错误或字段类型错误返回 false 并写入 error
 */
bool LoadDeviceSettings(const std::string& path, DeviceSettings& out, std::string* error = nullptr);

/** 从 JSON 文本解析（LoadDeviceSettings 内部使用，便于测试） */
bool ParseDeviceSettings(const std::string& json, DeviceSettings& out, std::string* error = nullptr);

/** 将日志级别应用到共享 logger */
void ApplyLogSettings(const DeviceSettings& settings);

}  // namespace vesta_device
