/**
 * @file shader_reflect.hpp
 * @brief 基于 SPIRV-Reflect 的顶点输入反射
 */

#pragma once

#include <vesta_device/result.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

namespace vesta_device {

/** 顶点阶段的一个用户输入变量（内建变量已排除） */
struct ReflectedInput {
    std::uint32_t location = 0;
    std::string name;
    VkFormat format = VK_FORMAT_UNDEFINED;
};

/**
 * 反射指定入口点的输入变量，按 location 升序。
 * 模块无法解析返回 DriverFailure；入口点不存在返回 MissingEntryPoint。
 */
Result<std::vector<ReflectedInput>> ReflectVertexInputs(const std::vector<std::uint32_t>& spirv,
                                                        const std::string& entryPoint);

}  // namespace vesta_device
