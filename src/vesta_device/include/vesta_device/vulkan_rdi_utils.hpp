/**
 * @file vulkan_rdi_utils.hpp
 * @brief RDI 类型到 Vulkan 的转换
 */

#pragma once

#include <vesta_device/error.hpp>
#include <vesta_device/rdi_types.hpp>
#include <vesta_device/vulkan_types.hpp>

#include <string>

#include <vulkan/vulkan.h>

namespace vesta_device {

// --- Format / Usage 转换（无对应时返回 VK_FORMAT_UNDEFINED / 0）---
VkFormat ToVkFormat(Format f);
VkBufferUsageFlags ToVkBufferUsage(BufferUsage u);
VkImageUsageFlags ToVkImageUsage(BindFlags u);
/** 1/2/4/.../64 之外返回 0 */
VkSampleCountFlagBits ToVkSampleCount(std::uint32_t samples);
VkImageAspectFlags ToVkImageAspect(SurfaceType surface);

// --- 管线状态 ---
VkShaderStageFlagBits ToVkShaderStage(ShaderStage s);
VkShaderStageFlags ToVkShaderStageMask(std::uint32_t stageMask);
VkPrimitiveTopology ToVkPrimitiveTopology(PrimitiveTopology t);
VkCompareOp ToVkCompareOp(CompareOp o);
VkStencilOp ToVkStencilOp(StencilOp o);
VkBlendFactor ToVkBlendFactor(BlendFactor f);
VkBlendOp ToVkBlendOp(BlendOp o);
VkDescriptorType ToVkDescriptorType(DescriptorType t);
VkCullModeFlags ToVkCullMode(CullMode m);
VkPolygonMode ToVkPolygonMode(FillMode m);
VkFilter ToVkFilter(FilterMode m);
VkSamplerMipmapMode ToVkMipmapMode(FilterMode m);
VkSamplerAddressMode ToVkAddressMode(AddressMode m);

// --- 错误 ---
/** OUT_OF_*_MEMORY 映射为 OutOfMemory，其余为 DriverFailure */
Error MakeVkError(const std::string& operation, VkResult vr, const std::string& message);
Error MakeError(ErrorCode code, const std::string& operation, const std::string& message);

}  // namespace vesta_device
