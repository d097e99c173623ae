/**
 * @file vulkan_functions.cpp
 * @brief Vulkan 函数分发表加载
 */

#include <vesta_device/vulkan_functions.hpp>

namespace vesta_device {

bool LoadVulkanFunctions(VkInstance instance, VkDevice device, VulkanFunctions& out) {
    out = VulkanFunctions{};
    if (instance == VK_NULL_HANDLE || device == VK_NULL_HANDLE) return false;

#define LOAD_INSTANCE(name) out.name = reinterpret_cast<PFN_##name>(vkGetInstanceProcAddr(instance, #name))
    LOAD_INSTANCE(vkGetPhysicalDeviceMemoryProperties);
    LOAD_INSTANCE(vkGetPhysicalDeviceProperties2);
    LOAD_INSTANCE(vkGetPhysicalDeviceFeatures2);

    auto getDeviceProcAddr =
        reinterpret_cast<PFN_vkGetDeviceProcAddr>(vkGetInstanceProcAddr(instance, "vkGetDeviceProcAddr"));
    if (!getDeviceProcAddr) return false;
#define LOAD_DEVICE(name) out.name = reinterpret_cast<PFN_##name>(getDeviceProcAddr(device, #name))

    LOAD_DEVICE(vkAllocateMemory);
    LOAD_DEVICE(vkFreeMemory);
    LOAD_DEVICE(vkMapMemory);
    LOAD_DEVICE(vkUnmapMemory);
    LOAD_DEVICE(vkFlushMappedMemoryRanges);
    LOAD_DEVICE(vkGetDeviceBufferMemoryRequirements);
    LOAD_DEVICE(vkGetDeviceImageMemoryRequirements);
    LOAD_DEVICE(vkGetBufferMemoryRequirements);
    LOAD_DEVICE(vkCreateBuffer);
    LOAD_DEVICE(vkDestroyBuffer);
    LOAD_DEVICE(vkBindBufferMemory);
    LOAD_DEVICE(vkGetBufferDeviceAddress);
    LOAD_DEVICE(vkCreateImage);
    LOAD_DEVICE(vkDestroyImage);
    LOAD_DEVICE(vkBindImageMemory);
    LOAD_DEVICE(vkCreateImageView);
    LOAD_DEVICE(vkDestroyImageView);
    LOAD_DEVICE(vkCreateSampler);
    LOAD_DEVICE(vkDestroySampler);
    LOAD_DEVICE(vkGetDescriptorEXT);
    LOAD_DEVICE(vkCreateDescriptorSetLayout);
    LOAD_DEVICE(vkDestroyDescriptorSetLayout);
    LOAD_DEVICE(vkCreatePipelineLayout);
    LOAD_DEVICE(vkDestroyPipelineLayout);
    LOAD_DEVICE(vkCreateShaderModule);
    LOAD_DEVICE(vkDestroyShaderModule);
    LOAD_DEVICE(vkCreateGraphicsPipelines);
    LOAD_DEVICE(vkDestroyPipeline);
    LOAD_DEVICE(vkCreateSemaphore);
    LOAD_DEVICE(vkDestroySemaphore);
    LOAD_DEVICE(vkGetSemaphoreCounterValue);
    LOAD_DEVICE(vkWaitSemaphores);
    LOAD_DEVICE(vkSignalSemaphore);
#undef LOAD_INSTANCE
#undef LOAD_DEVICE

    // vkGetDescriptorEXT 属于扩展，由 VulkanDevice::Initialize 单独检查
    return out.vkGetPhysicalDeviceMemoryProperties && out.vkGetPhysicalDeviceProperties2 &&
           out.vkGetPhysicalDeviceFeatures2 && out.vkAllocateMemory && out.vkFreeMemory &&
           out.vkMapMemory && out.vkUnmapMemory && out.vkFlushMappedMemoryRanges &&
           out.vkGetDeviceBufferMemoryRequirements && out.vkGetDeviceImageMemoryRequirements &&
           out.vkGetBufferMemoryRequirements && out.vkCreateBuffer && out.vkDestroyBuffer &&
           out.vkBindBufferMemory && out.vkGetBufferDeviceAddress && out.vkCreateImage &&
           out.vkDestroyImage && out.vkBindImageMemory && out.vkCreateImageView &&
           out.vkDestroyImageView && out.vkCreateSampler && out.vkDestroySampler &&
           out.vkCreateDescriptorSetLayout && out.vkDestroyDescriptorSetLayout &&
           out.vkCreatePipelineLayout && out.vkDestroyPipelineLayout && out.vkCreateShaderModule &&
           out.vkDestroyShaderModule && out.vkCreateGraphicsPipelines && out.vkDestroyPipeline &&
           out.vkCreateSemaphore && out.vkDestroySemaphore && out.vkGetSemaphoreCounterValue &&
           out.vkWaitSemaphores && out.vkSignalSemaphore;
}

}  // namespace vesta_device
