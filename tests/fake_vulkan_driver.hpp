/**
 * @file fake_vulkan_driver.hpp
 * @brief 填入 VulkanFunctions 的假驱动，测试共享
 *
 * 不依赖真实 GPU：内存以 std::vector 模拟，句柄为递增整数，
 * timeline semaphore 以计数值模拟。FakeState 记录存活对象数与调用次数。
 */

#pragma once

#include <vesta_device/vulkan_functions.hpp>
#include <vesta_device/vulkan_types.hpp>

#include <cstdint>
#include <cstring>
#include <map>
#include <vector>

#include <vulkan/vulkan.h>

namespace vesta_test {

struct FakeMemory {
    std::vector<std::uint8_t> bytes;
    std::uint32_t typeIndex = 0;
    bool mapped = false;
};

struct FakePipelineInfo {
    std::uint32_t stageCount = 0;
    std::uint32_t bindingCount = 0;
    std::uint32_t attributeCount = 0;
    std::vector<VkVertexInputRate> inputRates;
    std::uint32_t divisorCount = 0;
    std::uint32_t colorAttachmentCount = 0;
    VkFormat depthFormat = VK_FORMAT_UNDEFINED;
    VkPrimitiveTopology topology = VK_PRIMITIVE_TOPOLOGY_MAX_ENUM;
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_FLAG_BITS_MAX_ENUM;
    VkPipelineCreateFlags flags = 0;
};

struct FakeState {
    // --- 设备描述 ---
    std::vector<VkMemoryPropertyFlags> memoryTypes = {
        VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_CACHED_BIT,
    };
    VkDeviceSize bufferImageGranularity = 1;
    VkDeviceSize bufferAlignment = 256;
    VkDeviceSize imageAlignment = 4096;
    std::uint32_t bufferTypeBits = 0x7;
    std::uint32_t imageTypeBits = 0x1;
    bool hasDescriptorBuffer = true;
    bool hasInstanceRateDivisor = true;

    // --- 故障注入 ---
    bool failAllocate = false;
    bool failPipelines = false;
    VkResult waitResultOverride = VK_SUCCESS;  // 非 SUCCESS 时 vkWaitSemaphores 直接返回它

    // --- 存活对象 ---
    std::map<std::uint64_t, FakeMemory> memories;
    std::map<std::uint64_t, std::uint64_t> semaphores;  // 句柄 -> 计数
    std::map<std::uint64_t, VkDeviceSize> bufferSizes;
    int liveBuffers = 0;
    int liveImages = 0;
    int liveViews = 0;
    int liveSamplers = 0;
    int liveSetLayouts = 0;
    int livePipelineLayouts = 0;
    int liveShaderModules = 0;
    int livePipelines = 0;

    // --- 调用记录 ---
    int createBufferCalls = 0;
    int createImageCalls = 0;
    int bindBufferCalls = 0;
    int bindImageCalls = 0;
    int mapCalls = 0;
    int unmapCalls = 0;
    int flushCalls = 0;
    int getDescriptorCalls = 0;
    int waitCalls = 0;
    int signalCalls = 0;
    VkDescriptorType lastDescriptorType = VK_DESCRIPTOR_TYPE_MAX_ENUM;
    VkDeviceSize lastBindOffset = 0;
    VkMappedMemoryRange lastFlush{};
    VkImageViewCreateInfo lastViewInfo{};
    std::vector<std::uint32_t> lastSetLayoutBindings;
    VkDescriptorSetLayoutCreateFlags lastSetLayoutFlags = 0;
    std::uint32_t lastPipelineLayoutSetCount = 0;
    FakePipelineInfo lastPipeline;
    std::uint32_t lastWaitCount = 0;
    VkSemaphoreWaitFlags lastWaitFlags = 0;
    std::uint64_t lastWaitTimeout = 0;

    std::uint64_t nextHandle = 0x1000;
};

inline FakeState& State() {
    static FakeState state;
    return state;
}

inline void ResetFakeDriver() {
    State() = FakeState{};
}

template <typename H>
H MakeHandle(std::uint64_t value) {
    H h{};
    static_assert(sizeof(H) <= sizeof(value), "handle wider than 64 bits");
    std::memcpy(&h, &value, sizeof(H));
    return h;
}

template <typename H>
std::uint64_t HandleValue(H h) {
    std::uint64_t value = 0;
    std::memcpy(&value, &h, sizeof(H));
    return value;
}

template <typename H>
H NewHandle() {
    return MakeHandle<H>(State().nextHandle++);
}

namespace fake {

// --- 物理设备 ---

inline VKAPI_ATTR void VKAPI_CALL GetPhysicalDeviceMemoryProperties(VkPhysicalDevice,
                                                                    VkPhysicalDeviceMemoryProperties* out) {
    *out = {};
    out->memoryTypeCount = static_cast<std::uint32_t>(State().memoryTypes.size());
    for (std::uint32_t i = 0; i < out->memoryTypeCount; ++i) {
        out->memoryTypes[i].propertyFlags = State().memoryTypes[i];
        out->memoryTypes[i].heapIndex = 0;
    }
    out->memoryHeapCount = 1;
    out->memoryHeaps[0].size = 1ull << 30;
}

inline VKAPI_ATTR void VKAPI_CALL GetPhysicalDeviceProperties2(VkPhysicalDevice, VkPhysicalDeviceProperties2* out) {
    out->properties.limits.bufferImageGranularity = State().bufferImageGranularity;
    out->properties.limits.nonCoherentAtomSize = 64;
    out->properties.limits.maxImageDimension2D = 16384;
    for (auto* next = static_cast<VkBaseOutStructure*>(out->pNext); next; next = next->pNext) {
        if (next->sType == VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_DESCRIPTOR_BUFFER_PROPERTIES_EXT) {
            auto* db = reinterpret_cast<VkPhysicalDeviceDescriptorBufferPropertiesEXT*>(next);
            db->samplerDescriptorSize = 16;
            db->sampledImageDescriptorSize = 32;
            db->storageImageDescriptorSize = 32;
            db->uniformBufferDescriptorSize = 16;
            db->storageBufferDescriptorSize = 16;
        }
    }
}

inline VKAPI_ATTR void VKAPI_CALL GetPhysicalDeviceFeatures2(VkPhysicalDevice, VkPhysicalDeviceFeatures2* out) {
    out->features = {};
    out->features.geometryShader = VK_TRUE;
    out->features.tessellationShader = VK_TRUE;
    for (auto* next = static_cast<VkBaseOutStructure*>(out->pNext); next; next = next->pNext) {
        if (next->sType == VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VERTEX_ATTRIBUTE_DIVISOR_FEATURES_EXT) {
            auto* divisor = reinterpret_cast<VkPhysicalDeviceVertexAttributeDivisorFeaturesEXT*>(next);
            divisor->vertexAttributeInstanceRateDivisor = State().hasInstanceRateDivisor ? VK_TRUE : VK_FALSE;
        }
    }
}

// --- 内存 ---

inline VKAPI_ATTR VkResult VKAPI_CALL AllocateMemory(VkDevice, const VkMemoryAllocateInfo* info,
                                                     const VkAllocationCallbacks*, VkDeviceMemory* out) {
    if (State().failAllocate) return VK_ERROR_OUT_OF_DEVICE_MEMORY;
    const std::uint64_t id = State().nextHandle++;
    FakeMemory& m = State().memories[id];
    m.bytes.assign(static_cast<std::size_t>(info->allocationSize), 0);
    m.typeIndex = info->memoryTypeIndex;
    *out = MakeHandle<VkDeviceMemory>(id);
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL FreeMemory(VkDevice, VkDeviceMemory memory, const VkAllocationCallbacks*) {
    State().memories.erase(HandleValue(memory));
}

inline VKAPI_ATTR VkResult VKAPI_CALL MapMemory(VkDevice, VkDeviceMemory memory, VkDeviceSize offset,
                                                VkDeviceSize, VkMemoryMapFlags, void** out) {
    auto it = State().memories.find(HandleValue(memory));
    if (it == State().memories.end()) return VK_ERROR_MEMORY_MAP_FAILED;
    ++State().mapCalls;
    it->second.mapped = true;
    *out = it->second.bytes.data() + offset;
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL UnmapMemory(VkDevice, VkDeviceMemory memory) {
    ++State().unmapCalls;
    auto it = State().memories.find(HandleValue(memory));
    if (it != State().memories.end()) it->second.mapped = false;
}

inline VKAPI_ATTR VkResult VKAPI_CALL FlushMappedMemoryRanges(VkDevice, std::uint32_t count,
                                                              const VkMappedMemoryRange* ranges) {
    ++State().flushCalls;
    if (count > 0) State().lastFlush = ranges[0];
    return VK_SUCCESS;
}

// --- 缓冲 / 图像 ---

inline VkDeviceSize AlignUp(VkDeviceSize v, VkDeviceSize a) {
    return (v + a - 1) / a * a;
}

inline VKAPI_ATTR void VKAPI_CALL GetDeviceBufferMemoryRequirements(VkDevice,
                                                                    const VkDeviceBufferMemoryRequirements* info,
                                                                    VkMemoryRequirements2* out) {
    out->memoryRequirements.size = AlignUp(info->pCreateInfo->size, State().bufferAlignment);
    out->memoryRequirements.alignment = State().bufferAlignment;
    out->memoryRequirements.memoryTypeBits = State().bufferTypeBits;
}

inline VKAPI_ATTR void VKAPI_CALL GetDeviceImageMemoryRequirements(VkDevice,
                                                                   const VkDeviceImageMemoryRequirements* info,
                                                                   VkMemoryRequirements2* out) {
    const VkImageCreateInfo* ci = info->pCreateInfo;
    const VkDeviceSize texels = static_cast<VkDeviceSize>(ci->extent.width) * ci->extent.height *
                                ci->extent.depth * ci->arrayLayers * ci->samples;
    out->memoryRequirements.size = AlignUp(texels * 4 * 2, State().imageAlignment);
    out->memoryRequirements.alignment = State().imageAlignment;
    out->memoryRequirements.memoryTypeBits = State().imageTypeBits;
}

inline VKAPI_ATTR void VKAPI_CALL GetBufferMemoryRequirements(VkDevice, VkBuffer buffer, VkMemoryRequirements* out) {
    out->size = AlignUp(State().bufferSizes[HandleValue(buffer)], 64);
    out->alignment = 64;
    out->memoryTypeBits = 0x7;
}

inline VKAPI_ATTR VkResult VKAPI_CALL CreateBuffer(VkDevice, const VkBufferCreateInfo* info,
                                                   const VkAllocationCallbacks*, VkBuffer* out) {
    ++State().createBufferCalls;
    ++State().liveBuffers;
    *out = NewHandle<VkBuffer>();
    State().bufferSizes[HandleValue(*out)] = info->size;
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyBuffer(VkDevice, VkBuffer buffer, const VkAllocationCallbacks*) {
    if (buffer != VK_NULL_HANDLE) --State().liveBuffers;
}

inline VKAPI_ATTR VkResult VKAPI_CALL BindBufferMemory(VkDevice, VkBuffer, VkDeviceMemory, VkDeviceSize offset) {
    ++State().bindBufferCalls;
    State().lastBindOffset = offset;
    return VK_SUCCESS;
}

inline VKAPI_ATTR VkDeviceAddress VKAPI_CALL GetBufferDeviceAddress(VkDevice, const VkBufferDeviceAddressInfo* info) {
    return HandleValue(info->buffer) << 20;
}

inline VKAPI_ATTR VkResult VKAPI_CALL CreateImage(VkDevice, const VkImageCreateInfo*,
                                                  const VkAllocationCallbacks*, VkImage* out) {
    ++State().createImageCalls;
    ++State().liveImages;
    *out = NewHandle<VkImage>();
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyImage(VkDevice, VkImage image, const VkAllocationCallbacks*) {
    if (image != VK_NULL_HANDLE) --State().liveImages;
}

inline VKAPI_ATTR VkResult VKAPI_CALL BindImageMemory(VkDevice, VkImage, VkDeviceMemory, VkDeviceSize offset) {
    ++State().bindImageCalls;
    State().lastBindOffset = offset;
    return VK_SUCCESS;
}

// --- 视图 / 采样器 / 描述符 ---

inline VKAPI_ATTR VkResult VKAPI_CALL CreateImageView(VkDevice, const VkImageViewCreateInfo* info,
                                                      const VkAllocationCallbacks*, VkImageView* out) {
    ++State().liveViews;
    State().lastViewInfo = *info;
    *out = NewHandle<VkImageView>();
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyImageView(VkDevice, VkImageView view, const VkAllocationCallbacks*) {
    if (view != VK_NULL_HANDLE) --State().liveViews;
}

inline VKAPI_ATTR VkResult VKAPI_CALL CreateSampler(VkDevice, const VkSamplerCreateInfo*,
                                                    const VkAllocationCallbacks*, VkSampler* out) {
    ++State().liveSamplers;
    *out = NewHandle<VkSampler>();
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroySampler(VkDevice, VkSampler sampler, const VkAllocationCallbacks*) {
    if (sampler != VK_NULL_HANDLE) --State().liveSamplers;
}

/** 以 0xA0 + 描述符类型 填充目标，便于检查写入位置 */
inline VKAPI_ATTR void VKAPI_CALL GetDescriptorEXT(VkDevice, const VkDescriptorGetInfoEXT* info, std::size_t size,
                                                   void* out) {
    ++State().getDescriptorCalls;
    State().lastDescriptorType = info->type;
    std::memset(out, 0xA0 + static_cast<int>(info->type), size);
}

inline VKAPI_ATTR VkResult VKAPI_CALL CreateDescriptorSetLayout(VkDevice, const VkDescriptorSetLayoutCreateInfo* info,
                                                                const VkAllocationCallbacks*,
                                                                VkDescriptorSetLayout* out) {
    ++State().liveSetLayouts;
    State().lastSetLayoutFlags = info->flags;
    State().lastSetLayoutBindings.clear();
    for (std::uint32_t i = 0; i < info->bindingCount; ++i)
        State().lastSetLayoutBindings.push_back(info->pBindings[i].binding);
    *out = NewHandle<VkDescriptorSetLayout>();
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyDescriptorSetLayout(VkDevice, VkDescriptorSetLayout layout,
                                                             const VkAllocationCallbacks*) {
    if (layout != VK_NULL_HANDLE) --State().liveSetLayouts;
}

// --- 管线 ---

inline VKAPI_ATTR VkResult VKAPI_CALL CreatePipelineLayout(VkDevice, const VkPipelineLayoutCreateInfo* info,
                                                           const VkAllocationCallbacks*, VkPipelineLayout* out) {
    ++State().livePipelineLayouts;
    State().lastPipelineLayoutSetCount = info->setLayoutCount;
    *out = NewHandle<VkPipelineLayout>();
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyPipelineLayout(VkDevice, VkPipelineLayout layout,
                                                        const VkAllocationCallbacks*) {
    if (layout != VK_NULL_HANDLE) --State().livePipelineLayouts;
}

inline VKAPI_ATTR VkResult VKAPI_CALL CreateShaderModule(VkDevice, const VkShaderModuleCreateInfo*,
                                                         const VkAllocationCallbacks*, VkShaderModule* out) {
    ++State().liveShaderModules;
    *out = NewHandle<VkShaderModule>();
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyShaderModule(VkDevice, VkShaderModule module, const VkAllocationCallbacks*) {
    if (module != VK_NULL_HANDLE) --State().liveShaderModules;
}

inline VKAPI_ATTR VkResult VKAPI_CALL CreateGraphicsPipelines(VkDevice, VkPipelineCache, std::uint32_t count,
                                                              const VkGraphicsPipelineCreateInfo* infos,
                                                              const VkAllocationCallbacks*, VkPipeline* out) {
    if (State().failPipelines) return VK_ERROR_UNKNOWN;
    for (std::uint32_t i = 0; i < count; ++i) {
        const VkGraphicsPipelineCreateInfo& ci = infos[i];
        FakePipelineInfo rec;
        rec.stageCount = ci.stageCount;
        rec.flags = ci.flags;
        rec.bindingCount = ci.pVertexInputState->vertexBindingDescriptionCount;
        rec.attributeCount = ci.pVertexInputState->vertexAttributeDescriptionCount;
        for (std::uint32_t b = 0; b < rec.bindingCount; ++b)
            rec.inputRates.push_back(ci.pVertexInputState->pVertexBindingDescriptions[b].inputRate);
        for (auto* next = static_cast<const VkBaseInStructure*>(ci.pVertexInputState->pNext); next;
             next = next->pNext) {
            if (next->sType == VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_DIVISOR_STATE_CREATE_INFO_EXT)
                rec.divisorCount =
                    reinterpret_cast<const VkPipelineVertexInputDivisorStateCreateInfoEXT*>(next)
                        ->vertexBindingDivisorCount;
        }
        for (auto* next = static_cast<const VkBaseInStructure*>(ci.pNext); next; next = next->pNext) {
            if (next->sType == VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO) {
                const auto* r = reinterpret_cast<const VkPipelineRenderingCreateInfo*>(next);
                rec.colorAttachmentCount = r->colorAttachmentCount;
                rec.depthFormat = r->depthAttachmentFormat;
            }
        }
        rec.topology = ci.pInputAssemblyState->topology;
        rec.samples = ci.pMultisampleState->rasterizationSamples;
        State().lastPipeline = rec;
        ++State().livePipelines;
        out[i] = NewHandle<VkPipeline>();
    }
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroyPipeline(VkDevice, VkPipeline pipeline, const VkAllocationCallbacks*) {
    if (pipeline != VK_NULL_HANDLE) --State().livePipelines;
}

// --- 同步 ---

inline VKAPI_ATTR VkResult VKAPI_CALL CreateSemaphore(VkDevice, const VkSemaphoreCreateInfo* info,
                                                      const VkAllocationCallbacks*, VkSemaphore* out) {
    std::uint64_t initial = 0;
    for (auto* next = static_cast<const VkBaseInStructure*>(info->pNext); next; next = next->pNext) {
        if (next->sType == VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO)
            initial = reinterpret_cast<const VkSemaphoreTypeCreateInfo*>(next)->initialValue;
    }
    const std::uint64_t id = State().nextHandle++;
    State().semaphores[id] = initial;
    *out = MakeHandle<VkSemaphore>(id);
    return VK_SUCCESS;
}

inline VKAPI_ATTR void VKAPI_CALL DestroySemaphore(VkDevice, VkSemaphore semaphore, const VkAllocationCallbacks*) {
    State().semaphores.erase(HandleValue(semaphore));
}

inline VKAPI_ATTR VkResult VKAPI_CALL GetSemaphoreCounterValue(VkDevice, VkSemaphore semaphore, std::uint64_t* out) {
    auto it = State().semaphores.find(HandleValue(semaphore));
    if (it == State().semaphores.end()) return VK_ERROR_DEVICE_LOST;
    *out = it->second;
    return VK_SUCCESS;
}

/** 不阻塞：条件已满足返回 SUCCESS，否则视为超时 */
inline VKAPI_ATTR VkResult VKAPI_CALL WaitSemaphores(VkDevice, const VkSemaphoreWaitInfo* info, std::uint64_t timeout) {
    ++State().waitCalls;
    State().lastWaitCount = info->semaphoreCount;
    State().lastWaitFlags = info->flags;
    State().lastWaitTimeout = timeout;
    if (State().waitResultOverride != VK_SUCCESS) return State().waitResultOverride;
    const bool any = (info->flags & VK_SEMAPHORE_WAIT_ANY_BIT) != 0;
    std::uint32_t reached = 0;
    for (std::uint32_t i = 0; i < info->semaphoreCount; ++i) {
        if (State().semaphores[HandleValue(info->pSemaphores[i])] >= info->pValues[i]) ++reached;
    }
    const bool done = any ? reached > 0 : reached == info->semaphoreCount;
    return done ? VK_SUCCESS : VK_TIMEOUT;
}

inline VKAPI_ATTR VkResult VKAPI_CALL SignalSemaphore(VkDevice, const VkSemaphoreSignalInfo* info) {
    ++State().signalCalls;
    State().semaphores[HandleValue(info->semaphore)] = info->value;
    return VK_SUCCESS;
}

}  // namespace fake

/** 模拟 GPU 端推进 timeline semaphore */
inline void GpuSignal(VkSemaphore semaphore, std::uint64_t value) {
    State().semaphores[HandleValue(semaphore)] = value;
}

inline vesta_device::VulkanFunctions MakeFakeFunctions() {
    vesta_device::VulkanFunctions fn;
    fn.vkGetPhysicalDeviceMemoryProperties = fake::GetPhysicalDeviceMemoryProperties;
    fn.vkGetPhysicalDeviceProperties2 = fake::GetPhysicalDeviceProperties2;
    fn.vkGetPhysicalDeviceFeatures2 = fake::GetPhysicalDeviceFeatures2;
    fn.vkAllocateMemory = fake::AllocateMemory;
    fn.vkFreeMemory = fake::FreeMemory;
    fn.vkMapMemory = fake::MapMemory;
    fn.vkUnmapMemory = fake::UnmapMemory;
    fn.vkFlushMappedMemoryRanges = fake::FlushMappedMemoryRanges;
    fn.vkGetDeviceBufferMemoryRequirements = fake::GetDeviceBufferMemoryRequirements;
    fn.vkGetDeviceImageMemoryRequirements = fake::GetDeviceImageMemoryRequirements;
    fn.vkGetBufferMemoryRequirements = fake::GetBufferMemoryRequirements;
    fn.vkCreateBuffer = fake::CreateBuffer;
    fn.vkDestroyBuffer = fake::DestroyBuffer;
    fn.vkBindBufferMemory = fake::BindBufferMemory;
    fn.vkGetBufferDeviceAddress = fake::GetBufferDeviceAddress;
    fn.vkCreateImage = fake::CreateImage;
    fn.vkDestroyImage = fake::DestroyImage;
    fn.vkBindImageMemory = fake::BindImageMemory;
    fn.vkCreateImageView = fake::CreateImageView;
    fn.vkDestroyImageView = fake::DestroyImageView;
    fn.vkCreateSampler = fake::CreateSampler;
    fn.vkDestroySampler = fake::DestroySampler;
    fn.vkGetDescriptorEXT = State().hasDescriptorBuffer ? fake::GetDescriptorEXT : nullptr;
    fn.vkCreateDescriptorSetLayout = fake::CreateDescriptorSetLayout;
    fn.vkDestroyDescriptorSetLayout = fake::DestroyDescriptorSetLayout;
    fn.vkCreatePipelineLayout = fake::CreatePipelineLayout;
    fn.vkDestroyPipelineLayout = fake::DestroyPipelineLayout;
    fn.vkCreateShaderModule = fake::CreateShaderModule;
    fn.vkDestroyShaderModule = fake::DestroyShaderModule;
    fn.vkCreateGraphicsPipelines = fake::CreateGraphicsPipelines;
    fn.vkDestroyPipeline = fake::DestroyPipeline;
    fn.vkCreateSemaphore = fake::CreateSemaphore;
    fn.vkDestroySemaphore = fake::DestroySemaphore;
    fn.vkGetSemaphoreCounterValue = fake::GetSemaphoreCounterValue;
    fn.vkWaitSemaphores = fake::WaitSemaphores;
    fn.vkSignalSemaphore = fake::SignalSemaphore;
    return fn;
}

/** functions 须比返回的配置存活更久 */
inline vesta_device::VulkanDeviceConfig MakeFakeConfig(const vesta_device::VulkanFunctions& functions) {
    vesta_device::VulkanDeviceConfig config;
    config.instance = VK_NULL_HANDLE;
    config.physicalDevice = MakeHandle<VkPhysicalDevice>(0x10);
    config.device = MakeHandle<VkDevice>(0x20);
    config.functions = &functions;
    return config;
}

}  // namespace vesta_test
