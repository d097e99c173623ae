/**
 * @file vulkan_device.cpp
 * @brief VulkanDevice：生命周期、堆、两阶段资源、视图、映射与销毁
 *
 * 管线相关见 vulkan_pipeline.cpp，同步见 vulkan_sync.cpp。
 */

#include <vesta_device/vulkan_device.hpp>
#include <vesta_device/error.hpp>
#include <vesta_device/log.hpp>
#include <vesta_device/vulkan_rdi_utils.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace vesta_device {

namespace {

bool IsTargetImage(BindFlags usage) {
    return HasBindFlag(usage, BindFlags::RenderTarget) || HasBindFlag(usage, BindFlags::DepthStencil);
}

ResourceState DefaultStateFor(HeapProperty props) {
    if (!HasHeapProperty(props, HeapProperty::CpuVisible)) return ResourceState::Common;
    if (HasHeapProperty(props, HeapProperty::Coherent)) return ResourceState::GenericRead;
    return ResourceState::CopyDest;
}

VkBufferCreateInfo MakeBufferCreateInfo(std::uint64_t size, BufferUsage usage) {
    VkBufferCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    ci.size = size;
    ci.usage = ToVkBufferUsage(usage);
    ci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    return ci;
}

VkImageCreateInfo MakeImageCreateInfo(const ImageKind& kind, std::uint32_t mipLevels, VkFormat format,
                                      BindFlags usage) {
    VkImageCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    switch (kind.dimension) {
        case ImageDimension::D1: ci.imageType = VK_IMAGE_TYPE_1D; break;
        case ImageDimension::D2: ci.imageType = VK_IMAGE_TYPE_2D; break;
        case ImageDimension::D3: ci.imageType = VK_IMAGE_TYPE_3D; break;
        case ImageDimension::Cube:
            ci.imageType = VK_IMAGE_TYPE_2D;
            ci.flags |= VK_IMAGE_CREATE_CUBE_COMPATIBLE_BIT;
            break;
    }
    ci.format = format;
    ci.extent = {kind.width, kind.height, kind.depth};
    ci.mipLevels = mipLevels;
    ci.arrayLayers = kind.layers;
    ci.samples = ToVkSampleCount(kind.samples);
    ci.tiling = VK_IMAGE_TILING_OPTIMAL;
    ci.usage = ToVkImageUsage(usage);
    ci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    return ci;
}

HeapProperty ToHeapProperties(VkMemoryPropertyFlags flags) {
    HeapProperty p = HeapProperty::None;
    if (flags & VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT) p = p | HeapProperty::DeviceLocal;
    if (flags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) p = p | HeapProperty::CpuVisible;
    if (flags & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) p = p | HeapProperty::Coherent;
    if (flags & VK_MEMORY_PROPERTY_HOST_CACHED_BIT) p = p | HeapProperty::Cached;
    return p;
}

Error FormatError(ErrorCode code, const std::string& operation, Format format) {
    Error e = MakeError(code, operation, "format has no native equivalent");
    e.format = format;
    return e;
}

}  // namespace

const char* ToString(ResourceState state) {
    switch (state) {
        case ResourceState::Common: return "Common";
        case ResourceState::GenericRead: return "GenericRead";
        case ResourceState::CopyDest: return "CopyDest";
    }
    return "Unknown";
}

// =============================================================================
// 生命周期
// =============================================================================

VulkanDevice::~VulkanDevice() {
    Shutdown();
}

bool VulkanDevice::Initialize(const VulkanDeviceConfig& config) {
    if (initialized_) Shutdown();
    lastError_.clear();

    if (config.physicalDevice == VK_NULL_HANDLE || config.device == VK_NULL_HANDLE) {
        lastError_ = "VulkanDevice: physical device and device handles are required";
        return false;
    }
    if (config.functions) {
        fn_ = *config.functions;
    } else if (!LoadVulkanFunctions(config.instance, config.device, fn_)) {
        lastError_ = "VulkanDevice: failed to load Vulkan 1.3 device functions";
        return false;
    }
    if (!fn_.vkGetDescriptorEXT) {
        lastError_ = "VulkanDevice: VK_EXT_descriptor_buffer is not enabled";
        return false;
    }
    instance_ = config.instance;
    physicalDevice_ = config.physicalDevice;
    device_ = config.device;

    fn_.vkGetPhysicalDeviceMemoryProperties(physicalDevice_, &memoryProperties_);
    descriptorBufferProps_ = {};
    descriptorBufferProps_.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_DESCRIPTOR_BUFFER_PROPERTIES_EXT;
    VkPhysicalDeviceProperties2 props2{};
    props2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2;
    props2.pNext = &descriptorBufferProps_;
    fn_.vkGetPhysicalDeviceProperties2(physicalDevice_, &props2);
    limits_ = props2.properties.limits;
    VkPhysicalDeviceVertexAttributeDivisorFeaturesEXT divisorFeatures{};
    divisorFeatures.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VERTEX_ATTRIBUTE_DIVISOR_FEATURES_EXT;
    VkPhysicalDeviceFeatures2 features2{};
    features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features2.pNext = &divisorFeatures;
    fn_.vkGetPhysicalDeviceFeatures2(physicalDevice_, &features2);
    const VkPhysicalDeviceFeatures& features = features2.features;

    heapTypes_.clear();
    for (std::uint32_t i = 0; i < memoryProperties_.memoryTypeCount; ++i)
        heapTypes_.push_back(HeapType{i, ToHeapProperties(memoryProperties_.memoryTypes[i].propertyFlags)});

    capabilities_ = BackendCapabilities{};
    capabilities_.immediateContext = false;
    capabilities_.explicitHeaps = true;
    capabilities_.heterogeneousHeaps = limits_.bufferImageGranularity <= 1;
    capabilities_.supportsGeometryShader = features.geometryShader == VK_TRUE;
    capabilities_.supportsTessellation = features.tessellationShader == VK_TRUE;
    capabilities_.supportsInstanceRateDivisor = divisorFeatures.vertexAttributeInstanceRateDivisor == VK_TRUE;
    capabilities_.maxTextureSize = limits_.maxImageDimension2D;

    // --- 描述符堆 ---
    const DescriptorHeapCapacities& cap = config.descriptorHeaps;
    rtvSlots_.assign(cap.renderTargets, VK_NULL_HANDLE);
    dsvSlots_.assign(cap.depthStencils, VK_NULL_HANDLE);
    rtvHeap_ = DescriptorHeap(rtvSlots_.data(), 0, sizeof(VkImageView), cap.renderTargets);
    dsvHeap_ = DescriptorHeap(dsvSlots_.data(), 0, sizeof(VkImageView), cap.depthStencils);

    const std::uint32_t srvSize = static_cast<std::uint32_t>(std::max(
        {descriptorBufferProps_.sampledImageDescriptorSize, descriptorBufferProps_.storageImageDescriptorSize,
         descriptorBufferProps_.uniformBufferDescriptorSize, descriptorBufferProps_.storageBufferDescriptorSize}));
    const std::uint32_t samplerSize = static_cast<std::uint32_t>(descriptorBufferProps_.samplerDescriptorSize);
    if (srvSize == 0 || samplerSize == 0 || cap.shaderResources == 0 || cap.samplers == 0) {
        lastError_ = "VulkanDevice: descriptor buffer sizes or heap capacities are zero";
        return false;
    }

    void* srvMapped = nullptr;
    VkDeviceAddress srvAddress = 0;
    if (!CreateDescriptorBuffer(VK_BUFFER_USAGE_RESOURCE_DESCRIPTOR_BUFFER_BIT_EXT,
                                static_cast<std::uint64_t>(srvSize) * cap.shaderResources, srvBuffer_,
                                srvMemory_, srvMapped, srvAddress)) {
        DestroyDescriptorHeaps();
        return false;
    }
    void* samplerMapped = nullptr;
    VkDeviceAddress samplerAddress = 0;
    if (!CreateDescriptorBuffer(VK_BUFFER_USAGE_SAMPLER_DESCRIPTOR_BUFFER_BIT_EXT,
                                static_cast<std::uint64_t>(samplerSize) * cap.samplers, samplerBuffer_,
                                samplerMemory_, samplerMapped, samplerAddress)) {
        DestroyDescriptorHeaps();
        return false;
    }
    srvHeap_ = DescriptorHeap(srvMapped, srvAddress, srvSize, cap.shaderResources);
    samplerHeap_ = DescriptorHeap(samplerMapped, samplerAddress, samplerSize, cap.samplers);

    initialized_ = true;
    return true;
}

bool VulkanDevice::FindMemoryType(std::uint32_t typeBits, VkMemoryPropertyFlags required,
                                  std::uint32_t& out) const {
    for (std::uint32_t i = 0; i < memoryProperties_.memoryTypeCount; ++i) {
        if ((typeBits & (1u << i)) && (memoryProperties_.memoryTypes[i].propertyFlags & required) == required) {
            out = i;
            return true;
        }
    }
    return false;
}

bool VulkanDevice::CreateDescriptorBuffer(VkBufferUsageFlags usage, std::uint64_t size, VkBuffer& buffer,
                                          VkDeviceMemory& memory, void*& mapped, VkDeviceAddress& address) {
    VkBufferCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    ci.size = size;
    ci.usage = usage | VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT;
    ci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    VkResult vr = fn_.vkCreateBuffer(device_, &ci, nullptr, &buffer);
    if (vr != VK_SUCCESS) {
        lastError_ = "VulkanDevice: vkCreateBuffer failed for descriptor buffer (" + std::to_string(vr) + ")";
        return false;
    }

    VkMemoryRequirements req{};
    fn_.vkGetBufferMemoryRequirements(device_, buffer, &req);
    std::uint32_t typeIndex = 0;
    if (!FindMemoryType(req.memoryTypeBits,
                        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, typeIndex)) {
        lastError_ = "VulkanDevice: no host-visible coherent memory type for descriptor buffer";
        return false;
    }

    VkMemoryAllocateFlagsInfo flagsInfo{};
    flagsInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_FLAGS_INFO;
    flagsInfo.flags = VK_MEMORY_ALLOCATE_DEVICE_ADDRESS_BIT;
    VkMemoryAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    ai.pNext = &flagsInfo;
    ai.allocationSize = req.size;
    ai.memoryTypeIndex = typeIndex;
    vr = fn_.vkAllocateMemory(device_, &ai, nullptr, &memory);
    if (vr != VK_SUCCESS) {
        lastError_ = "VulkanDevice: vkAllocateMemory failed for descriptor buffer (" + std::to_string(vr) + ")";
        return false;
    }
    vr = fn_.vkBindBufferMemory(device_, buffer, memory, 0);
    if (vr != VK_SUCCESS) {
        lastError_ = "VulkanDevice: vkBindBufferMemory failed for descriptor buffer (" + std::to_string(vr) + ")";
        return false;
    }
    vr = fn_.vkMapMemory(device_, memory, 0, VK_WHOLE_SIZE, 0, &mapped);
    if (vr != VK_SUCCESS) {
        lastError_ = "VulkanDevice: vkMapMemory failed for descriptor buffer (" + std::to_string(vr) + ")";
        return false;
    }
    VkBufferDeviceAddressInfo addrInfo{};
    addrInfo.sType = VK_STRUCTURE_TYPE_BUFFER_DEVICE_ADDRESS_INFO;
    addrInfo.buffer = buffer;
    address = fn_.vkGetBufferDeviceAddress(device_, &addrInfo);
    return true;
}

void VulkanDevice::DestroyDescriptorHeaps() {
    if (srvBuffer_ != VK_NULL_HANDLE) fn_.vkDestroyBuffer(device_, srvBuffer_, nullptr);
    if (srvMemory_ != VK_NULL_HANDLE) fn_.vkFreeMemory(device_, srvMemory_, nullptr);
    if (samplerBuffer_ != VK_NULL_HANDLE) fn_.vkDestroyBuffer(device_, samplerBuffer_, nullptr);
    if (samplerMemory_ != VK_NULL_HANDLE) fn_.vkFreeMemory(device_, samplerMemory_, nullptr);
    srvBuffer_ = samplerBuffer_ = VK_NULL_HANDLE;
    srvMemory_ = samplerMemory_ = VK_NULL_HANDLE;
    rtvHeap_ = dsvHeap_ = srvHeap_ = samplerHeap_ = DescriptorHeap{};
    rtvSlots_.clear();
    dsvSlots_.clear();
}

void VulkanDevice::Shutdown() {
    if (!initialized_) return;

    for (auto& p : pipelines_) fn_.vkDestroyPipeline(device_, p.second.pipeline, nullptr);
    for (auto& p : pipelineLayouts_) fn_.vkDestroyPipelineLayout(device_, p.second, nullptr);
    for (auto& p : renderTargetViews_) fn_.vkDestroyImageView(device_, p.second.view, nullptr);
    for (auto& p : depthStencilViews_) fn_.vkDestroyImageView(device_, p.second.view, nullptr);
    for (auto& p : shaderResourceViews_) fn_.vkDestroyImageView(device_, p.second.view, nullptr);
    for (auto& p : samplers_) fn_.vkDestroySampler(device_, p.second.sampler, nullptr);
    for (auto& p : buffers_) fn_.vkDestroyBuffer(device_, p.second.buffer, nullptr);
    for (auto& p : images_) fn_.vkDestroyImage(device_, p.second.image, nullptr);
    for (auto& p : fences_) fn_.vkDestroySemaphore(device_, p.second.semaphore, nullptr);
    for (auto& p : semaphores_) fn_.vkDestroySemaphore(device_, p.second.semaphore, nullptr);
    for (auto& p : heaps_) {
        if (p.second.mapped) fn_.vkUnmapMemory(device_, p.second.memory);
        fn_.vkFreeMemory(device_, p.second.memory, nullptr);
    }
    pipelines_.clear();
    pipelineLayouts_.clear();
    renderTargetViews_.clear();
    depthStencilViews_.clear();
    shaderResourceViews_.clear();
    samplers_.clear();
    buffers_.clear();
    images_.clear();
    fences_.clear();
    semaphores_.clear();
    heaps_.clear();
    mappings_.clear();

    DestroyDescriptorHeaps();
    waitSemaphores_.clear();
    waitValues_.clear();
    initialized_ = false;
}

// =============================================================================
// 堆
// =============================================================================

Result<HeapHandle> VulkanDevice::CreateHeap(const HeapType& type, ResourceHeapType resources,
                                            std::uint64_t size) {
    if (resources == ResourceHeapType::Any && !capabilities_.heterogeneousHeaps)
        return MakeError(ErrorCode::UnsupportedType, "create heap",
                         "device does not support mixing buffers and images in one heap");
    if (type.id >= memoryProperties_.memoryTypeCount || size == 0)
        return MakeError(ErrorCode::InvalidArgument, "create heap",
                         "memory type " + std::to_string(type.id) + " / size " + std::to_string(size));

    VkMemoryAllocateFlagsInfo flagsInfo{};
    flagsInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_FLAGS_INFO;
    flagsInfo.flags = VK_MEMORY_ALLOCATE_DEVICE_ADDRESS_BIT;
    VkMemoryAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    // 缓冲统一带 SHADER_DEVICE_ADDRESS，其所在内存需要 DEVICE_ADDRESS 分配标志
    if (resources == ResourceHeapType::Buffers || resources == ResourceHeapType::Any) ai.pNext = &flagsInfo;
    ai.allocationSize = size;
    ai.memoryTypeIndex = type.id;

    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkResult vr = fn_.vkAllocateMemory(device_, &ai, nullptr, &memory);
    if (vr != VK_SUCCESS) return MakeVkError("create heap", vr, "vkAllocateMemory failed");

    HeapRes res;
    res.memory = memory;
    res.size = size;
    res.memoryTypeIndex = type.id;
    res.properties = ToHeapProperties(memoryProperties_.memoryTypes[type.id].propertyFlags);
    res.resources = resources;
    res.defaultState = DefaultStateFor(res.properties);

    const std::uint64_t id = NextId();
    heaps_[id] = res;
    HeapHandle h;
    h.id = id;
    return h;
}

// =============================================================================
// 两阶段资源：需求查询
// =============================================================================

Result<UnboundBuffer> VulkanDevice::CreateBuffer(std::uint64_t size, std::uint32_t stride, BufferUsage usage) {
    if (size == 0) return MakeError(ErrorCode::InvalidArgument, "create buffer", "size must be > 0");

    VkBufferCreateInfo ci = MakeBufferCreateInfo(size, usage);
    VkDeviceBufferMemoryRequirements query{};
    query.sType = VK_STRUCTURE_TYPE_DEVICE_BUFFER_MEMORY_REQUIREMENTS;
    query.pCreateInfo = &ci;
    VkMemoryRequirements2 out{};
    out.sType = VK_STRUCTURE_TYPE_MEMORY_REQUIREMENTS_2;
    fn_.vkGetDeviceBufferMemoryRequirements(device_, &query, &out);

    MemoryRequirements req;
    req.size = out.memoryRequirements.size;
    req.alignment = std::max<std::uint64_t>(out.memoryRequirements.alignment, 1);
    req.memoryTypeBits = out.memoryRequirements.memoryTypeBits;
    return UnboundBuffer(size, stride, usage, req);
}

Result<UnboundImage> VulkanDevice::CreateImage(const ImageKind& kind, std::uint32_t mipLevels, Format format,
                                               BindFlags usage) {
    if (kind.width == 0 || kind.height == 0 || kind.depth == 0 || kind.layers == 0 || mipLevels == 0)
        return MakeError(ErrorCode::InvalidArgument, "create image", "zero extent, layer or mip count");
    if (ToVkSampleCount(kind.samples) == 0)
        return MakeError(ErrorCode::InvalidArgument, "create image",
                         "sample count " + std::to_string(kind.samples) + " is not a power of two <= 64");
    const VkFormat vkFormat = ToVkFormat(format);
    if (vkFormat == VK_FORMAT_UNDEFINED) return FormatError(ErrorCode::UnsupportedFormat, "create image", format);

    VkImageCreateInfo ci = MakeImageCreateInfo(kind, mipLevels, vkFormat, usage);
    VkDeviceImageMemoryRequirements query{};
    query.sType = VK_STRUCTURE_TYPE_DEVICE_IMAGE_MEMORY_REQUIREMENTS;
    query.pCreateInfo = &ci;
    VkMemoryRequirements2 out{};
    out.sType = VK_STRUCTURE_TYPE_MEMORY_REQUIREMENTS_2;
    fn_.vkGetDeviceImageMemoryRequirements(device_, &query, &out);

    MemoryRequirements req;
    req.size = out.memoryRequirements.size;
    req.alignment = std::max<std::uint64_t>(out.memoryRequirements.alignment, 1);
    req.memoryTypeBits = out.memoryRequirements.memoryTypeBits;
    return UnboundImage(kind, mipLevels, format, usage, req);
}

// =============================================================================
// 两阶段资源：绑定
// =============================================================================

Result<BufferHandle> VulkanDevice::BindBufferMemory(HeapHandle heap, std::uint64_t offset, UnboundBuffer&& buffer) {
    static const char* kOp = "bind buffer memory";
    if (buffer.IsConsumed()) return MakeError(ErrorCode::AlreadyBound, kOp, "buffer was already bound");
    auto it = heaps_.find(heap.id);
    if (it == heaps_.end()) return MakeError(ErrorCode::InvalidArgument, kOp, "unknown heap");
    const HeapRes& h = it->second;
    const MemoryRequirements& req = buffer.GetRequirements();

    if (offset > h.size || req.size > h.size - offset)
        return MakeError(ErrorCode::OutOfHeap, kOp,
                         "offset " + std::to_string(offset) + " + size " + std::to_string(req.size) +
                             " exceeds heap size " + std::to_string(h.size));
    if (offset % req.alignment != 0)
        return MakeError(ErrorCode::Misaligned, kOp,
                         "offset " + std::to_string(offset) + " is not a multiple of " +
                             std::to_string(req.alignment));
    if (!(req.memoryTypeBits & (1u << h.memoryTypeIndex)) ||
        (h.resources != ResourceHeapType::Buffers && h.resources != ResourceHeapType::Any))
        return MakeError(ErrorCode::IncompatibleHeap, kOp, "heap cannot hold this buffer");

    VkBufferCreateInfo ci = MakeBufferCreateInfo(buffer.GetSize(), buffer.GetUsage());
    VkBuffer vkBuffer = VK_NULL_HANDLE;
    VkResult vr = fn_.vkCreateBuffer(device_, &ci, nullptr, &vkBuffer);
    if (vr != VK_SUCCESS) return MakeVkError(kOp, vr, "vkCreateBuffer failed");
    vr = fn_.vkBindBufferMemory(device_, vkBuffer, h.memory, offset);
    if (vr != VK_SUCCESS) {
        fn_.vkDestroyBuffer(device_, vkBuffer, nullptr);
        return MakeVkError(kOp, vr, "vkBindBufferMemory failed");
    }
    buffer.MarkConsumed();

    BufferRes res;
    res.buffer = vkBuffer;
    res.heap = heap.id;
    res.offset = offset;
    res.size = buffer.GetSize();
    res.stride = buffer.GetStride();
    res.usage = buffer.GetUsage();
    res.state = h.defaultState;
    const std::uint64_t id = NextId();
    buffers_[id] = res;
    BufferHandle bh;
    bh.id = id;
    return bh;
}

Result<TextureHandle> VulkanDevice::BindImageMemory(HeapHandle heap, std::uint64_t offset, UnboundImage&& image) {
    static const char* kOp = "bind image memory";
    if (image.IsConsumed()) return MakeError(ErrorCode::AlreadyBound, kOp, "image was already bound");
    auto it = heaps_.find(heap.id);
    if (it == heaps_.end()) return MakeError(ErrorCode::InvalidArgument, kOp, "unknown heap");
    const HeapRes& h = it->second;
    const MemoryRequirements& req = image.GetRequirements();

    if (offset > h.size || req.size > h.size - offset)
        return MakeError(ErrorCode::OutOfHeap, kOp,
                         "offset " + std::to_string(offset) + " + size " + std::to_string(req.size) +
                             " exceeds heap size " + std::to_string(h.size));
    if (offset % req.alignment != 0)
        return MakeError(ErrorCode::Misaligned, kOp,
                         "offset " + std::to_string(offset) + " is not a multiple of " +
                             std::to_string(req.alignment));
    const bool target = IsTargetImage(image.GetUsage());
    const bool categoryOk = h.resources == ResourceHeapType::Any ||
                            (h.resources == ResourceHeapType::Targets && target) ||
                            (h.resources == ResourceHeapType::Images && !target);
    if (!(req.memoryTypeBits & (1u << h.memoryTypeIndex)) || !categoryOk)
        return MakeError(ErrorCode::IncompatibleHeap, kOp, "heap cannot hold this image");

    VkImageCreateInfo ci = MakeImageCreateInfo(image.GetKind(), image.GetMipLevels(),
                                               ToVkFormat(image.GetFormat()), image.GetUsage());
    VkImage vkImage = VK_NULL_HANDLE;
    VkResult vr = fn_.vkCreateImage(device_, &ci, nullptr, &vkImage);
    if (vr != VK_SUCCESS) return MakeVkError(kOp, vr, "vkCreateImage failed");
    vr = fn_.vkBindImageMemory(device_, vkImage, h.memory, offset);
    if (vr != VK_SUCCESS) {
        fn_.vkDestroyImage(device_, vkImage, nullptr);
        return MakeVkError(kOp, vr, "vkBindImageMemory failed");
    }
    image.MarkConsumed();

    ImageRes res;
    res.image = vkImage;
    res.heap = heap.id;
    res.offset = offset;
    res.kind = image.GetKind();
    res.mipLevels = image.GetMipLevels();
    res.format = image.GetFormat();
    res.usage = image.GetUsage();
    res.state = h.defaultState;
    const std::uint64_t id = NextId();
    images_[id] = res;
    TextureHandle th;
    th.id = id;
    return th;
}

Result<BoundBufferInfo> VulkanDevice::GetBufferInfo(BufferHandle buffer) const {
    auto it = buffers_.find(buffer.id);
    if (it == buffers_.end()) return MakeError(ErrorCode::InvalidArgument, "get buffer info", "unknown buffer");
    BoundBufferInfo info;
    info.size = it->second.size;
    info.stride = it->second.stride;
    info.heap.id = it->second.heap;
    info.offset = it->second.offset;
    info.state = it->second.state;
    return info;
}

Result<BoundImageInfo> VulkanDevice::GetImageInfo(TextureHandle image) const {
    auto it = images_.find(image.id);
    if (it == images_.end()) return MakeError(ErrorCode::InvalidArgument, "get image info", "unknown image");
    BoundImageInfo info;
    info.kind = it->second.kind;
    info.mipLevels = it->second.mipLevels;
    info.format = it->second.format;
    info.heap.id = it->second.heap;
    info.offset = it->second.offset;
    info.state = it->second.state;
    return info;
}

// =============================================================================
// 视图与采样器
// =============================================================================

const VulkanDevice::ImageRes* VulkanDevice::ResolveViewImage(TextureHandle image, const char* operation) const {
    auto it = images_.find(image.id);
    if (it == images_.end()) return nullptr;
    const ImageKind& k = it->second.kind;
    if (k.dimension != ImageDimension::D2 || k.samples > 1)
        throw NotImplementedError(std::string(operation) + " for non-2D or multisampled image");
    return &it->second;
}

Result<VkImageView> VulkanDevice::CreateImageView(const ImageRes& image, VkFormat format, VkImageAspectFlags aspect,
                                                  std::uint32_t baseMip, std::uint32_t mipCount,
                                                  std::uint32_t baseLayer, std::uint32_t layerCount,
                                                  const char* operation) {
    VkImageViewCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    ci.image = image.image;
    ci.viewType = layerCount > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
    ci.format = format;
    ci.subresourceRange.aspectMask = aspect;
    ci.subresourceRange.baseMipLevel = baseMip;
    ci.subresourceRange.levelCount = mipCount;
    ci.subresourceRange.baseArrayLayer = baseLayer;
    ci.subresourceRange.layerCount = layerCount;
    VkImageView view = VK_NULL_HANDLE;
    VkResult vr = fn_.vkCreateImageView(device_, &ci, nullptr, &view);
    if (vr != VK_SUCCESS) return MakeVkError(operation, vr, "vkCreateImageView failed");
    return view;
}

Result<RenderTargetViewHandle> VulkanDevice::ViewImageAsRenderTarget(TextureHandle image, Format format,
                                                                     std::uint32_t mipLevel, std::uint32_t layer) {
    static const char* kOp = "view image as render target";
    const ImageRes* img = ResolveViewImage(image, kOp);
    if (!img) return MakeError(ErrorCode::InvalidArgument, kOp, "unknown image");
    const VkFormat vkFormat = ToVkFormat(format);
    if (vkFormat == VK_FORMAT_UNDEFINED || IsDepthSurface(format.surface))
        return FormatError(ErrorCode::BadFormat, kOp, format);
    if (mipLevel >= img->mipLevels || layer >= img->kind.layers)
        return MakeError(ErrorCode::InvalidArgument, kOp, "mip level or layer out of range");
    if (!rtvHeap_.HasCapacity(1))
        return MakeError(ErrorCode::OutOfHeap, kOp, "render-target descriptor heap is full");

    Result<VkImageView> view = CreateImageView(*img, vkFormat, VK_IMAGE_ASPECT_COLOR_BIT, mipLevel, 1, layer, 1, kOp);
    if (!view.ok()) return view.error();
    ViewRes res;
    res.view = view.value();
    res.descriptor = rtvHeap_.AllocHandles(1);
    std::memcpy(reinterpret_cast<void*>(res.descriptor.cpu), &res.view, sizeof(VkImageView));

    const std::uint64_t id = NextId();
    renderTargetViews_[id] = res;
    RenderTargetViewHandle h;
    h.id = id;
    return h;
}

Result<DepthStencilViewHandle> VulkanDevice::ViewImageAsDepthStencil(TextureHandle image, Format format,
                                                                     std::uint32_t mipLevel, std::uint32_t layer) {
    static const char* kOp = "view image as depth stencil";
    const ImageRes* img = ResolveViewImage(image, kOp);
    if (!img) return MakeError(ErrorCode::InvalidArgument, kOp, "unknown image");
    const VkFormat vkFormat = ToVkFormat(format);
    if (vkFormat == VK_FORMAT_UNDEFINED || !IsDepthSurface(format.surface))
        return FormatError(ErrorCode::BadFormat, kOp, format);
    if (mipLevel >= img->mipLevels || layer >= img->kind.layers)
        return MakeError(ErrorCode::InvalidArgument, kOp, "mip level or layer out of range");
    if (!dsvHeap_.HasCapacity(1))
        return MakeError(ErrorCode::OutOfHeap, kOp, "depth-stencil descriptor heap is full");

    Result<VkImageView> view =
        CreateImageView(*img, vkFormat, ToVkImageAspect(format.surface), mipLevel, 1, layer, 1, kOp);
    if (!view.ok()) return view.error();
    ViewRes res;
    res.view = view.value();
    res.descriptor = dsvHeap_.AllocHandles(1);
    std::memcpy(reinterpret_cast<void*>(res.descriptor.cpu), &res.view, sizeof(VkImageView));

    const std::uint64_t id = NextId();
    depthStencilViews_[id] = res;
    DepthStencilViewHandle h;
    h.id = id;
    return h;
}

Result<ShaderResourceViewHandle> VulkanDevice::ViewImageAsShaderResource(TextureHandle image, Format format) {
    static const char* kOp = "view image as shader resource";
    const ImageRes* img = ResolveViewImage(image, kOp);
    if (!img) return MakeError(ErrorCode::InvalidArgument, kOp, "unknown image");
    const VkFormat vkFormat = ToVkFormat(format);
    if (vkFormat == VK_FORMAT_UNDEFINED) return FormatError(ErrorCode::BadFormat, kOp, format);
    if (!srvHeap_.HasCapacity(1))
        return MakeError(ErrorCode::OutOfHeap, kOp, "shader-resource descriptor heap is full");

    // 深度格式只采样深度分量
    const VkImageAspectFlags aspect =
        IsDepthSurface(format.surface) ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;
    Result<VkImageView> view =
        CreateImageView(*img, vkFormat, aspect, 0, img->mipLevels, 0, img->kind.layers, kOp);
    if (!view.ok()) return view.error();

    ViewRes res;
    res.view = view.value();
    res.descriptor = srvHeap_.AllocHandles(1);
    VkDescriptorImageInfo imageInfo{};
    imageInfo.imageView = res.view;
    imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    VkDescriptorGetInfoEXT getInfo{};
    getInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_GET_INFO_EXT;
    getInfo.type = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
    getInfo.data.pSampledImage = &imageInfo;
    fn_.vkGetDescriptorEXT(device_, &getInfo, srvHeap_.GetHandleSize(), reinterpret_cast<void*>(res.descriptor.cpu));

    const std::uint64_t id = NextId();
    shaderResourceViews_[id] = res;
    ShaderResourceViewHandle h;
    h.id = id;
    return h;
}

Result<UnorderedAccessViewHandle> VulkanDevice::ViewImageAsUnorderedAccess(TextureHandle /*image*/,
                                                                           Format /*format*/) {
    throw NotImplementedError("view image as unordered access");
}

Result<ConstantBufferViewHandle> VulkanDevice::ViewBufferAsConstant(BufferHandle /*buffer*/,
                                                                    std::uint64_t /*offset*/,
                                                                    std::uint64_t /*size*/) {
    throw NotImplementedError("view buffer as constant");
}

Result<SamplerHandle> VulkanDevice::CreateSampler(const SamplerDesc& desc) {
    static const char* kOp = "create sampler";
    if (!samplerHeap_.HasCapacity(1)) return MakeError(ErrorCode::OutOfHeap, kOp, "sampler descriptor heap is full");

    VkSamplerCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    ci.magFilter = ToVkFilter(desc.magFilter);
    ci.minFilter = ToVkFilter(desc.minFilter);
    ci.mipmapMode = ToVkMipmapMode(desc.mipFilter);
    ci.addressModeU = ToVkAddressMode(desc.addressU);
    ci.addressModeV = ToVkAddressMode(desc.addressV);
    ci.addressModeW = ToVkAddressMode(desc.addressW);
    ci.mipLodBias = desc.mipLodBias;
    ci.anisotropyEnable = desc.maxAnisotropy > 1.0f ? VK_TRUE : VK_FALSE;
    ci.maxAnisotropy = desc.maxAnisotropy;
    ci.compareEnable = desc.compareEnable ? VK_TRUE : VK_FALSE;
    ci.compareOp = ToVkCompareOp(desc.compareOp);
    ci.minLod = desc.minLod;
    ci.maxLod = desc.maxLod;
    ci.borderColor = VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK;

    VkSampler sampler = VK_NULL_HANDLE;
    VkResult vr = fn_.vkCreateSampler(device_, &ci, nullptr, &sampler);
    if (vr != VK_SUCCESS) return MakeVkError(kOp, vr, "vkCreateSampler failed");

    SamplerRes res;
    res.sampler = sampler;
    res.descriptor = samplerHeap_.AllocHandles(1);
    VkDescriptorGetInfoEXT getInfo{};
    getInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_GET_INFO_EXT;
    getInfo.type = VK_DESCRIPTOR_TYPE_SAMPLER;
    getInfo.data.pSampler = &res.sampler;
    fn_.vkGetDescriptorEXT(device_, &getInfo, samplerHeap_.GetHandleSize(),
                           reinterpret_cast<void*>(res.descriptor.cpu));

    const std::uint64_t id = NextId();
    samplers_[id] = res;
    SamplerHandle h;
    h.id = id;
    return h;
}

DualHandle VulkanDevice::GetDescriptor(RenderTargetViewHandle view) const {
    auto it = renderTargetViews_.find(view.id);
    return it == renderTargetViews_.end() ? DualHandle{} : it->second.descriptor;
}

DualHandle VulkanDevice::GetDescriptor(DepthStencilViewHandle view) const {
    auto it = depthStencilViews_.find(view.id);
    return it == depthStencilViews_.end() ? DualHandle{} : it->second.descriptor;
}

DualHandle VulkanDevice::GetDescriptor(ShaderResourceViewHandle view) const {
    auto it = shaderResourceViews_.find(view.id);
    return it == shaderResourceViews_.end() ? DualHandle{} : it->second.descriptor;
}

DualHandle VulkanDevice::GetDescriptor(SamplerHandle sampler) const {
    auto it = samplers_.find(sampler.id);
    return it == samplers_.end() ? DualHandle{} : it->second.descriptor;
}

// =============================================================================
// 映射（每个堆整体映射一次，按引用计数解除）
// =============================================================================

Result<MappedRange> VulkanDevice::WriteMappingRaw(BufferHandle buffer, std::uint64_t begin, std::uint64_t end) {
    static const char* kOp = "write mapping";
    auto bit = buffers_.find(buffer.id);
    if (bit == buffers_.end()) return MakeError(ErrorCode::InvalidArgument, kOp, "unknown buffer");
    const BufferRes& b = bit->second;
    if (end > b.size || begin > end)
        return MakeError(ErrorCode::OutOfBounds, kOp,
                         "range [" + std::to_string(begin) + ", " + std::to_string(end) +
                             ") outside buffer of size " + std::to_string(b.size));
    auto hit = heaps_.find(b.heap);
    if (hit == heaps_.end()) return MakeError(ErrorCode::InvalidArgument, kOp, "buffer heap was destroyed");
    HeapRes& h = hit->second;
    if (!HasHeapProperty(h.properties, HeapProperty::CpuVisible))
        return MakeError(ErrorCode::IncompatibleHeap, kOp, "buffer heap is not CPU visible");

    if (!h.mapped) {
        VkResult vr = fn_.vkMapMemory(device_, h.memory, 0, VK_WHOLE_SIZE, 0, &h.mapped);
        if (vr != VK_SUCCESS) {
            h.mapped = nullptr;
            return MakeVkError(kOp, vr, "vkMapMemory failed");
        }
    }
    ++h.mapCount;

    MappingRes m;
    m.heap = b.heap;
    m.offset = b.offset + begin;
    m.size = end - begin;
    const std::uint64_t id = NextId();
    mappings_[id] = m;

    MappedRange range;
    range.data = static_cast<std::uint8_t*>(h.mapped) + m.offset;
    range.token.id = id;
    return range;
}

Result<MappedRange> VulkanDevice::ReadMappingRaw(BufferHandle /*buffer*/, std::uint64_t /*begin*/,
                                                std::uint64_t /*end*/) {
    throw NotImplementedError("read mapping");
}

void VulkanDevice::UnmapMappingRaw(MappingToken token) {
    auto mit = mappings_.find(token.id);
    if (mit == mappings_.end()) {
        GetLogger()->error("UnmapMappingRaw: unknown mapping token {}", token.id);
        return;
    }
    const MappingRes m = mit->second;
    mappings_.erase(mit);
    auto hit = heaps_.find(m.heap);
    if (hit == heaps_.end()) return;
    HeapRes& h = hit->second;

    if (!HasHeapProperty(h.properties, HeapProperty::Coherent) && m.size > 0) {
        const std::uint64_t atom = std::max<std::uint64_t>(limits_.nonCoherentAtomSize, 1);
        const std::uint64_t start = m.offset - m.offset % atom;
        std::uint64_t size = ((m.offset + m.size - start + atom - 1) / atom) * atom;
        VkMappedMemoryRange range{};
        range.sType = VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE;
        range.memory = h.memory;
        range.offset = start;
        range.size = start + size > h.size ? VK_WHOLE_SIZE : size;
        VkResult vr = fn_.vkFlushMappedMemoryRanges(device_, 1, &range);
        if (vr != VK_SUCCESS) GetLogger()->error("UnmapMappingRaw: vkFlushMappedMemoryRanges failed ({})", static_cast<int>(vr));
    }
    if (h.mapCount > 0 && --h.mapCount == 0) {
        fn_.vkUnmapMemory(device_, h.memory);
        h.mapped = nullptr;
    }
}

// =============================================================================
// 销毁
// =============================================================================

void VulkanDevice::DestroyHeap(HeapHandle heap) {
    auto it = heaps_.find(heap.id);
    if (it == heaps_.end()) return;
    if (it->second.mapped) fn_.vkUnmapMemory(device_, it->second.memory);
    fn_.vkFreeMemory(device_, it->second.memory, nullptr);
    heaps_.erase(it);
}

void VulkanDevice::DestroyBuffer(BufferHandle buffer) {
    auto it = buffers_.find(buffer.id);
    if (it == buffers_.end()) return;
    fn_.vkDestroyBuffer(device_, it->second.buffer, nullptr);
    buffers_.erase(it);
}

void VulkanDevice::DestroyImage(TextureHandle image) {
    auto it = images_.find(image.id);
    if (it == images_.end()) return;
    fn_.vkDestroyImage(device_, it->second.image, nullptr);
    images_.erase(it);
}

void VulkanDevice::DestroyRenderTargetView(RenderTargetViewHandle view) {
    auto it = renderTargetViews_.find(view.id);
    if (it == renderTargetViews_.end()) return;
    fn_.vkDestroyImageView(device_, it->second.view, nullptr);
    renderTargetViews_.erase(it);
}

void VulkanDevice::DestroyDepthStencilView(DepthStencilViewHandle view) {
    auto it = depthStencilViews_.find(view.id);
    if (it == depthStencilViews_.end()) return;
    fn_.vkDestroyImageView(device_, it->second.view, nullptr);
    depthStencilViews_.erase(it);
}

void VulkanDevice::DestroyShaderResourceView(ShaderResourceViewHandle view) {
    auto it = shaderResourceViews_.find(view.id);
    if (it == shaderResourceViews_.end()) return;
    fn_.vkDestroyImageView(device_, it->second.view, nullptr);
    shaderResourceViews_.erase(it);
}

void VulkanDevice::DestroyUnorderedAccessView(UnorderedAccessViewHandle /*view*/) {
    throw NotImplementedError("destroy unordered access view");
}

void VulkanDevice::DestroyConstantBufferView(ConstantBufferViewHandle /*view*/) {
    throw NotImplementedError("destroy constant buffer view");
}

void VulkanDevice::DestroySampler(SamplerHandle sampler) {
    auto it = samplers_.find(sampler.id);
    if (it == samplers_.end()) return;
    fn_.vkDestroySampler(device_, it->second.sampler, nullptr);
    samplers_.erase(it);
}

}  // namespace vesta_device
