/**
 * @file vulkan_types.hpp
 * @brief 显式后端的数据类型：堆、两阶段资源、描述符模型、着色器库、渲染通道与管线描述
 */

#pragma once

#include <vesta_device/device_settings.hpp>
#include <vesta_device/rdi_types.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <vulkan/vulkan.h>

namespace vesta_device {

struct VulkanFunctions;

// =============================================================================
// 堆
// =============================================================================

enum class HeapProperty : std::uint32_t {
    None        = 0,
    DeviceLocal = 1u << 0,
    CpuVisible  = 1u << 1,
    Coherent    = 1u << 2,
    Cached      = 1u << 3,
};

inline HeapProperty operator|(HeapProperty a, HeapProperty b) {
    return static_cast<HeapProperty>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline bool HasHeapProperty(HeapProperty mask, HeapProperty bit) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(bit)) != 0;
}

/** 设备内存类型；id 为 VkPhysicalDeviceMemoryProperties 中的类型索引 */
struct HeapType {
    std::uint32_t id = 0;
    HeapProperty properties = HeapProperty::None;
};

/** 堆可容纳的资源类别 */
enum class ResourceHeapType {
    Buffers,
    Images,
    Targets,  // 渲染目标 / 深度模板图像
    Any,      // 需要异构堆支持
};

/** 资源初始状态（由所在堆决定） */
enum class ResourceState {
    Common,
    GenericRead,
    CopyDest,
};

const char* ToString(ResourceState state);

struct MemoryRequirements {
    std::uint64_t size = 0;
    std::uint64_t alignment = 1;
    std::uint32_t memoryTypeBits = 0;
};

// =============================================================================
// 两阶段资源：Unbound* 只持有描述与内存需求，绑定时被消耗
// =============================================================================

enum class BufferUsage : std::uint32_t {
    None        = 0,
    Vertex      = 1u << 0,
    Index       = 1u << 1,
    Constant    = 1u << 2,
    Storage     = 1u << 3,
    TransferSrc = 1u << 4,
    TransferDst = 1u << 5,
};

inline BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline bool HasBufferUsage(BufferUsage mask, BufferUsage bit) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(bit)) != 0;
}

class UnboundBuffer {
public:
    UnboundBuffer() = default;
    UnboundBuffer(std::uint64_t size, std::uint32_t stride, BufferUsage usage,
                  const MemoryRequirements& requirements)
        : size_(size), stride_(stride), usage_(usage), requirements_(requirements), consumed_(false) {}

    UnboundBuffer(UnboundBuffer&& other) noexcept { *this = std::move(other); }
    UnboundBuffer& operator=(UnboundBuffer&& other) noexcept {
        if (this == &other) return *this;
        size_ = other.size_;
        stride_ = other.stride_;
        usage_ = other.usage_;
        requirements_ = other.requirements_;
        consumed_ = other.consumed_;
        other.consumed_ = true;
        return *this;
    }
    UnboundBuffer(const UnboundBuffer&) = delete;
    UnboundBuffer& operator=(const UnboundBuffer&) = delete;

    std::uint64_t GetSize() const { return size_; }
    std::uint32_t GetStride() const { return stride_; }
    BufferUsage GetUsage() const { return usage_; }
    const MemoryRequirements& GetRequirements() const { return requirements_; }
    /** 已被绑定（或被移走）后不可再次绑定 */
    bool IsConsumed() const { return consumed_; }
    void MarkConsumed() { consumed_ = true; }

private:
    std::uint64_t size_ = 0;
    std::uint32_t stride_ = 0;
    BufferUsage usage_ = BufferUsage::None;
    MemoryRequirements requirements_;
    bool consumed_ = true;
};

class UnboundImage {
public:
    UnboundImage() = default;
    UnboundImage(const ImageKind& kind, std::uint32_t mipLevels, Format format, BindFlags usage,
                 const MemoryRequirements& requirements)
        : kind_(kind), mipLevels_(mipLevels), format_(format), usage_(usage),
          requirements_(requirements), consumed_(false) {}

    UnboundImage(UnboundImage&& other) noexcept { *this = std::move(other); }
    UnboundImage& operator=(UnboundImage&& other) noexcept {
        if (this == &other) return *this;
        kind_ = other.kind_;
        mipLevels_ = other.mipLevels_;
        format_ = other.format_;
        usage_ = other.usage_;
        requirements_ = other.requirements_;
        consumed_ = other.consumed_;
        other.consumed_ = true;
        return *this;
    }
    UnboundImage(const UnboundImage&) = delete;
    UnboundImage& operator=(const UnboundImage&) = delete;

    const ImageKind& GetKind() const { return kind_; }
    std::uint32_t GetMipLevels() const { return mipLevels_; }
    Format GetFormat() const { return format_; }
    BindFlags GetUsage() const { return usage_; }
    const MemoryRequirements& GetRequirements() const { return requirements_; }
    bool IsConsumed() const { return consumed_; }
    void MarkConsumed() { consumed_ = true; }

private:
    ImageKind kind_;
    std::uint32_t mipLevels_ = 1;
    Format format_;
    BindFlags usage_ = BindFlags::None;
    MemoryRequirements requirements_;
    bool consumed_ = true;
};

/** 已绑定资源的查询结果 */
struct BoundBufferInfo {
    std::uint64_t size = 0;
    std::uint32_t stride = 0;
    HeapHandle heap;
    std::uint64_t offset = 0;
    ResourceState state = ResourceState::Common;
};

struct BoundImageInfo {
    ImageKind kind;
    std::uint32_t mipLevels = 1;
    Format format;
    HeapHandle heap;
    std::uint64_t offset = 0;
    ResourceState state = ResourceState::Common;
};

// =============================================================================
// 映射
// =============================================================================

/** 必须交回 UnmapMappingRaw；析构不会自动解除映射 */
struct MappingToken {
    std::uint64_t id = 0;
};

struct MappedRange {
    std::uint8_t* data = nullptr;
    MappingToken token;
};

// =============================================================================
// 描述符模型
// =============================================================================

enum class DescriptorType {
    SampledImage,
    StorageImage,
    UniformBuffer,
    StorageBuffer,
    Sampler,
};

inline std::uint32_t StageBit(ShaderStage s) { return 1u << StageIndex(s); }
constexpr std::uint32_t kAllGraphicsStageBits = (1u << kGraphicsStageCount) - 1u;

struct DescriptorBinding {
    std::uint32_t binding = 0;
    DescriptorType type = DescriptorType::UniformBuffer;
    std::uint32_t count = 1;
    std::uint32_t stageMask = kAllGraphicsStageBits;  // StageBit 组合
};

/** 绑定顺序即描述符范围顺序，创建管线布局时按原序展开 */
struct DescriptorSetLayout {
    std::vector<DescriptorBinding> bindings;
};

struct DescriptorRange {
    DescriptorType type = DescriptorType::UniformBuffer;
    std::uint32_t count = 0;
};

struct DescriptorPool {
    std::uint32_t maxSets = 0;
    std::vector<DescriptorRange> ranges;
};

/** 描述符集写入（尚未实现，UpdateDescriptorSets 抛出 NotImplementedError） */
struct DescriptorSetWrite {
    std::uint32_t binding = 0;
    std::uint32_t arrayOffset = 0;
    DescriptorType type = DescriptorType::SampledImage;
    std::vector<ShaderResourceViewHandle> views;
    std::vector<SamplerHandle> samplers;
};

struct PushConstantRange {
    std::uint32_t stageMask = kAllGraphicsStageBits;
    std::uint32_t offset = 0;
    std::uint32_t size = 0;
};

// =============================================================================
// 着色器库
// =============================================================================

struct ShaderEntry {
    std::string entryPoint;
    ShaderStage stage = ShaderStage::Vertex;
    std::vector<std::uint32_t> spirv;
};

/** 入口名 -> SPIR-V；多个入口可共享同一模块，同名入口先到者生效 */
class ShaderLib {
public:
    struct Entry {
        ShaderStage stage = ShaderStage::Vertex;
        std::shared_ptr<const std::vector<std::uint32_t>> spirv;
    };

    /** 已存在同名入口时不覆盖并返回 false */
    bool Add(const std::string& entryPoint, ShaderStage stage,
             std::shared_ptr<const std::vector<std::uint32_t>> spirv);
    const Entry* Find(const std::string& entryPoint) const;
    std::size_t GetEntryCount() const { return entries_.size(); }
    void Clear() { entries_.clear(); }

private:
    std::map<std::string, Entry> entries_;
};

// =============================================================================
// 渲染通道（纯值，仅用于提供附件格式）
// =============================================================================

struct AttachmentDesc {
    Format format;
    std::uint32_t samples = 1;
};

struct SubpassDesc {
    std::vector<std::uint32_t> colorAttachments;       // 索引到 RenderPass::attachments
    std::optional<std::uint32_t> depthStencilAttachment;
};

struct RenderPass {
    std::vector<AttachmentDesc> attachments;
    std::vector<SubpassDesc> subpasses;
};

/** 帧缓冲：收集附件视图与渲染区域，供动态渲染时填写附件信息 */
struct Framebuffer {
    std::vector<VkImageView> colors;
    std::vector<VkImageView> depthStencil;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t layers = 1;
};

// =============================================================================
// 图形管线描述
// =============================================================================

struct GraphicsShaderSet {
    std::string vertex;
    std::string tessControl;     // 空 = 阶段禁用
    std::string tessEvaluation;
    std::string geometry;
    std::string fragment;
};

struct GraphicsPipelineDesc {
    const ShaderLib* shaders = nullptr;
    GraphicsShaderSet entries;
    PipelineLayoutHandle layout;
    /** 按绑定索引排列；VertexAttribute::binding 索引此数组 */
    std::vector<VertexBufferDesc> vertexBuffers;
    std::vector<VertexAttribute> attributes;
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    RasterizationState rasterizer;
    DepthStencilState depthStencil;
    BlendDesc blend;
    const RenderPass* renderPass = nullptr;
    std::uint32_t subpass = 0;
};

// =============================================================================
// 同步
// =============================================================================

enum class WaitMode {
    Any,
    All,
};

/** 供提交循环使用：信号量与使栅栏进入 signaled 的计数值 */
struct NativeFence {
    VkSemaphore semaphore = VK_NULL_HANDLE;
    std::uint64_t signalValue = 0;
};

// =============================================================================
// 设备配置
// =============================================================================

/**
 * 外部协作方负责实例 / 物理设备 / 设备的创建与扩展启用
 * （Vulkan 1.3 + VK_EXT_descriptor_buffer，开启 bufferDeviceAddress / timelineSemaphore / dynamicRendering）。
 */
struct VulkanDeviceConfig {
    VkInstance instance = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice device = VK_NULL_HANDLE;
    /** 非空时直接使用该分发表（测试注入），否则从 instance/device 加载 */
    const VulkanFunctions* functions = nullptr;
    DescriptorHeapCapacities descriptorHeaps;
};

}  // namespace vesta_device
