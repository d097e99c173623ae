/**
 * @file vulkan_device.hpp
 * @brief Vulkan 1.3 显式后端：堆、两阶段资源绑定、描述符堆、管线构建、栅栏同步
 *
 * 资源放置：CreateBuffer/CreateImage 只计算内存需求，BindBufferMemory/BindImageMemory
 * 在调用方选定的堆与偏移处创建原生资源。视图描述符从四个固定容量的描述符堆线性分配：
 * RTV / DSV 为 CPU 槽数组（VkImageView），SRV 与采样器为 VK_EXT_descriptor_buffer 缓冲。
 * 栅栏与信号量均为 timeline semaphore。
 */

#pragma once

#include <vesta_device/descriptor_heap.hpp>
#include <vesta_device/graphics_backend.hpp>
#include <vesta_device/rdi_types.hpp>
#include <vesta_device/result.hpp>
#include <vesta_device/shader_compiler.hpp>
#include <vesta_device/vulkan_functions.hpp>
#include <vesta_device/vulkan_types.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <vulkan/vulkan.h>

namespace vesta_device {

class VulkanDevice : public IGraphicsBackend {
public:
    VulkanDevice() = default;
    ~VulkanDevice() override;

    VulkanDevice(const VulkanDevice&) = delete;
    VulkanDevice& operator=(const VulkanDevice&) = delete;

    /** 失败返回 false，原因见 GetLastError */
    bool Initialize(const VulkanDeviceConfig& config);

    // --- IGraphicsBackend ---
    Backend GetBackend() const override { return Backend::Vulkan; }
    const BackendCapabilities& GetCapabilities() const override { return capabilities_; }
    const std::string& GetLastError() const override { return lastError_; }
    void Shutdown() override;

    // =========================================================================
    // 堆与两阶段资源
    // =========================================================================

    const std::vector<HeapType>& GetHeapTypes() const { return heapTypes_; }
    Result<HeapHandle> CreateHeap(const HeapType& type, ResourceHeapType resources, std::uint64_t size);

    Result<UnboundBuffer> CreateBuffer(std::uint64_t size, std::uint32_t stride, BufferUsage usage);
    Result<UnboundImage> CreateImage(const ImageKind& kind, std::uint32_t mipLevels, Format format,
                                     BindFlags usage);
    /** 校验顺序：AlreadyBound, OutOfHeap, Misaligned, IncompatibleHeap；全部通过才发出原生调用 */
    Result<BufferHandle> BindBufferMemory(HeapHandle heap, std::uint64_t offset, UnboundBuffer&& buffer);
    Result<TextureHandle> BindImageMemory(HeapHandle heap, std::uint64_t offset, UnboundImage&& image);

    Result<BoundBufferInfo> GetBufferInfo(BufferHandle buffer) const;
    Result<BoundImageInfo> GetImageInfo(TextureHandle image) const;

    // =========================================================================
    // 视图与采样器（各占一个描述符槽，槽位不回收）
    // =========================================================================

    Result<RenderTargetViewHandle> ViewImageAsRenderTarget(TextureHandle image, Format format,
                                                           std::uint32_t mipLevel = 0,
                                                           std::uint32_t layer = 0);
    Result<DepthStencilViewHandle> ViewImageAsDepthStencil(TextureHandle image, Format format,
                                                           std::uint32_t mipLevel = 0,
                                                           std::uint32_t layer = 0);
    Result<ShaderResourceViewHandle> ViewImageAsShaderResource(TextureHandle image, Format format);
    Result<UnorderedAccessViewHandle> ViewImageAsUnorderedAccess(TextureHandle image, Format format);
    Result<ConstantBufferViewHandle> ViewBufferAsConstant(BufferHandle buffer, std::uint64_t offset,
                                                          std::uint64_t size);
    Result<SamplerHandle> CreateSampler(const SamplerDesc& desc);

    /** 描述符在其所在堆中的地址 */
    DualHandle GetDescriptor(RenderTargetViewHandle view) const;
    DualHandle GetDescriptor(DepthStencilViewHandle view) const;
    DualHandle GetDescriptor(ShaderResourceViewHandle view) const;
    DualHandle GetDescriptor(SamplerHandle sampler) const;

    const DescriptorHeap& GetRenderTargetHeap() const { return rtvHeap_; }
    const DescriptorHeap& GetDepthStencilHeap() const { return dsvHeap_; }
    const DescriptorHeap& GetShaderResourceHeap() const { return srvHeap_; }
    const DescriptorHeap& GetSamplerHeap() const { return samplerHeap_; }

    // =========================================================================
    // 映射
    // =========================================================================

    /** 映射 [begin, end)；end > size 或 begin > end 返回 OutOfBounds 且不发出原生映射 */
    Result<MappedRange> WriteMappingRaw(BufferHandle buffer, std::uint64_t begin, std::uint64_t end);
    /** 回读映射未实现，抛出 NotImplementedError */
    Result<MappedRange> ReadMappingRaw(BufferHandle buffer, std::uint64_t begin, std::uint64_t end);
    void UnmapMappingRaw(MappingToken token);

    // =========================================================================
    // 描述符模型与管线
    // =========================================================================

    DescriptorSetLayout CreateDescriptorSetLayout(const std::vector<DescriptorBinding>& bindings);
    DescriptorPool CreateDescriptorPool(std::uint32_t maxSets, const std::vector<DescriptorRange>& ranges);
    Result<PipelineLayoutHandle> CreatePipelineLayout(const std::vector<DescriptorSetLayout>& sets,
                                                      const std::vector<PushConstantRange>& pushConstants = {});
    void UpdateDescriptorSets(const std::vector<DescriptorSetWrite>& writes);

    Result<ShaderLib> CreateShaderLibrary(const std::vector<ShaderEntry>& entries);
    Result<ShaderLib> CreateShaderLibraryFromSource(IShaderSourceCompiler& compiler,
                                                    const std::vector<ShaderSource>& sources);
    Result<RenderPass> CreateRenderPass(const std::vector<AttachmentDesc>& attachments,
                                        const std::vector<SubpassDesc>& subpasses);
    /** 附件数不得超过渲染通道的附件数；未知视图返回 InvalidArgument 并带上其下标 */
    Result<Framebuffer> CreateFramebuffer(const RenderPass& pass,
                                          const std::vector<RenderTargetViewHandle>& colors,
                                          const std::vector<DepthStencilViewHandle>& depthStencil,
                                          std::uint32_t width, std::uint32_t height, std::uint32_t layers = 1);

    /** 每个描述一个结果，顺序与输入一致；单个失败不影响其余 */
    std::vector<Result<PipelineHandle>> CreateGraphicsPipelines(const std::vector<GraphicsPipelineDesc>& descs);
    std::vector<Result<PipelineHandle>> CreateComputePipelines(const std::vector<ShaderEntry>& entries,
                                                               PipelineLayoutHandle layout);
    PrimitiveTopology GetPipelineTopology(PipelineHandle pipeline) const;

    // =========================================================================
    // 同步
    // =========================================================================

    Result<FenceHandle> CreateFence(bool signaled = false);
    /** 信号量即不跟踪数值的栅栏 */
    Result<SemaphoreHandle> CreateSemaphore();
    void ResetFences(const std::vector<FenceHandle>& fences);
    /** 条件满足返回 true，超时返回 false；其他原生结果抛出 FatalDeviceError */
    bool WaitForFences(const std::vector<FenceHandle>& fences, WaitMode mode, std::uint32_t timeoutMs);
    /** 主机端 signal */
    void SignalFence(FenceHandle fence);
    /** 自上次 reset 起的相对计数，>= 1 表示已 signal */
    std::uint64_t GetFenceValue(FenceHandle fence) const;
    NativeFence GetNativeFence(FenceHandle fence) const;
    /** 每次调用预留下一个 signal 值，保证连续提交的值严格递增 */
    NativeFence GetNativeSemaphore(SemaphoreHandle semaphore);

    // =========================================================================
    // 销毁（未实现的路径抛出 NotImplementedError）
    // =========================================================================

    void DestroyHeap(HeapHandle heap);
    void DestroyBuffer(BufferHandle buffer);
    void DestroyImage(TextureHandle image);
    void DestroyRenderTargetView(RenderTargetViewHandle view);
    void DestroyDepthStencilView(DepthStencilViewHandle view);
    void DestroyShaderResourceView(ShaderResourceViewHandle view);
    void DestroyUnorderedAccessView(UnorderedAccessViewHandle view);
    void DestroyConstantBufferView(ConstantBufferViewHandle view);
    void DestroySampler(SamplerHandle sampler);
    void DestroyDescriptorSetLayout(DescriptorSetLayout& layout);
    void DestroyDescriptorPool(DescriptorPool& pool);
    void DestroyPipelineLayout(PipelineLayoutHandle layout);
    void DestroyShaderLibrary(ShaderLib& lib);
    void DestroyRenderPass(RenderPass& pass);
    void DestroyFramebuffer(Framebuffer& framebuffer);
    void DestroyGraphicsPipeline(PipelineHandle pipeline);
    void DestroyComputePipeline(PipelineHandle pipeline);
    void DestroyFence(FenceHandle fence);
    void DestroySemaphore(SemaphoreHandle semaphore);

    struct HeapRes {
        VkDeviceMemory memory = VK_NULL_HANDLE;
        std::uint64_t size = 0;
        std::uint32_t memoryTypeIndex = 0;
        HeapProperty properties = HeapProperty::None;
        ResourceHeapType resources = ResourceHeapType::Any;
        ResourceState defaultState = ResourceState::Common;
        void* mapped = nullptr;
        std::uint32_t mapCount = 0;
    };
    struct BufferRes {
        VkBuffer buffer = VK_NULL_HANDLE;
        std::uint64_t heap = 0;
        std::uint64_t offset = 0;
        std::uint64_t size = 0;
        std::uint32_t stride = 0;
        BufferUsage usage = BufferUsage::None;
        ResourceState state = ResourceState::Common;
    };
    struct ImageRes {
        VkImage image = VK_NULL_HANDLE;
        std::uint64_t heap = 0;
        std::uint64_t offset = 0;
        ImageKind kind;
        std::uint32_t mipLevels = 1;
        Format format;
        BindFlags usage = BindFlags::None;
        ResourceState state = ResourceState::Common;
    };
    struct ViewRes {
        VkImageView view = VK_NULL_HANDLE;
        DualHandle descriptor;
    };
    struct SamplerRes {
        VkSampler sampler = VK_NULL_HANDLE;
        DualHandle descriptor;
    };
    struct MappingRes {
        std::uint64_t heap = 0;
        std::uint64_t offset = 0;  // 相对堆起始
        std::uint64_t size = 0;
    };
    struct PipelineRes {
        VkPipeline pipeline = VK_NULL_HANDLE;
        PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    };
    struct FenceRes {
        VkSemaphore semaphore = VK_NULL_HANDLE;
        std::uint64_t base = 0;
        std::uint64_t pending = 0;  // 信号量：最近一次交出的 signal 值
    };

private:
    std::uint64_t NextId() { return nextId_++; }

    bool CreateDescriptorBuffer(VkBufferUsageFlags usage, std::uint64_t size, VkBuffer& buffer,
                                VkDeviceMemory& memory, void*& mapped, VkDeviceAddress& address);
    void DestroyDescriptorHeaps();
    bool FindMemoryType(std::uint32_t typeBits, VkMemoryPropertyFlags required, std::uint32_t& out) const;
    Result<VkImageView> CreateImageView(const ImageRes& image, VkFormat format, VkImageAspectFlags aspect,
                                        std::uint32_t baseMip, std::uint32_t mipCount,
                                        std::uint32_t baseLayer, std::uint32_t layerCount,
                                        const char* operation);
    /** 仅支持单采样 2D 图像，否则抛出 NotImplementedError */
    const ImageRes* ResolveViewImage(TextureHandle image, const char* operation) const;
    Result<PipelineHandle> CreateGraphicsPipeline(const GraphicsPipelineDesc& desc, std::uint32_t index);
    Result<FenceRes> CreateTimelineSemaphore(std::uint64_t initialValue);
    std::uint64_t GetCounterValue(VkSemaphore semaphore) const;
    const FenceRes& GetFenceRes(FenceHandle fence) const;

    VulkanFunctions fn_;
    VkInstance instance_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VkPhysicalDeviceMemoryProperties memoryProperties_{};
    VkPhysicalDeviceLimits limits_{};
    VkPhysicalDeviceDescriptorBufferPropertiesEXT descriptorBufferProps_{};
    bool initialized_ = false;
    std::uint64_t nextId_ = 1;
    std::string lastError_;
    BackendCapabilities capabilities_;
    std::vector<HeapType> heapTypes_;

    // --- 描述符堆 ---
    std::vector<VkImageView> rtvSlots_;
    std::vector<VkImageView> dsvSlots_;
    VkBuffer srvBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory srvMemory_ = VK_NULL_HANDLE;
    VkBuffer samplerBuffer_ = VK_NULL_HANDLE;
    VkDeviceMemory samplerMemory_ = VK_NULL_HANDLE;
    DescriptorHeap rtvHeap_;
    DescriptorHeap dsvHeap_;
    DescriptorHeap srvHeap_;
    DescriptorHeap samplerHeap_;

    std::unordered_map<std::uint64_t, HeapRes> heaps_;
    std::unordered_map<std::uint64_t, BufferRes> buffers_;
    std::unordered_map<std::uint64_t, ImageRes> images_;
    std::unordered_map<std::uint64_t, ViewRes> renderTargetViews_;
    std::unordered_map<std::uint64_t, ViewRes> depthStencilViews_;
    std::unordered_map<std::uint64_t, ViewRes> shaderResourceViews_;
    std::unordered_map<std::uint64_t, SamplerRes> samplers_;
    std::unordered_map<std::uint64_t, MappingRes> mappings_;
    std::unordered_map<std::uint64_t, VkPipelineLayout> pipelineLayouts_;
    std::unordered_map<std::uint64_t, PipelineRes> pipelines_;
    std::unordered_map<std::uint64_t, FenceRes> fences_;
    std::unordered_map<std::uint64_t, FenceRes> semaphores_;

    // WaitForFences 的暂存数组：只增不减
    std::vector<VkSemaphore> waitSemaphores_;
    std::vector<std::uint64_t> waitValues_;
};

}  // namespace vesta_device
