/**
 * @file test_vulkan_resources.cpp
 * @brief 显式后端资源工厂单元测试（假驱动）
 *
 * 覆盖：初始化与堆类型；CreateHeap 的默认状态与失败路径；两阶段绑定的校验顺序
 * （AlreadyBound、OutOfHeap、Misaligned、IncompatibleHeap）且失败时不发出原生创建；
 * 缓冲往返查询与销毁；视图与采样器的描述符写入；映射边界、引用计数与非一致内存刷新；
 * 帧缓冲收集附件视图；自移动赋值不消耗未绑定资源；
 * 未实现路径抛出 NotImplementedError；Shutdown 释放全部对象。
 */

#include <vesta_device/error.hpp>
#include <vesta_device/vulkan_device.hpp>

#include "counting_sink.hpp"
#include "fake_vulkan_driver.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <utility>

using namespace vesta_device;
using namespace vesta_test;

namespace {

const Format kRgba8{SurfaceType::R8_G8_B8_A8, ChannelType::Unorm};
const Format kDepth32{SurfaceType::D32, ChannelType::Float};

struct Fixture {
    VulkanFunctions functions;
    VulkanDevice device;

    explicit Fixture(const DescriptorHeapCapacities& caps = DescriptorHeapCapacities{}) {
        functions = MakeFakeFunctions();
        VulkanDeviceConfig config = MakeFakeConfig(functions);
        config.descriptorHeaps = caps;
        bool ok = device.Initialize(config);
        assert(ok);
        (void)ok;
    }

    HeapHandle Heap(std::uint32_t typeIndex, ResourceHeapType kind, std::uint64_t size) {
        return device.CreateHeap(device.GetHeapTypes()[typeIndex], kind, size).orThrow();
    }

    UnboundBuffer Buffer(std::uint64_t size, std::uint32_t stride = 0) {
        return device.CreateBuffer(size, stride, BufferUsage::Vertex | BufferUsage::TransferDst).orThrow();
    }

    UnboundImage Image(const ImageKind& kind, Format format, BindFlags usage) {
        return device.CreateImage(kind, 1, format, usage).orThrow();
    }
};

template <typename T>
ErrorCode CodeOf(const Result<T>& r) {
    assert(!r.ok());
    return r.error().code;
}

}  // namespace

static void TestInitializeReportsHeapTypesAndDescriptorHeaps() {
    ResetFakeDriver();
    Fixture f;
    const auto& types = f.device.GetHeapTypes();
    assert(types.size() == 3);
    assert(HasHeapProperty(types[0].properties, HeapProperty::DeviceLocal));
    assert(!HasHeapProperty(types[0].properties, HeapProperty::CpuVisible));
    assert(HasHeapProperty(types[1].properties, HeapProperty::Coherent));
    assert(HasHeapProperty(types[2].properties, HeapProperty::Cached));

    const BackendCapabilities& caps = f.device.GetCapabilities();
    assert(caps.explicitHeaps);
    assert(!caps.immediateContext);
    assert(caps.heterogeneousHeaps);
    assert(caps.maxTextureSize == 16384);
    assert(f.device.GetBackend() == Backend::Vulkan);

    assert(f.device.GetShaderResourceHeap().GetHandleSize() == 32);
    assert(f.device.GetShaderResourceHeap().GetTotalHandles() == 4096);
    assert(f.device.GetShaderResourceHeap().IsShaderVisible());
    assert(f.device.GetSamplerHeap().GetHandleSize() == 16);
    assert(!f.device.GetRenderTargetHeap().IsShaderVisible());
    assert(f.device.GetDepthStencilHeap().GetTotalHandles() == 64);
    // SRV 与采样器描述符缓冲
    assert(State().liveBuffers == 2);
}

static void TestInitializeWithoutDescriptorBufferFails() {
    ResetFakeDriver();
    State().hasDescriptorBuffer = false;
    VulkanFunctions fn = MakeFakeFunctions();
    VulkanDevice device;
    assert(!device.Initialize(MakeFakeConfig(fn)));
    assert(!device.GetLastError().empty());
}

static void TestCreateHeapDefaultStatesAndFailures() {
    ResetFakeDriver();
    Fixture f;
    const auto& types = f.device.GetHeapTypes();

    HeapHandle local = f.Heap(0, ResourceHeapType::Buffers, 1 << 16);
    HeapHandle upload = f.Heap(1, ResourceHeapType::Buffers, 1 << 16);
    HeapHandle readback = f.Heap(2, ResourceHeapType::Buffers, 1 << 16);
    const HeapHandle heaps[3] = {local, upload, readback};
    const ResourceState expected[3] = {ResourceState::Common, ResourceState::GenericRead, ResourceState::CopyDest};
    for (int i = 0; i < 3; ++i) {
        BufferHandle b = f.device.BindBufferMemory(heaps[i], 0, f.Buffer(256)).orThrow();
        assert(f.device.GetBufferInfo(b).value().state == expected[i]);
    }

    HeapType bogus;
    bogus.id = 17;
    assert(CodeOf(f.device.CreateHeap(bogus, ResourceHeapType::Buffers, 1024)) == ErrorCode::InvalidArgument);
    assert(CodeOf(f.device.CreateHeap(types[0], ResourceHeapType::Buffers, 0)) == ErrorCode::InvalidArgument);

    State().failAllocate = true;
    Result<HeapHandle> oom = f.device.CreateHeap(types[0], ResourceHeapType::Images, 1024);
    assert(CodeOf(oom) == ErrorCode::OutOfMemory);
    assert(oom.error().vkResult == VK_ERROR_OUT_OF_DEVICE_MEMORY);
}

static void TestAnyHeapNeedsHeterogeneousSupport() {
    ResetFakeDriver();
    State().bufferImageGranularity = 1024;
    Fixture f;
    assert(!f.device.GetCapabilities().heterogeneousHeaps);
    assert(CodeOf(f.device.CreateHeap(f.device.GetHeapTypes()[0], ResourceHeapType::Any, 1 << 20)) ==
           ErrorCode::UnsupportedType);
}

static void TestBufferRoundTripAndDestroy() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle heap = f.Heap(1, ResourceHeapType::Buffers, 4096);

    UnboundBuffer ub = f.Buffer(1000, 16);
    assert(ub.GetRequirements().size == 1024);
    assert(ub.GetRequirements().alignment == 256);
    assert(!ub.IsConsumed());

    const int liveBefore = State().liveBuffers;
    Result<BufferHandle> bound = f.device.BindBufferMemory(heap, 256, std::move(ub));
    assert(bound.ok());
    assert(ub.IsConsumed());
    assert(State().liveBuffers == liveBefore + 1);
    assert(State().lastBindOffset == 256);

    BoundBufferInfo info = f.device.GetBufferInfo(bound.value()).value();
    assert(info.size == 1000);
    assert(info.stride == 16);
    assert(info.heap.id == heap.id);
    assert(info.offset == 256);

    f.device.DestroyBuffer(bound.value());
    assert(State().liveBuffers == liveBefore);
    assert(!f.device.GetBufferInfo(bound.value()).ok());
    // 再次销毁为空操作
    f.device.DestroyBuffer(bound.value());
    assert(State().liveBuffers == liveBefore);

    assert(CodeOf(f.device.CreateBuffer(0, 0, BufferUsage::Vertex)) == ErrorCode::InvalidArgument);
}

static void TestBindValidationOrder() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle heap = f.Heap(1, ResourceHeapType::Buffers, 4096);
    HeapHandle images = f.Heap(0, ResourceHeapType::Images, 4096);
    const int createsBefore = State().createBufferCalls;

    UnboundBuffer ub = f.Buffer(1000);  // 需求 1024 / 256
    // 3584 + 1024 > 4096
    assert(CodeOf(f.device.BindBufferMemory(heap, 3584, std::move(ub))) == ErrorCode::OutOfHeap);
    // 越界且未对齐：先报告 OutOfHeap
    assert(CodeOf(f.device.BindBufferMemory(heap, 4000, std::move(ub))) == ErrorCode::OutOfHeap);
    // 溢出的偏移同样是 OutOfHeap
    assert(CodeOf(f.device.BindBufferMemory(heap, ~0ull - 10, std::move(ub))) == ErrorCode::OutOfHeap);
    assert(CodeOf(f.device.BindBufferMemory(heap, 100, std::move(ub))) == ErrorCode::Misaligned);
    assert(CodeOf(f.device.BindBufferMemory(images, 0, std::move(ub))) == ErrorCode::IncompatibleHeap);
    assert(CodeOf(f.device.BindBufferMemory(HeapHandle{}, 0, std::move(ub))) == ErrorCode::InvalidArgument);
    assert(State().createBufferCalls == createsBefore);
    assert(!ub.IsConsumed());

    // 恰好填满
    assert(f.device.BindBufferMemory(heap, 3072, std::move(ub)).ok());
    assert(ub.IsConsumed());
    // 已消耗：即便其他参数也不合法，先报告 AlreadyBound
    assert(CodeOf(f.device.BindBufferMemory(heap, 4000, std::move(ub))) == ErrorCode::AlreadyBound);
    assert(State().createBufferCalls == createsBefore + 1);

    // 移走后的源同样视为已消耗
    UnboundBuffer a = f.Buffer(64);
    UnboundBuffer b = std::move(a);
    assert(a.IsConsumed());
    assert(!b.IsConsumed());
    assert(CodeOf(f.device.BindBufferMemory(heap, 0, std::move(a))) == ErrorCode::AlreadyBound);

    // 内存类型不在需求位掩码内
    State().bufferTypeBits = 0x1;
    UnboundBuffer c = f.Buffer(64);
    assert(CodeOf(f.device.BindBufferMemory(heap, 0, std::move(c))) == ErrorCode::IncompatibleHeap);
}

static void TestImageCreationAndHeapCategories() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle images = f.Heap(0, ResourceHeapType::Images, 1 << 20);
    HeapHandle targets = f.Heap(0, ResourceHeapType::Targets, 1 << 20);
    HeapHandle any = f.Heap(0, ResourceHeapType::Any, 1 << 20);

    UnboundImage sampled = f.Image(ImageKind::D2(64, 64), kRgba8, BindFlags::ShaderResource);
    assert(sampled.GetRequirements().size == 32768);
    assert(CodeOf(f.device.BindImageMemory(targets, 0, std::move(sampled))) == ErrorCode::IncompatibleHeap);
    Result<TextureHandle> t = f.device.BindImageMemory(images, 4096, std::move(sampled));
    assert(t.ok());
    BoundImageInfo info = f.device.GetImageInfo(t.value()).value();
    assert(info.kind.width == 64);
    assert(info.format == kRgba8);
    assert(info.offset == 4096);
    assert(info.state == ResourceState::Common);

    UnboundImage rt = f.Image(ImageKind::D2(64, 64), kRgba8, BindFlags::RenderTarget | BindFlags::ShaderResource);
    assert(CodeOf(f.device.BindImageMemory(images, 0, std::move(rt))) == ErrorCode::IncompatibleHeap);
    assert(f.device.BindImageMemory(targets, 0, std::move(rt)).ok());

    UnboundImage mixed = f.Image(ImageKind::D2(16, 16), kRgba8, BindFlags::ShaderResource);
    assert(f.device.BindImageMemory(any, 0, std::move(mixed)).ok());

    // 图像需求位只含类型 0
    HeapHandle upload = f.Heap(1, ResourceHeapType::Images, 1 << 20);
    UnboundImage wrongType = f.Image(ImageKind::D2(16, 16), kRgba8, BindFlags::ShaderResource);
    assert(CodeOf(f.device.BindImageMemory(upload, 0, std::move(wrongType))) == ErrorCode::IncompatibleHeap);

    Result<UnboundImage> badFormat =
        f.device.CreateImage(ImageKind::D2(4, 4), 1, Format{SurfaceType::R4_G4, ChannelType::Srgb},
                             BindFlags::ShaderResource);
    assert(CodeOf(badFormat) == ErrorCode::UnsupportedFormat);
    assert(badFormat.error().format.surface == SurfaceType::R4_G4);
    assert(CodeOf(f.device.CreateImage(ImageKind::D2(0, 4), 1, kRgba8, BindFlags::ShaderResource)) ==
           ErrorCode::InvalidArgument);
    assert(CodeOf(f.device.CreateImage(ImageKind::D2(4, 4), 0, kRgba8, BindFlags::ShaderResource)) ==
           ErrorCode::InvalidArgument);
    assert(CodeOf(f.device.CreateImage(ImageKind::D2(4, 4, 1, 3), 1, kRgba8, BindFlags::ShaderResource)) ==
           ErrorCode::InvalidArgument);
}

static void TestViews() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle targets = f.Heap(0, ResourceHeapType::Targets, 1 << 20);
    HeapHandle images = f.Heap(0, ResourceHeapType::Images, 1 << 20);
    TextureHandle color =
        f.device.BindImageMemory(targets, 0, f.Image(ImageKind::D2(32, 32), kRgba8, BindFlags::RenderTarget))
            .orThrow();
    TextureHandle depth =
        f.device
            .BindImageMemory(targets, 1 << 16, f.Image(ImageKind::D2(32, 32), kDepth32, BindFlags::DepthStencil))
            .orThrow();
    TextureHandle sampled =
        f.device.BindImageMemory(images, 0, f.Image(ImageKind::D2(32, 32), kRgba8, BindFlags::ShaderResource))
            .orThrow();

    // RTV：槽内为 VkImageView
    RenderTargetViewHandle rtv = f.device.ViewImageAsRenderTarget(color, kRgba8).orThrow();
    DualHandle rtvSlot = f.device.GetDescriptor(rtv);
    VkImageView stored = VK_NULL_HANDLE;
    std::memcpy(&stored, reinterpret_cast<const void*>(rtvSlot.cpu), sizeof(stored));
    assert(stored != VK_NULL_HANDLE);
    assert(rtvSlot.gpu == 0);
    assert(State().lastViewInfo.subresourceRange.aspectMask == VK_IMAGE_ASPECT_COLOR_BIT);
    assert(f.device.GetRenderTargetHeap().GetAllocatedHandles() == 1);

    assert(CodeOf(f.device.ViewImageAsRenderTarget(color, kDepth32)) == ErrorCode::BadFormat);
    assert(CodeOf(f.device.ViewImageAsRenderTarget(color, kRgba8, 1)) == ErrorCode::InvalidArgument);
    assert(CodeOf(f.device.ViewImageAsRenderTarget(color, kRgba8, 0, 1)) == ErrorCode::InvalidArgument);
    assert(CodeOf(f.device.ViewImageAsRenderTarget(TextureHandle{}, kRgba8)) == ErrorCode::InvalidArgument);
    assert(f.device.GetRenderTargetHeap().GetAllocatedHandles() == 1);

    // DSV
    assert(CodeOf(f.device.ViewImageAsDepthStencil(depth, kRgba8)) == ErrorCode::BadFormat);
    DepthStencilViewHandle dsv = f.device.ViewImageAsDepthStencil(depth, kDepth32).orThrow();
    assert(State().lastViewInfo.subresourceRange.aspectMask == VK_IMAGE_ASPECT_DEPTH_BIT);
    assert(f.device.GetDescriptor(dsv).cpu != 0);

    // SRV：描述符缓冲中写入 SAMPLED_IMAGE 描述符，地址连续
    ShaderResourceViewHandle srv0 = f.device.ViewImageAsShaderResource(sampled, kRgba8).orThrow();
    ShaderResourceViewHandle srv1 = f.device.ViewImageAsShaderResource(sampled, kRgba8).orThrow();
    assert(State().lastDescriptorType == VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE);
    DualHandle d0 = f.device.GetDescriptor(srv0);
    DualHandle d1 = f.device.GetDescriptor(srv1);
    assert(d0.gpu != 0);
    assert(d1.gpu == d0.gpu + 32);
    assert(d1.cpu == d0.cpu + 32);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(d0.cpu);
    assert(bytes[0] == 0xA0 + VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE);
    assert(bytes[31] == 0xA0 + VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE);

    // 采样器
    SamplerDesc sd;
    sd.maxAnisotropy = 8.0f;
    SamplerHandle sampler = f.device.CreateSampler(sd).orThrow();
    assert(State().lastDescriptorType == VK_DESCRIPTOR_TYPE_SAMPLER);
    assert(f.device.GetDescriptor(sampler).gpu != 0);
    assert(f.device.GetSamplerHeap().GetAllocatedHandles() == 1);
    assert(State().liveSamplers == 1);

    const int views = State().liveViews;
    assert(views == 4);
    f.device.DestroyRenderTargetView(rtv);
    f.device.DestroyDepthStencilView(dsv);
    f.device.DestroyShaderResourceView(srv0);
    f.device.DestroySampler(sampler);
    assert(State().liveViews == 1);
    assert(State().liveSamplers == 0);
    // 槽位不回收
    assert(f.device.GetShaderResourceHeap().GetAllocatedHandles() == 2);
}

static void TestUnsupportedViewsThrow() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle images = f.Heap(0, ResourceHeapType::Images, 1 << 22);
    TextureHandle cube =
        f.device.BindImageMemory(images, 0, f.Image(ImageKind::Cube(16), kRgba8, BindFlags::ShaderResource))
            .orThrow();
    TextureHandle msaa =
        f.device
            .BindImageMemory(images, 1 << 20, f.Image(ImageKind::D2(16, 16, 1, 4), kRgba8, BindFlags::ShaderResource))
            .orThrow();
    TextureHandle plain =
        f.device.BindImageMemory(images, 1 << 21, f.Image(ImageKind::D2(16, 16), kRgba8, BindFlags::ShaderResource))
            .orThrow();

    int thrown = 0;
    try {
        (void)f.device.ViewImageAsShaderResource(cube, kRgba8);
    } catch (const NotImplementedError&) {
        ++thrown;
    }
    try {
        (void)f.device.ViewImageAsShaderResource(msaa, kRgba8);
    } catch (const NotImplementedError&) {
        ++thrown;
    }
    try {
        (void)f.device.ViewImageAsUnorderedAccess(plain, kRgba8);
    } catch (const NotImplementedError&) {
        ++thrown;
    }
    try {
        (void)f.device.ViewBufferAsConstant(BufferHandle{}, 0, 256);
    } catch (const NotImplementedError&) {
        ++thrown;
    }
    try {
        f.device.DestroyUnorderedAccessView(UnorderedAccessViewHandle{});
    } catch (const NotImplementedError&) {
        ++thrown;
    }
    try {
        f.device.DestroyConstantBufferView(ConstantBufferViewHandle{});
    } catch (const NotImplementedError&) {
        ++thrown;
    }
    assert(thrown == 6);
    assert(State().liveViews == 0);
}

static void TestViewHeapExhaustion() {
    ResetFakeDriver();
    DescriptorHeapCapacities caps;
    caps.renderTargets = 1;
    caps.samplers = 1;
    Fixture f(caps);
    HeapHandle targets = f.Heap(0, ResourceHeapType::Targets, 1 << 20);
    TextureHandle color =
        f.device.BindImageMemory(targets, 0, f.Image(ImageKind::D2(8, 8), kRgba8, BindFlags::RenderTarget))
            .orThrow();

    assert(f.device.ViewImageAsRenderTarget(color, kRgba8).ok());
    assert(CodeOf(f.device.ViewImageAsRenderTarget(color, kRgba8)) == ErrorCode::OutOfHeap);
    assert(State().liveViews == 1);
    assert(f.device.GetRenderTargetHeap().GetAllocatedHandles() == 1);

    assert(f.device.CreateSampler(SamplerDesc{}).ok());
    assert(CodeOf(f.device.CreateSampler(SamplerDesc{})) == ErrorCode::OutOfHeap);
    assert(State().liveSamplers == 1);
}

static void TestMapping() {
    ResetFakeDriver();
    ScopedCountingLogger log;
    Fixture f;
    HeapHandle upload = f.Heap(1, ResourceHeapType::Buffers, 1 << 16);
    HeapHandle readback = f.Heap(2, ResourceHeapType::Buffers, 1 << 16);
    HeapHandle local = f.Heap(0, ResourceHeapType::Buffers, 1 << 16);
    BufferHandle buf = f.device.BindBufferMemory(upload, 512, f.Buffer(1000)).orThrow();
    const int mapsBefore = State().mapCalls;

    assert(CodeOf(f.device.WriteMappingRaw(buf, 0, 1001)) == ErrorCode::OutOfBounds);
    assert(CodeOf(f.device.WriteMappingRaw(buf, 20, 10)) == ErrorCode::OutOfBounds);
    assert(State().mapCalls == mapsBefore);

    MappedRange a = f.device.WriteMappingRaw(buf, 16, 32).orThrow();
    MappedRange b = f.device.WriteMappingRaw(buf, 0, 1000).orThrow();
    assert(State().mapCalls == mapsBefore + 1);
    assert(b.data + 16 == a.data);
    const std::uint8_t payload[4] = {1, 2, 3, 4};
    std::memcpy(a.data, payload, sizeof(payload));
    assert(b.data[16] == 1 && b.data[19] == 4);

    const int unmapsBefore = State().unmapCalls;
    f.device.UnmapMappingRaw(a.token);
    assert(State().unmapCalls == unmapsBefore);
    f.device.UnmapMappingRaw(b.token);
    assert(State().unmapCalls == unmapsBefore + 1);
    // 一致内存不刷新
    assert(State().flushCalls == 0);

    // 非一致内存：按 nonCoherentAtomSize(64) 对齐刷新
    BufferHandle rb = f.device.BindBufferMemory(readback, 256, f.Buffer(512)).orThrow();
    MappedRange r = f.device.WriteMappingRaw(rb, 10, 20).orThrow();
    f.device.UnmapMappingRaw(r.token);
    assert(State().flushCalls == 1);
    assert(State().lastFlush.offset == 256);
    assert(State().lastFlush.size == 64);

    // 不可 CPU 访问
    BufferHandle gpuOnly = f.device.BindBufferMemory(local, 0, f.Buffer(64)).orThrow();
    assert(CodeOf(f.device.WriteMappingRaw(gpuOnly, 0, 64)) == ErrorCode::IncompatibleHeap);

    // 未知令牌只记录 error
    assert(log.Errors() == 0);
    f.device.UnmapMappingRaw(MappingToken{999999});
    assert(log.Errors() == 1);
}

static void TestSelfMoveKeepsUnboundResource() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle heap = f.Heap(1, ResourceHeapType::Buffers, 1 << 16);
    UnboundBuffer buffer = f.Buffer(128);
    UnboundBuffer& bufferAlias = buffer;
    buffer = std::move(bufferAlias);
    assert(!buffer.IsConsumed());
    assert(buffer.GetSize() == 128);
    assert(f.device.BindBufferMemory(heap, 0, std::move(buffer)).ok());

    HeapHandle images = f.Heap(0, ResourceHeapType::Images, 1 << 20);
    UnboundImage image = f.Image(ImageKind::D2(8, 8), kRgba8, BindFlags::ShaderResource);
    UnboundImage& imageAlias = image;
    image = std::move(imageAlias);
    assert(!image.IsConsumed());
    assert(f.device.BindImageMemory(images, 0, std::move(image)).ok());
}

static void TestFramebufferGathersViews() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle targets = f.Heap(0, ResourceHeapType::Targets, 1 << 20);
    TextureHandle color =
        f.device.BindImageMemory(targets, 0, f.Image(ImageKind::D2(32, 32), kRgba8, BindFlags::RenderTarget))
            .orThrow();
    TextureHandle depth =
        f.device
            .BindImageMemory(targets, 1 << 16, f.Image(ImageKind::D2(32, 32), kDepth32, BindFlags::DepthStencil))
            .orThrow();
    RenderTargetViewHandle rtv = f.device.ViewImageAsRenderTarget(color, kRgba8).orThrow();
    DepthStencilViewHandle dsv = f.device.ViewImageAsDepthStencil(depth, kDepth32).orThrow();

    AttachmentDesc colorAttachment;
    colorAttachment.format = kRgba8;
    AttachmentDesc depthAttachment;
    depthAttachment.format = kDepth32;
    SubpassDesc sp;
    sp.colorAttachments = {0};
    sp.depthStencilAttachment = 1;
    RenderPass pass = f.device.CreateRenderPass({colorAttachment, depthAttachment}, {sp}).orThrow();

    Framebuffer fb = f.device.CreateFramebuffer(pass, {rtv}, {dsv}, 32, 32).orThrow();
    assert(fb.colors.size() == 1 && fb.depthStencil.size() == 1);
    VkImageView rtvView = VK_NULL_HANDLE;
    std::memcpy(&rtvView, reinterpret_cast<const void*>(f.device.GetDescriptor(rtv).cpu), sizeof(rtvView));
    assert(fb.colors[0] == rtvView);
    assert(fb.depthStencil[0] != VK_NULL_HANDLE);
    assert(fb.width == 32 && fb.height == 32 && fb.layers == 1);

    assert(CodeOf(f.device.CreateFramebuffer(pass, {rtv}, {dsv}, 0, 32)) == ErrorCode::InvalidArgument);
    assert(CodeOf(f.device.CreateFramebuffer(pass, {rtv, rtv}, {dsv}, 32, 32)) == ErrorCode::InvalidArgument);
    Result<Framebuffer> unknown = f.device.CreateFramebuffer(pass, {rtv}, {DepthStencilViewHandle{}}, 32, 32);
    assert(CodeOf(unknown) == ErrorCode::InvalidArgument);
    assert(unknown.error().index == 0);

    bool threw = false;
    try {
        f.device.DestroyFramebuffer(fb);
    } catch (const NotImplementedError&) {
        threw = true;
    }
    assert(threw);
}

static void TestReadMappingNotImplemented() {
    ResetFakeDriver();
    Fixture f;
    HeapHandle readback = f.Heap(2, ResourceHeapType::Buffers, 1 << 16);
    BufferHandle buf = f.device.BindBufferMemory(readback, 0, f.Buffer(256)).orThrow();
    const int mapsBefore = State().mapCalls;
    bool threw = false;
    try {
        (void)f.device.ReadMappingRaw(buf, 0, 256);
    } catch (const NotImplementedError&) {
        threw = true;
    }
    assert(threw);
    assert(State().mapCalls == mapsBefore);
}

static void TestShutdownReleasesEverything() {
    ResetFakeDriver();
    {
        Fixture f;
        HeapHandle heap = f.Heap(0, ResourceHeapType::Any, 1 << 20);
        HeapHandle upload = f.Heap(1, ResourceHeapType::Buffers, 1 << 16);
        TextureHandle img =
            f.device.BindImageMemory(heap, 0, f.Image(ImageKind::D2(8, 8), kRgba8, BindFlags::ShaderResource))
                .orThrow();
        (void)f.device.ViewImageAsShaderResource(img, kRgba8).orThrow();
        BufferHandle buf = f.device.BindBufferMemory(upload, 0, f.Buffer(64)).orThrow();
        (void)f.device.WriteMappingRaw(buf, 0, 64).orThrow();  // 映射未交回
        (void)f.device.CreateSampler(SamplerDesc{}).orThrow();
        assert(State().liveImages == 1);
        assert(!State().memories.empty());

        f.device.Shutdown();
        assert(State().liveBuffers == 0);
        assert(State().liveImages == 0);
        assert(State().liveViews == 0);
        assert(State().liveSamplers == 0);
        assert(State().memories.empty());
    }
    // 析构时再次 Shutdown 为空操作
    assert(State().memories.empty());
}

int main() {
    TestInitializeReportsHeapTypesAndDescriptorHeaps();
    TestInitializeWithoutDescriptorBufferFails();
    TestCreateHeapDefaultStatesAndFailures();
    TestAnyHeapNeedsHeterogeneousSupport();
    TestBufferRoundTripAndDestroy();
    TestBindValidationOrder();
    TestImageCreationAndHeapCategories();
    TestViews();
    TestUnsupportedViewsThrow();
    TestViewHeapExhaustion();
    TestMapping();
    TestSelfMoveKeepsUnboundResource();
    TestFramebufferGathersViews();
    TestReadMappingNotImplemented();
    TestShutdownReleasesEverything();
    return 0;
}
