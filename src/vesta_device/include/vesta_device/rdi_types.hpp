/**
 * @file rdi_types.hpp
 * @brief RDI (Rendering Device Interface) 资源句柄、格式、用途与状态描述类型
 *
 * 两个后端（即时上下文 OpenGL 与显式堆 Vulkan）共享的抽象数据模型：
 * Handle<T>、Format(表面布局 + 通道类型)、Usage、ImageKind、管线状态等。
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vesta_device {

// =============================================================================
// 资源句柄
// =============================================================================

/** 类型安全资源句柄，id=0 表示无效 */
template <typename Tag>
struct Handle {
    std::uint64_t id = 0;

    bool IsValid() const { return id != 0; }
    bool operator==(const Handle& other) const { return id == other.id; }
    bool operator!=(const Handle& other) const { return id != other.id; }
};

struct Buffer_Tag {};
struct Texture_Tag {};
struct Shader_Tag {};
struct InputLayout_Tag {};
struct ShaderResourceView_Tag {};
struct RenderTargetView_Tag {};
struct DepthStencilView_Tag {};
struct UnorderedAccessView_Tag {};
struct ConstantBufferView_Tag {};
struct Sampler_Tag {};
struct RasterizerState_Tag {};
struct DepthStencilState_Tag {};
struct BlendState_Tag {};
struct Heap_Tag {};
struct Pipeline_Tag {};
struct PipelineLayout_Tag {};
struct Fence_Tag {};
struct Semaphore_Tag {};

using BufferHandle              = Handle<Buffer_Tag>;
using TextureHandle             = Handle<Texture_Tag>;
using ShaderHandle              = Handle<Shader_Tag>;
using InputLayoutHandle         = Handle<InputLayout_Tag>;
using ShaderResourceViewHandle  = Handle<ShaderResourceView_Tag>;
using RenderTargetViewHandle    = Handle<RenderTargetView_Tag>;
using DepthStencilViewHandle    = Handle<DepthStencilView_Tag>;
using UnorderedAccessViewHandle = Handle<UnorderedAccessView_Tag>;
using ConstantBufferViewHandle  = Handle<ConstantBufferView_Tag>;
using SamplerHandle             = Handle<Sampler_Tag>;
using RasterizerStateHandle     = Handle<RasterizerState_Tag>;
using DepthStencilStateHandle   = Handle<DepthStencilState_Tag>;
using BlendStateHandle          = Handle<BlendState_Tag>;
using HeapHandle                = Handle<Heap_Tag>;
using PipelineHandle            = Handle<Pipeline_Tag>;
using PipelineLayoutHandle      = Handle<PipelineLayout_Tag>;
using FenceHandle               = Handle<Fence_Tag>;
using SemaphoreHandle           = Handle<Semaphore_Tag>;

// =============================================================================
// 每类绑定槽上限（命令流按上限整批重绑）
// =============================================================================

constexpr std::uint32_t kMaxVertexAttributes = 16;
constexpr std::uint32_t kMaxConstantBuffers = 14;
constexpr std::uint32_t kMaxResourceViews = 16;
constexpr std::uint32_t kMaxSamplers = 16;
constexpr std::uint32_t kMaxColorTargets = 8;

// =============================================================================
// 格式：表面布局 + 通道数值类型
// =============================================================================

enum class SurfaceType {
    R4_G4,
    R4_G4_B4_A4,
    R5_G6_B5,
    R8,
    R8_G8,
    R8_G8_B8_A8,
    B8_G8_R8_A8,
    R10_G10_B10_A2,
    R11_G11_B10,
    R16,
    R16_G16,
    R16_G16_B16,
    R16_G16_B16_A16,
    R32,
    R32_G32,
    R32_G32_B32,
    R32_G32_B32_A32,
    D16,
    D24,
    D24_S8,
    D32,
    D32_S8,
};

enum class ChannelType {
    Int,
    Uint,
    Inorm,
    Unorm,
    Float,
    Srgb,
};

struct Format {
    SurfaceType surface = SurfaceType::R8_G8_B8_A8;
    ChannelType channel = ChannelType::Unorm;

    bool operator==(const Format& other) const {
        return surface == other.surface && channel == other.channel;
    }
    bool operator!=(const Format& other) const { return !(*this == other); }
};

/** 每个像素（texel）的总位数 */
std::uint32_t GetTotalBits(SurfaceType surface);
bool IsDepthSurface(SurfaceType surface);
bool HasStencil(SurfaceType surface);
const char* ToString(SurfaceType surface);
const char* ToString(ChannelType channel);

// =============================================================================
// 资源用途（生命周期内不可变，决定允许的更新策略）
// =============================================================================

enum class CpuAccess : std::uint32_t {
    Read      = 1u << 0,
    Write     = 1u << 1,
    ReadWrite = (1u << 0) | (1u << 1),
};

inline bool HasCpuAccess(CpuAccess mask, CpuAccess bit) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(bit)) != 0;
}

enum class MapMode {
    ReadOnly,
    WriteOnly,
    ReadWrite,
};

enum class UsageKind {
    Immutable,
    GpuOnly,
    Dynamic,
    CpuOnly,
    Persistent,
};

struct Usage {
    UsageKind kind = UsageKind::GpuOnly;
    CpuAccess access = CpuAccess::Write;  // 仅 CpuOnly 有效
    MapMode mapMode = MapMode::WriteOnly; // 仅 Persistent 有效

    static Usage Immutable() { return {UsageKind::Immutable, CpuAccess::Write, MapMode::WriteOnly}; }
    static Usage GpuOnly() { return {UsageKind::GpuOnly, CpuAccess::Write, MapMode::WriteOnly}; }
    static Usage Dynamic() { return {UsageKind::Dynamic, CpuAccess::Write, MapMode::WriteOnly}; }
    static Usage CpuOnly(CpuAccess a) { return {UsageKind::CpuOnly, a, MapMode::WriteOnly}; }
    static Usage Persistent(MapMode m) { return {UsageKind::Persistent, CpuAccess::Write, m}; }
};

enum class BufferRole {
    Vertex,
    Index,
    Constant,
    Staging,
};

enum class BindFlags : std::uint32_t {
    None           = 0,
    ShaderResource = 1u << 0,
    RenderTarget   = 1u << 1,
    DepthStencil   = 1u << 2,
    UnorderedAccess = 1u << 3,
    TransferSrc    = 1u << 4,
    TransferDst    = 1u << 5,
};

inline BindFlags operator|(BindFlags a, BindFlags b) {
    return static_cast<BindFlags>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline BindFlags& operator|=(BindFlags& a, BindFlags b) {
    a = a | b;
    return a;
}

inline bool HasBindFlag(BindFlags mask, BindFlags bit) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(bit)) != 0;
}

/** 资源引用：原生句柄 + 用途标记 */
struct BufferResource {
    BufferHandle handle;
    Usage usage;
    std::size_t size = 0;
};

struct TextureResource {
    TextureHandle handle;
    Usage usage;
};

// =============================================================================
// 图像维度与子资源
// =============================================================================

enum class ImageDimension {
    D1,
    D2,
    D3,
    Cube,
};

struct ImageKind {
    ImageDimension dimension = ImageDimension::D2;
    std::uint32_t width = 1;
    std::uint32_t height = 1;
    std::uint32_t depth = 1;
    std::uint32_t layers = 1;
    std::uint32_t samples = 1;

    static ImageKind D1(std::uint32_t w, std::uint32_t layers = 1) {
        return {ImageDimension::D1, w, 1, 1, layers, 1};
    }
    static ImageKind D2(std::uint32_t w, std::uint32_t h, std::uint32_t layers = 1,
                        std::uint32_t samples = 1) {
        return {ImageDimension::D2, w, h, 1, layers, samples};
    }
    static ImageKind D3(std::uint32_t w, std::uint32_t h, std::uint32_t d) {
        return {ImageDimension::D3, w, h, d, 1, 1};
    }
    static ImageKind Cube(std::uint32_t size, std::uint32_t cubes = 1) {
        return {ImageDimension::Cube, size, size, 1, cubes * 6u, 1};
    }

    /** 指定 mip 级别的尺寸（每级减半，最小 1；D1 高度、非 D3 深度恒为 1） */
    void GetLevelDimensions(std::uint32_t level, std::uint32_t& w, std::uint32_t& h,
                            std::uint32_t& d) const;
};

/** 立方体面，固定映射到数组切片 0..5 */
enum class CubeFace {
    PosX,
    NegX,
    PosY,
    NegY,
    PosZ,
    NegZ,
};

/** 纹理局部更新描述：目标盒（texel）+ 格式 + mip */
struct ImageInfo {
    std::uint32_t xoffset = 0;
    std::uint32_t yoffset = 0;
    std::uint32_t zoffset = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 1;
    std::uint32_t depth = 1;
    Format format;
    std::uint32_t mipLevel = 0;
};

/** 轴对齐更新盒：纹理以 texel 为单位，缓冲以字节为单位 */
struct Box {
    std::uint32_t left = 0;
    std::uint32_t top = 0;
    std::uint32_t front = 0;
    std::uint32_t right = 0;
    std::uint32_t bottom = 1;
    std::uint32_t back = 1;
};

// =============================================================================
// 着色器与管线相关枚举
// =============================================================================

enum class ShaderStage {
    Vertex,
    TessControl,
    TessEvaluation,
    Geometry,
    Fragment,
    Compute,
};

/** 图形管线五个阶段，按绑定顺序 */
constexpr std::uint32_t kGraphicsStageCount = 5;
constexpr std::array<ShaderStage, kGraphicsStageCount> kGraphicsStages = {
    ShaderStage::Vertex, ShaderStage::TessControl, ShaderStage::TessEvaluation,
    ShaderStage::Geometry, ShaderStage::Fragment,
};

inline std::uint32_t StageIndex(ShaderStage s) { return static_cast<std::uint32_t>(s); }

enum class PrimitiveTopology {
    PointList,
    LineList,
    LineStrip,
    TriangleList,
    TriangleStrip,
};

enum class IndexFormat {
    Uint16,
    Uint32,
};

enum class CompareOp {
    Never,
    Less,
    Equal,
    LessOrEqual,
    Greater,
    NotEqual,
    GreaterOrEqual,
    Always,
};

enum class StencilOp {
    Keep,
    Zero,
    Replace,
    IncrementClamp,
    DecrementClamp,
    Invert,
    IncrementWrap,
    DecrementWrap,
};

enum class BlendFactor {
    Zero,
    One,
    SrcColor,
    OneMinusSrcColor,
    DstColor,
    OneMinusDstColor,
    SrcAlpha,
    OneMinusSrcAlpha,
    DstAlpha,
    OneMinusDstAlpha,
    ConstantColor,
    OneMinusConstantColor,
};

enum class BlendOp {
    Add,
    Subtract,
    ReverseSubtract,
    Min,
    Max,
};

enum class FillMode {
    Solid,
    Wireframe,
};

enum class CullMode {
    None,
    Front,
    Back,
};

enum class FilterMode {
    Nearest,
    Linear,
};

enum class AddressMode {
    Repeat,
    MirroredRepeat,
    ClampToEdge,
    ClampToBorder,
};

// =============================================================================
// 固定功能状态
// =============================================================================

struct BlendState {
    bool blendEnable = false;
    BlendFactor srcColorBlendFactor = BlendFactor::One;
    BlendFactor dstColorBlendFactor = BlendFactor::Zero;
    BlendOp colorBlendOp = BlendOp::Add;
    BlendFactor srcAlphaBlendFactor = BlendFactor::One;
    BlendFactor dstAlphaBlendFactor = BlendFactor::Zero;
    BlendOp alphaBlendOp = BlendOp::Add;
    std::uint8_t writeMask = 0xF;  // RGBA
};

struct BlendDesc {
    bool alphaToCoverage = false;
    std::vector<BlendState> targets;  // 每个颜色目标一项；为空视为全部默认
};

struct StencilFaceState {
    StencilOp failOp = StencilOp::Keep;
    StencilOp depthFailOp = StencilOp::Keep;
    StencilOp passOp = StencilOp::Keep;
    CompareOp compareOp = CompareOp::Always;
};

struct DepthStencilState {
    bool depthTestEnable = true;
    bool depthWriteEnable = true;
    CompareOp depthCompareOp = CompareOp::Less;
    bool stencilTestEnable = false;
    std::uint8_t stencilReadMask = 0xFF;
    std::uint8_t stencilWriteMask = 0xFF;
    StencilFaceState front;
    StencilFaceState back;
};

struct RasterizationState {
    FillMode fillMode = FillMode::Solid;
    CullMode cullMode = CullMode::Back;
    bool frontFaceCCW = true;
    bool depthClampEnable = false;
    bool scissorEnable = false;
    float lineWidth = 1.0f;
};

struct SamplerDesc {
    FilterMode minFilter = FilterMode::Linear;
    FilterMode magFilter = FilterMode::Linear;
    FilterMode mipFilter = FilterMode::Linear;
    AddressMode addressU = AddressMode::Repeat;
    AddressMode addressV = AddressMode::Repeat;
    AddressMode addressW = AddressMode::Repeat;
    float mipLodBias = 0.0f;
    float maxAnisotropy = 1.0f;
    bool compareEnable = false;
    CompareOp compareOp = CompareOp::Always;
    float minLod = 0.0f;
    float maxLod = 1000.0f;
};

struct Viewport {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float minDepth = 0.0f;
    float maxDepth = 1.0f;
};

/** ClearDepthStencil 的清除位 */
enum ClearFlags : std::uint32_t {
    kClearDepth   = 1u << 0,
    kClearStencil = 1u << 1,
};

struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

// =============================================================================
// 顶点输入
// =============================================================================

/** 顶点缓冲描述；rate=0 逐顶点，否则逐实例（步进为 rate） */
struct VertexBufferDesc {
    std::uint32_t stride = 0;
    std::uint32_t rate = 0;
};

struct VertexAttribute {
    std::uint32_t location = 0;
    std::uint32_t binding = 0;
    Format format;
    std::uint32_t offset = 0;
};

}  // namespace vesta_device
