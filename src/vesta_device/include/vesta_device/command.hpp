/**
 * @file command.hpp
 * @brief 抽象命令流：Command 变体、DataBuffer 与录制器 CommandBuffer
 *
 * 命令以句柄引用资源，更新字节存放于只追加的 DataBuffer，
 * 由命令内的 DataPointer{offset, size} 寻址。命令中的句柄必须比回放存活更久。
 */

#pragma once

#include <vesta_device/rdi_types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <glm/vec4.hpp>

namespace vesta_device {

// =============================================================================
// DataBuffer
// =============================================================================

struct DataPointer {
    std::size_t offset = 0;
    std::size_t size = 0;
};

/** 只追加的更新字节缓冲 */
class DataBuffer {
public:
    DataPointer Add(const void* data, std::size_t size);
    /** 越界指针返回空指针 */
    const std::uint8_t* Get(const DataPointer& ptr) const;

    void Reset() { bytes_.clear(); }
    std::size_t GetSize() const { return bytes_.size(); }

private:
    std::vector<std::uint8_t> bytes_;
};

// =============================================================================
// 命令变体
// =============================================================================

/** 各阶段着色器；无效句柄表示该阶段不绑定程序 */
struct Program {
    std::array<ShaderHandle, kGraphicsStageCount> stages{};

    ShaderHandle Get(ShaderStage s) const { return stages[StageIndex(s)]; }
};

using VertexBufferSet = std::array<BufferHandle, kMaxVertexAttributes>;
using StrideSet = std::array<std::uint32_t, kMaxVertexAttributes>;
using ConstantBufferSet = std::array<BufferHandle, kMaxConstantBuffers>;
using ResourceViewSet = std::array<ShaderResourceViewHandle, kMaxResourceViews>;
using SamplerSet = std::array<SamplerHandle, kMaxSamplers>;
using ColorTargetSet = std::array<RenderTargetViewHandle, kMaxColorTargets>;

namespace cmd {

struct BindProgram {
    Program program;
};

struct BindInputLayout {
    InputLayoutHandle layout;
};

struct BindIndex {
    BufferHandle buffer;
    IndexFormat format = IndexFormat::Uint16;
    std::uint32_t offset = 0;
};

struct BindVertexBuffers {
    VertexBufferSet buffers{};
    StrideSet strides{};
    StrideSet offsets{};
};

struct BindConstantBuffers {
    ShaderStage stage = ShaderStage::Vertex;
    ConstantBufferSet buffers{};
};

struct BindShaderResources {
    ShaderStage stage = ShaderStage::Vertex;
    ResourceViewSet views{};
};

struct BindSamplers {
    ShaderStage stage = ShaderStage::Vertex;
    SamplerSet samplers{};
};

struct BindPixelTargets {
    ColorTargetSet colors{};
    DepthStencilViewHandle depthStencil;
};

struct SetPrimitive {
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
};

struct SetViewport {
    Viewport viewport;
};

struct SetScissor {
    Rect rect;
};

struct SetRasterizer {
    RasterizerStateHandle state;
};

struct SetDepthStencil {
    DepthStencilStateHandle state;
    std::uint32_t stencilRef = 0;
};

struct SetBlend {
    BlendStateHandle state;
    glm::vec4 blendFactor{0.0f};
    std::uint32_t sampleMask = 0xFFFFFFFFu;
};

struct UpdateBuffer {
    BufferResource buffer;
    DataPointer data;
    std::size_t offset = 0;
};

struct UpdateTexture {
    TextureResource texture;
    ImageKind kind;
    std::optional<CubeFace> face;
    DataPointer data;
    ImageInfo info;
};

struct GenerateMips {
    ShaderResourceViewHandle view;
};

struct ClearColor {
    RenderTargetViewHandle target;
    glm::vec4 color{0.0f};
};

struct ClearDepthStencil {
    DepthStencilViewHandle target;
    std::uint32_t flags = kClearDepth | kClearStencil;
    float depth = 1.0f;
    std::uint8_t stencil = 0;
};

struct Draw {
    std::uint32_t vertexCount = 0;
    std::uint32_t startVertex = 0;
};

struct DrawInstanced {
    std::uint32_t vertexCount = 0;
    std::uint32_t instanceCount = 0;
    std::uint32_t startVertex = 0;
    std::uint32_t startInstance = 0;
};

struct DrawIndexed {
    std::uint32_t indexCount = 0;
    std::uint32_t startIndex = 0;
    std::int32_t baseVertex = 0;
};

struct DrawIndexedInstanced {
    std::uint32_t indexCount = 0;
    std::uint32_t instanceCount = 0;
    std::uint32_t startIndex = 0;
    std::int32_t baseVertex = 0;
    std::uint32_t startInstance = 0;
};

}  // namespace cmd

using Command = std::variant<
    cmd::BindProgram,
    cmd::BindInputLayout,
    cmd::BindIndex,
    cmd::BindVertexBuffers,
    cmd::BindConstantBuffers,
    cmd::BindShaderResources,
    cmd::BindSamplers,
    cmd::BindPixelTargets,
    cmd::SetPrimitive,
    cmd::SetViewport,
    cmd::SetScissor,
    cmd::SetRasterizer,
    cmd::SetDepthStencil,
    cmd::SetBlend,
    cmd::UpdateBuffer,
    cmd::UpdateTexture,
    cmd::GenerateMips,
    cmd::ClearColor,
    cmd::ClearDepthStencil,
    cmd::Draw,
    cmd::DrawInstanced,
    cmd::DrawIndexed,
    cmd::DrawIndexedInstanced>;

// =============================================================================
// 录制器
// =============================================================================

/** 命令 + 其更新字节；由上层录制，整体交给 CommandInterpreter 回放 */
class CommandBuffer {
public:
    void Push(Command command) { commands_.push_back(std::move(command)); }

    /** 复制字节到 DataBuffer 并录制 UpdateBuffer */
    void UpdateBuffer(const BufferResource& buffer, const void* data, std::size_t size,
                      std::size_t offset = 0);
    /** 复制字节到 DataBuffer 并录制 UpdateTexture */
    void UpdateTexture(const TextureResource& texture, const ImageKind& kind,
                       std::optional<CubeFace> face, const void* data, std::size_t size,
                       const ImageInfo& info);

    void Reset();

    const std::vector<Command>& GetCommands() const { return commands_; }
    const DataBuffer& GetData() const { return data_; }
    DataBuffer& GetData() { return data_; }

private:
    std::vector<Command> commands_;
    DataBuffer data_;
};

}  // namespace vesta_device
