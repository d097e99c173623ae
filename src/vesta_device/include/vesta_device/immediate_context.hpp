/**
 * @file immediate_context.hpp
 * @brief 即时上下文原生调用面：CommandInterpreter 与资源更新驱动的隐式状态接口
 *
 * 每个方法对应一个原生状态槽或一次原生调用；实现不做跨调用缓冲。
 * 计数参数 count 始终是该类别的槽上限（见 rdi_types.hpp kMax*）。
 */

#pragma once

#include <vesta_device/rdi_types.hpp>

#include <cstddef>
#include <cstdint>

#include <glm/vec4.hpp>

namespace vesta_device {

/**
 * 映射结果：CPU 指针、可写字节数与行/层跨度。
 * 缓冲时跨度与 texel 范围为 0；纹理时 width/height/depth 为所映射 mip 级别的 texel 范围。
 */
struct MappedSubresource {
    void* data = nullptr;
    std::size_t size = 0;
    std::uint32_t rowPitch = 0;
    std::uint32_t depthPitch = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t depth = 0;
};

class IImmediateContext {
public:
    virtual ~IImmediateContext() = default;

    // --- 管线阶段与输入装配 ---
    virtual void SetShader(ShaderStage stage, ShaderHandle shader) = 0;
    virtual void SetInputLayout(InputLayoutHandle layout) = 0;
    virtual void SetIndexBuffer(BufferHandle buffer, IndexFormat format, std::uint32_t offset) = 0;
    virtual void SetVertexBuffers(std::uint32_t startSlot, std::uint32_t count,
                                  const BufferHandle* buffers, const std::uint32_t* strides,
                                  const std::uint32_t* offsets) = 0;
    virtual void SetPrimitiveTopology(PrimitiveTopology topology) = 0;

    // --- 每阶段资源 ---
    virtual void SetConstantBuffers(ShaderStage stage, std::uint32_t startSlot, std::uint32_t count,
                                    const BufferHandle* buffers) = 0;
    virtual void SetShaderResources(ShaderStage stage, std::uint32_t startSlot, std::uint32_t count,
                                    const ShaderResourceViewHandle* views) = 0;
    virtual void SetSamplers(ShaderStage stage, std::uint32_t startSlot, std::uint32_t count,
                             const SamplerHandle* samplers) = 0;

    // --- 输出合并与固定功能状态 ---
    virtual void SetRenderTargets(std::uint32_t count, const RenderTargetViewHandle* colors,
                                  DepthStencilViewHandle depthStencil) = 0;
    virtual void SetViewport(const Viewport& viewport) = 0;
    virtual void SetScissor(const Rect& rect) = 0;
    virtual void SetRasterizerState(RasterizerStateHandle state) = 0;
    virtual void SetDepthStencilState(DepthStencilStateHandle state, std::uint32_t stencilRef) = 0;
    virtual void SetBlendState(BlendStateHandle state, const glm::vec4& blendFactor,
                               std::uint32_t sampleMask) = 0;

    // --- 资源写入 ---
    /** 驱动中转的子资源拷贝；box 以字节为单位（left..right） */
    virtual void UpdateSubresource(BufferHandle buffer, const Box& box, const void* data) = 0;
    /** 驱动中转的子资源拷贝；box 以 texel 为单位 */
    virtual void UpdateSubresource(TextureHandle texture, std::uint32_t subresource, const Box& box,
                                   const void* data, std::uint32_t rowPitch,
                                   std::uint32_t depthPitch) = 0;
    /** 以丢弃语义映射整个缓冲；失败返回 false */
    virtual bool MapDiscard(BufferHandle buffer, MappedSubresource& out) = 0;
    virtual void Unmap(BufferHandle buffer) = 0;
    /** 以丢弃语义映射纹理子资源；失败返回 false */
    virtual bool MapDiscard(TextureHandle texture, std::uint32_t subresource, MappedSubresource& out) = 0;
    virtual void Unmap(TextureHandle texture, std::uint32_t subresource) = 0;
    virtual void GenerateMips(ShaderResourceViewHandle view) = 0;

    // --- 清除 ---
    virtual void ClearRenderTargetView(RenderTargetViewHandle target, const glm::vec4& color) = 0;
    virtual void ClearDepthStencilView(DepthStencilViewHandle target, std::uint32_t flags,
                                       float depth, std::uint8_t stencil) = 0;

    // --- 绘制 ---
    virtual void Draw(std::uint32_t vertexCount, std::uint32_t startVertex) = 0;
    virtual void DrawInstanced(std::uint32_t vertexCount, std::uint32_t instanceCount,
                               std::uint32_t startVertex, std::uint32_t startInstance) = 0;
    virtual void DrawIndexed(std::uint32_t indexCount, std::uint32_t startIndex,
                             std::int32_t baseVertex) = 0;
    virtual void DrawIndexedInstanced(std::uint32_t indexCount, std::uint32_t instanceCount,
                                      std::uint32_t startIndex, std::int32_t baseVertex,
                                      std::uint32_t startInstance) = 0;
};

}  // namespace vesta_device
