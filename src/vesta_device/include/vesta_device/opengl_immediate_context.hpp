/**
 * @file opengl_immediate_context.hpp
 * @brief OpenGL 4.5 即时上下文后端
 *
 * 实现 IImmediateContext（供 CommandInterpreter 驱动）与本后端的资源创建。
 * 着色器阶段为可分离程序，挂在一个 program pipeline 上；
 * 常量缓冲绑定点 = 阶段 * kMaxConstantBuffers + 槽，纹理单元 = 阶段 * kMaxResourceViews + 槽。
 * GL 函数通过 SDL_GL_GetProcAddress 加载。
 */

#pragma once

#include <vesta_device/graphics_backend.hpp>
#include <vesta_device/immediate_context.hpp>
#include <vesta_device/rdi_types.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace vesta_device {

/** 初始化配置；window 非空时在其上创建 GL 上下文，否则使用当前上下文 */
struct OpenGLContextConfig {
    void* window = nullptr;
    bool debugOutput = false;
};

struct BufferDesc {
    std::size_t size = 0;
    BufferRole role = BufferRole::Vertex;
};

struct TextureDesc {
    ImageKind kind;
    std::uint32_t mipLevels = 1;
    Format format;
    BindFlags bind = BindFlags::ShaderResource;
};

/** 输入布局的顶点缓冲步进（按绑定槽索引） */
struct InputLayoutDesc {
    std::vector<VertexAttribute> attributes;
    std::vector<VertexBufferDesc> buffers;
};

class OpenGLImmediateContext : public IGraphicsBackend, public IImmediateContext {
public:
    OpenGLImmediateContext() = default;
    ~OpenGLImmediateContext() override;

    OpenGLImmediateContext(const OpenGLImmediateContext&) = delete;
    OpenGLImmediateContext& operator=(const OpenGLImmediateContext&) = delete;

    bool Initialize(const OpenGLContextConfig& config);

    // --- IGraphicsBackend ---
    Backend GetBackend() const override { return Backend::OpenGL; }
    const BackendCapabilities& GetCapabilities() const override { return capabilities_; }
    const std::string& GetLastError() const override { return lastError_; }
    void Shutdown() override;

    // --- 资源创建（失败返回无效句柄，原因见 GetLastError）---
    BufferResource CreateBuffer(const BufferDesc& desc, const Usage& usage, const void* data = nullptr);
    TextureResource CreateTexture(const TextureDesc& desc, const Usage& usage, const void* data = nullptr);
    /** 从 GLSL 源码创建可分离程序；链接日志写入 GetLastError */
    ShaderHandle CreateShader(ShaderStage stage, const std::string& source);
    InputLayoutHandle CreateInputLayout(const InputLayoutDesc& desc);
    ShaderResourceViewHandle CreateShaderResourceView(TextureHandle texture);
    RenderTargetViewHandle CreateRenderTargetView(TextureHandle texture, std::uint32_t mipLevel = 0,
                                                  std::uint32_t layer = 0);
    DepthStencilViewHandle CreateDepthStencilView(TextureHandle texture, std::uint32_t mipLevel = 0,
                                                  std::uint32_t layer = 0);
    SamplerHandle CreateSampler(const SamplerDesc& desc);
    RasterizerStateHandle CreateRasterizerState(const RasterizationState& desc);
    DepthStencilStateHandle CreateDepthStencilState(const DepthStencilState& desc);
    BlendStateHandle CreateBlendState(const BlendDesc& desc);

    void DestroyBuffer(BufferHandle handle);
    void DestroyTexture(TextureHandle handle);
    void DestroyShader(ShaderHandle handle);
    void DestroyInputLayout(InputLayoutHandle handle);
    void DestroyShaderResourceView(ShaderResourceViewHandle handle);
    void DestroyRenderTargetView(RenderTargetViewHandle handle);
    void DestroyDepthStencilView(DepthStencilViewHandle handle);
    void DestroySampler(SamplerHandle handle);
    void DestroyRasterizerState(RasterizerStateHandle handle);
    void DestroyDepthStencilState(DepthStencilStateHandle handle);
    void DestroyBlendState(BlendStateHandle handle);

    // --- IImmediateContext ---
    void SetShader(ShaderStage stage, ShaderHandle shader) override;
    void SetInputLayout(InputLayoutHandle layout) override;
    void SetIndexBuffer(BufferHandle buffer, IndexFormat format, std::uint32_t offset) override;
    void SetVertexBuffers(std::uint32_t startSlot, std::uint32_t count, const BufferHandle* buffers,
                          const std::uint32_t* strides, const std::uint32_t* offsets) override;
    void SetPrimitiveTopology(PrimitiveTopology topology) override;
    void SetConstantBuffers(ShaderStage stage, std::uint32_t startSlot, std::uint32_t count,
                            const BufferHandle* buffers) override;
    void SetShaderResources(ShaderStage stage, std::uint32_t startSlot, std::uint32_t count,
                            const ShaderResourceViewHandle* views) override;
    void SetSamplers(ShaderStage stage, std::uint32_t startSlot, std::uint32_t count,
                     const SamplerHandle* samplers) override;
    void SetRenderTargets(std::uint32_t count, const RenderTargetViewHandle* colors,
                          DepthStencilViewHandle depthStencil) override;
    void SetViewport(const Viewport& viewport) override;
    void SetScissor(const Rect& rect) override;
    void SetRasterizerState(RasterizerStateHandle state) override;
    void SetDepthStencilState(DepthStencilStateHandle state, std::uint32_t stencilRef) override;
    void SetBlendState(BlendStateHandle state, const glm::vec4& blendFactor,
                       std::uint32_t sampleMask) override;
    void UpdateSubresource(BufferHandle buffer, const Box& box, const void* data) override;
    void UpdateSubresource(TextureHandle texture, std::uint32_t subresource, const Box& box,
                           const void* data, std::uint32_t rowPitch,
                           std::uint32_t depthPitch) override;
    bool MapDiscard(BufferHandle buffer, MappedSubresource& out) override;
    void Unmap(BufferHandle buffer) override;
    bool MapDiscard(TextureHandle texture, std::uint32_t subresource, MappedSubresource& out) override;
    void Unmap(TextureHandle texture, std::uint32_t subresource) override;
    void GenerateMips(ShaderResourceViewHandle view) override;
    void ClearRenderTargetView(RenderTargetViewHandle target, const glm::vec4& color) override;
    void ClearDepthStencilView(DepthStencilViewHandle target, std::uint32_t flags, float depth,
                               std::uint8_t stencil) override;
    void Draw(std::uint32_t vertexCount, std::uint32_t startVertex) override;
    void DrawInstanced(std::uint32_t vertexCount, std::uint32_t instanceCount,
                       std::uint32_t startVertex, std::uint32_t startInstance) override;
    void DrawIndexed(std::uint32_t indexCount, std::uint32_t startIndex,
                     std::int32_t baseVertex) override;
    void DrawIndexedInstanced(std::uint32_t indexCount, std::uint32_t instanceCount,
                              std::uint32_t startIndex, std::int32_t baseVertex,
                              std::uint32_t startInstance) override;

    struct BufferRes { unsigned int glBuffer = 0; std::size_t size = 0; Usage usage; };
    struct TextureRes {
        unsigned int glTexture = 0;
        unsigned int target = 0;
        TextureDesc desc;
        Usage usage;
        unsigned int unpackBuffer = 0;  // 丢弃映射用的像素解包缓冲（惰性创建）
        std::size_t unpackSize = 0;
    };
    struct ShaderRes { unsigned int glProgram = 0; ShaderStage stage = ShaderStage::Vertex; };
    struct InputLayoutRes { unsigned int glVertexArray = 0; };
    struct ViewRes {
        std::uint64_t texture = 0;  // TextureHandle id
        std::uint32_t mipLevel = 0;
        std::uint32_t layer = 0;
    };
    struct SamplerRes { unsigned int glSampler = 0; };

private:
    struct SubresourceRegion {
        std::uint32_t level = 0;
        std::uint32_t layer = 0;
        std::uint32_t width = 1;
        std::uint32_t height = 1;
        std::uint32_t depth = 1;
    };

    std::uint64_t NextId() { return nextId_++; }
    bool ResolveSubresource(const TextureRes& tex, std::uint32_t subresource,
                            SubresourceRegion& out) const;
    void UploadRegion(const TextureRes& tex, std::uint32_t level, std::uint32_t layer,
                      const Box& box, const void* data);
    unsigned int ViewTexture(const ViewRes& view, bool& layered) const;
    void AttachColor(unsigned int fbo, std::uint32_t index, const ViewRes* view);
    void AttachDepthStencil(unsigned int fbo, const ViewRes* view);
    void ApplyRasterizer(const RasterizationState& desc);
    void ApplyDepthStencil(const DepthStencilState& desc, std::uint32_t stencilRef);
    void ApplyVertexArrayBindings();
    unsigned int GetPrimitiveMode() const;
    void RemapProgramBindings(unsigned int program, ShaderStage stage);

    void* window_ = nullptr;
    void* glContext_ = nullptr;
    bool ownsContext_ = false;
    std::uint64_t nextId_ = 1;
    std::string lastError_;
    BackendCapabilities capabilities_;

    std::unordered_map<std::uint64_t, BufferRes> buffers_;
    std::unordered_map<std::uint64_t, TextureRes> textures_;
    std::unordered_map<std::uint64_t, ShaderRes> shaders_;
    std::unordered_map<std::uint64_t, InputLayoutRes> inputLayouts_;
    std::unordered_map<std::uint64_t, ViewRes> shaderResourceViews_;
    std::unordered_map<std::uint64_t, ViewRes> renderTargetViews_;
    std::unordered_map<std::uint64_t, ViewRes> depthStencilViews_;
    std::unordered_map<std::uint64_t, SamplerRes> samplers_;
    std::unordered_map<std::uint64_t, RasterizationState> rasterizerStates_;
    std::unordered_map<std::uint64_t, DepthStencilState> depthStencilStates_;
    std::unordered_map<std::uint64_t, BlendDesc> blendStates_;

    // --- 上下文保留的状态（GL 中缓冲绑定属于 VAO，切换布局时需重放）---
    unsigned int programPipeline_ = 0;
    unsigned int defaultVertexArray_ = 0;
    unsigned int currentVertexArray_ = 0;
    unsigned int drawFramebuffer_ = 0;
    unsigned int clearFramebuffer_ = 0;
    std::array<BufferHandle, kMaxVertexAttributes> vertexBuffers_{};
    std::array<std::uint32_t, kMaxVertexAttributes> vertexStrides_{};
    std::array<std::uint32_t, kMaxVertexAttributes> vertexOffsets_{};
    BufferHandle indexBuffer_;
    IndexFormat indexFormat_ = IndexFormat::Uint16;
    std::uint32_t indexOffset_ = 0;
    PrimitiveTopology topology_ = PrimitiveTopology::TriangleList;
    RasterizationState rasterizer_;
    DepthStencilState depthStencil_;
    std::uint32_t stencilRef_ = 0;
};

}  // namespace vesta_device
