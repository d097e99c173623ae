/**
 * @file test_opengl_immediate_context.cpp
 * @brief OpenGL 即时上下文集成测试
 *
 * 需要可创建 GL 4.5 上下文的显示环境；SDL 视频子系统或上下文不可用时直接跳过（返回 0）。
 * 验证：能力集；资源创建与销毁；命令流经 CommandInterpreter 回放（更新、清除、绘制）；
 * 只读用途的更新被拒绝；着色器编译失败时句柄无效且 GetLastError 非空。
 */

#include <vesta_device/command.hpp>
#include <vesta_device/command_interpreter.hpp>
#include <vesta_device/opengl_immediate_context.hpp>
#include <vesta_device/resource_update.hpp>

#include "counting_sink.hpp"

#include <SDL3/SDL.h>
#include <SDL3/SDL_video.h>

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

using namespace vesta_device;

namespace {

const char* kVertexSource = R"(#version 450
layout(location = 0) in vec3 a_position;
out gl_PerVertex { vec4 gl_Position; };
void main() { gl_Position = vec4(a_position, 1.0); }
)";

const char* kFragmentSource = R"(#version 450
layout(binding = 0) uniform sampler2D u_texture;
layout(location = 0) out vec4 o_color;
void main() { o_color = texture(u_texture, vec2(0.5)); }
)";

const Format kRgba8{SurfaceType::R8_G8_B8_A8, ChannelType::Unorm};

}  // namespace

static void RunContextTests(OpenGLImmediateContext& gl) {
    const BackendCapabilities& caps = gl.GetCapabilities();
    assert(gl.GetBackend() == Backend::OpenGL);
    assert(caps.immediateContext);
    assert(!caps.explicitHeaps);
    assert(caps.maxTextureSize > 0);

    // --- 资源 ---
    const float triangle[9] = {-1.0f, -1.0f, 0.0f, 3.0f, -1.0f, 0.0f, -1.0f, 3.0f, 0.0f};
    BufferDesc vbDesc;
    vbDesc.size = sizeof(triangle);
    vbDesc.role = BufferRole::Vertex;
    BufferResource vb = gl.CreateBuffer(vbDesc, Usage::Dynamic());
    assert(vb.handle.IsValid());
    assert(vb.size == sizeof(triangle));

    BufferDesc cbDesc;
    cbDesc.size = 64;
    cbDesc.role = BufferRole::Constant;
    BufferResource constants = gl.CreateBuffer(cbDesc, Usage::GpuOnly());
    assert(constants.handle.IsValid());

    TextureDesc texDesc;
    texDesc.kind = ImageKind::D2(4, 4);
    texDesc.format = kRgba8;
    texDesc.bind = BindFlags::ShaderResource;
    std::vector<std::uint8_t> pixels(4 * 4 * 4, 0x80);
    TextureResource tex = gl.CreateTexture(texDesc, Usage::GpuOnly(), pixels.data());
    assert(tex.handle.IsValid());
    ShaderResourceViewHandle srv = gl.CreateShaderResourceView(tex.handle);
    assert(srv.IsValid());

    TextureDesc rtDesc;
    rtDesc.kind = ImageKind::D2(16, 16);
    rtDesc.format = kRgba8;
    rtDesc.bind = BindFlags::RenderTarget | BindFlags::ShaderResource;
    TextureResource target = gl.CreateTexture(rtDesc, Usage::GpuOnly());
    RenderTargetViewHandle rtv = gl.CreateRenderTargetView(target.handle);
    assert(rtv.IsValid());

    TextureDesc depthDesc;
    depthDesc.kind = ImageKind::D2(16, 16);
    depthDesc.format = Format{SurfaceType::D24_S8, ChannelType::Unorm};
    depthDesc.bind = BindFlags::DepthStencil;
    TextureResource depth = gl.CreateTexture(depthDesc, Usage::GpuOnly());
    DepthStencilViewHandle dsv = gl.CreateDepthStencilView(depth.handle);
    assert(dsv.IsValid());

    SamplerHandle sampler = gl.CreateSampler(SamplerDesc{});
    assert(sampler.IsValid());
    RasterizerStateHandle raster = gl.CreateRasterizerState(RasterizationState{});
    DepthStencilStateHandle depthState = gl.CreateDepthStencilState(DepthStencilState{});
    BlendStateHandle blend = gl.CreateBlendState(BlendDesc{});
    assert(raster.IsValid() && depthState.IsValid() && blend.IsValid());

    ShaderHandle vs = gl.CreateShader(ShaderStage::Vertex, kVertexSource);
    ShaderHandle fs = gl.CreateShader(ShaderStage::Fragment, kFragmentSource);
    assert(vs.IsValid() && fs.IsValid());

    InputLayoutDesc layoutDesc;
    layoutDesc.attributes = {VertexAttribute{0, 0, Format{SurfaceType::R32_G32_B32, ChannelType::Float}, 0}};
    layoutDesc.buffers = {VertexBufferDesc{12, 0}};
    InputLayoutHandle layout = gl.CreateInputLayout(layoutDesc);
    assert(layout.IsValid());

    // --- 编译失败 ---
    ShaderHandle broken = gl.CreateShader(ShaderStage::Fragment, "#version 450\nvoid main() { nope }\n");
    assert(!broken.IsValid());
    assert(!gl.GetLastError().empty());

    // --- 录制并回放一帧 ---
    CommandBuffer cb;
    cb.UpdateBuffer(vb, triangle, sizeof(triangle));
    const float color[4] = {1.0f, 0.0f, 0.0f, 1.0f};
    cb.UpdateBuffer(constants, color, sizeof(color), 16);

    cmd::BindPixelTargets targets;
    targets.colors[0] = rtv;
    targets.depthStencil = dsv;
    cb.Push(targets);
    cb.Push(cmd::ClearColor{rtv, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)});
    cb.Push(cmd::ClearDepthStencil{dsv});

    cmd::SetViewport viewport;
    viewport.viewport.width = 16.0f;
    viewport.viewport.height = 16.0f;
    cb.Push(viewport);
    cb.Push(cmd::SetRasterizer{raster});
    cb.Push(cmd::SetDepthStencil{depthState, 0});
    cb.Push(cmd::SetBlend{blend});

    cmd::BindProgram program;
    program.program.stages[StageIndex(ShaderStage::Vertex)] = vs;
    program.program.stages[StageIndex(ShaderStage::Fragment)] = fs;
    cb.Push(program);
    cb.Push(cmd::BindInputLayout{layout});

    cmd::BindVertexBuffers vbs;
    vbs.buffers[0] = vb.handle;
    vbs.strides[0] = 12;
    cb.Push(vbs);

    cmd::BindConstantBuffers cbs;
    cbs.stage = ShaderStage::Fragment;
    cbs.buffers[0] = constants.handle;
    cb.Push(cbs);

    cmd::BindShaderResources views;
    views.stage = ShaderStage::Fragment;
    views.views[0] = srv;
    cb.Push(views);

    cmd::BindSamplers samplers;
    samplers.stage = ShaderStage::Fragment;
    samplers.samplers[0] = sampler;
    cb.Push(samplers);

    cb.Push(cmd::SetPrimitive{PrimitiveTopology::TriangleList});
    cb.Push(cmd::Draw{3, 0});
    cb.Push(cmd::GenerateMips{srv});

    {
        vesta_test::ScopedCountingLogger log;
        CommandInterpreter(gl).Execute(cb);
        assert(log.Errors() == 0);

        // 只读用途：报告 error，不发出 GL 写入
        BufferResource immutable = vb;
        immutable.usage = Usage::Immutable();
        UpdateBuffer(gl, immutable, triangle, sizeof(triangle), 0);
        assert(log.Errors() == 1);
    }

    // --- Dynamic 纹理丢弃映射 ---
    TextureResource dynamicTex = gl.CreateTexture(texDesc, Usage::Dynamic());
    assert(dynamicTex.handle.IsValid());
    ImageInfo info;
    info.xoffset = 1;
    info.yoffset = 1;
    info.width = 2;
    info.height = 2;
    info.format = kRgba8;
    const std::uint8_t texels[16] = {};
    UpdateTexture(gl, dynamicTex, texDesc.kind, std::nullopt, texels, sizeof(texels), info);

    gl.DestroyInputLayout(layout);
    gl.DestroyShader(vs);
    gl.DestroyShader(fs);
    gl.DestroyBlendState(blend);
    gl.DestroyDepthStencilState(depthState);
    gl.DestroyRasterizerState(raster);
    gl.DestroySampler(sampler);
    gl.DestroyDepthStencilView(dsv);
    gl.DestroyRenderTargetView(rtv);
    gl.DestroyShaderResourceView(srv);
    gl.DestroyTexture(dynamicTex.handle);
    gl.DestroyTexture(depth.handle);
    gl.DestroyTexture(target.handle);
    gl.DestroyTexture(tex.handle);
    gl.DestroyBuffer(constants.handle);
    gl.DestroyBuffer(vb.handle);
}

int main() {
    if (!SDL_Init(SDL_INIT_VIDEO)) return 0;

    SDL_Window* window = SDL_CreateWindow("VestaGLTest", 64, 64, SDL_WINDOW_OPENGL | SDL_WINDOW_HIDDEN);
    if (!window) {
        SDL_Quit();
        return 0;
    }

    OpenGLImmediateContext gl;
    OpenGLContextConfig config;
    config.window = window;
    config.debugOutput = true;
    if (!gl.Initialize(config)) {
        // 无 GL 4.5 驱动
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

    RunContextTests(gl);

    gl.Shutdown();
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
