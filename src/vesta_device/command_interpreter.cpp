/**
 * @file command_interpreter.cpp
 * @brief CommandInterpreter 实现：每个命令变体一个重载
 */

#include <vesta_device/command_interpreter.hpp>
#include <vesta_device/log.hpp>
#include <vesta_device/resource_update.hpp>

#include <variant>

namespace vesta_device {

namespace {

/** 命令 -> 原生调用；每类绑定总是重绑该类别的全部槽 */
struct CommandVisitor {
    IImmediateContext& ctx;
    const DataBuffer& data;

    void operator()(const cmd::BindProgram& c) const {
        for (ShaderStage stage : kGraphicsStages)
            ctx.SetShader(stage, c.program.Get(stage));
    }

    void operator()(const cmd::BindInputLayout& c) const { ctx.SetInputLayout(c.layout); }

    void operator()(const cmd::BindIndex& c) const {
        ctx.SetIndexBuffer(c.buffer, c.format, c.offset);
    }

    void operator()(const cmd::BindVertexBuffers& c) const {
        ctx.SetVertexBuffers(0, kMaxVertexAttributes, c.buffers.data(), c.strides.data(),
                             c.offsets.data());
    }

    void operator()(const cmd::BindConstantBuffers& c) const {
        ctx.SetConstantBuffers(c.stage, 0, kMaxConstantBuffers, c.buffers.data());
    }

    void operator()(const cmd::BindShaderResources& c) const {
        ctx.SetShaderResources(c.stage, 0, kMaxResourceViews, c.views.data());
    }

    void operator()(const cmd::BindSamplers& c) const {
        ctx.SetSamplers(c.stage, 0, kMaxSamplers, c.samplers.data());
    }

    void operator()(const cmd::BindPixelTargets& c) const {
        ctx.SetRenderTargets(kMaxColorTargets, c.colors.data(), c.depthStencil);
    }

    void operator()(const cmd::SetPrimitive& c) const { ctx.SetPrimitiveTopology(c.topology); }
    void operator()(const cmd::SetViewport& c) const { ctx.SetViewport(c.viewport); }
    void operator()(const cmd::SetScissor& c) const { ctx.SetScissor(c.rect); }
    void operator()(const cmd::SetRasterizer& c) const { ctx.SetRasterizerState(c.state); }

    void operator()(const cmd::SetDepthStencil& c) const {
        ctx.SetDepthStencilState(c.state, c.stencilRef);
    }

    void operator()(const cmd::SetBlend& c) const {
        ctx.SetBlendState(c.state, c.blendFactor, c.sampleMask);
    }

    void operator()(const cmd::UpdateBuffer& c) const {
        const std::uint8_t* bytes = data.Get(c.data);
        if (!bytes && c.data.size > 0) {
            GetLogger()->error("UpdateBuffer data pointer [{}, +{}) is outside the data buffer",
                               c.data.offset, c.data.size);
            return;
        }
        UpdateBuffer(ctx, c.buffer, bytes, c.data.size, c.offset);
    }

    void operator()(const cmd::UpdateTexture& c) const {
        const std::uint8_t* bytes = data.Get(c.data);
        if (!bytes && c.data.size > 0) {
            GetLogger()->error("UpdateTexture data pointer [{}, +{}) is outside the data buffer",
                               c.data.offset, c.data.size);
            return;
        }
        UpdateTexture(ctx, c.texture, c.kind, c.face, bytes, c.data.size, c.info);
    }

    void operator()(const cmd::GenerateMips& c) const { ctx.GenerateMips(c.view); }

    void operator()(const cmd::ClearColor& c) const {
        ctx.ClearRenderTargetView(c.target, c.color);
    }

    void operator()(const cmd::ClearDepthStencil& c) const {
        ctx.ClearDepthStencilView(c.target, c.flags, c.depth, c.stencil);
    }

    void operator()(const cmd::Draw& c) const { ctx.Draw(c.vertexCount, c.startVertex); }

    void operator()(const cmd::DrawInstanced& c) const {
        ctx.DrawInstanced(c.vertexCount, c.instanceCount, c.startVertex, c.startInstance);
    }

    void operator()(const cmd::DrawIndexed& c) const {
        ctx.DrawIndexed(c.indexCount, c.startIndex, c.baseVertex);
    }

    void operator()(const cmd::DrawIndexedInstanced& c) const {
        ctx.DrawIndexedInstanced(c.indexCount, c.instanceCount, c.startIndex, c.baseVertex,
                                 c.startInstance);
    }
};

}  // namespace

void CommandInterpreter::Process(const Command& command, const DataBuffer& data) {
    std::visit(CommandVisitor{context_, data}, command);
}

void CommandInterpreter::Execute(const CommandBuffer& commands) {
    const DataBuffer& data = commands.GetData();
    for (const Command& command : commands.GetCommands())
        Process(command, data);
}

}  // namespace vesta_device
