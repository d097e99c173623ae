/**
 * @file command_interpreter.hpp
 * @brief 命令流解释器：逐条把抽象命令翻译为即时上下文调用
 *
 * 只有一个状态（等待下一条命令）；按流顺序执行，不重排、不批处理。
 * 单条命令失败仅报告 error 事件，继续处理后续命令。
 */

#pragma once

#include <vesta_device/command.hpp>
#include <vesta_device/immediate_context.hpp>

namespace vesta_device {

class CommandInterpreter {
public:
    explicit CommandInterpreter(IImmediateContext& context) : context_(context) {}

    /** 处理一条命令；UpdateBuffer/UpdateTexture 的字节从 data 解引用 */
    void Process(const Command& command, const DataBuffer& data);

    /** 按顺序回放整个 CommandBuffer */
    void Execute(const CommandBuffer& commands);

private:
    IImmediateContext& context_;
};

}  // namespace vesta_device
