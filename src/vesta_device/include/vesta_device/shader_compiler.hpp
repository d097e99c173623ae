/**
 * @file shader_compiler.hpp
 * @brief 外部着色器源码编译器接口
 *
 * 设备层不内置编译器；宿主提供实现（glslang、shaderc、DXC 等），
 * VulkanDevice::CreateShaderLibraryFromSource 逐个 (入口, 阶段, 源码) 调用。
 */

#pragma once

#include <vesta_device/rdi_types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace vesta_device {

struct ShaderSource {
    std::string entryPoint;
    ShaderStage stage = ShaderStage::Vertex;
    std::string source;
};

struct ShaderCompileOutput {
    bool success = false;
    std::vector<std::uint32_t> spirv;
    /** 编译器诊断原文；失败时原样放入 CompilationFailed 错误 */
    std::string diagnostics;
};

class IShaderSourceCompiler {
public:
    virtual ~IShaderSourceCompiler() = default;

    virtual ShaderCompileOutput Compile(const std::string& entryPoint, ShaderStage stage,
                                        const std::string& source) = 0;
};

}  // namespace vesta_device
