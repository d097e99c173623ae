/**
 * @file shader_reflect.cpp
 * @brief 顶点输入反射实现
 */

#include <vesta_device/shader_reflect.hpp>
#include <vesta_device/vulkan_rdi_utils.hpp>

#include <algorithm>

#include <spirv_reflect.h>

namespace vesta_device {

Result<std::vector<ReflectedInput>> ReflectVertexInputs(const std::vector<std::uint32_t>& spirv,
                                                        const std::string& entryPoint) {
    SpvReflectShaderModule module{};
    SpvReflectResult result =
        spvReflectCreateShaderModule(spirv.size() * sizeof(std::uint32_t), spirv.data(), &module);
    if (result != SPV_REFLECT_RESULT_SUCCESS) {
        Error e = MakeError(ErrorCode::DriverFailure, "reflect SPIR-V", "spvReflectCreateShaderModule failed");
        e.vkResult = static_cast<std::int32_t>(result);
        return e;
    }

    std::uint32_t count = 0;
    result = spvReflectEnumerateEntryPointInputVariables(&module, entryPoint.c_str(), &count, nullptr);
    if (result == SPV_REFLECT_RESULT_ERROR_ELEMENT_NOT_FOUND) {
        spvReflectDestroyShaderModule(&module);
        return MakeError(ErrorCode::MissingEntryPoint, "reflect SPIR-V",
                         "entry point '" + entryPoint + "' not found in module");
    }
    if (result != SPV_REFLECT_RESULT_SUCCESS) {
        spvReflectDestroyShaderModule(&module);
        return MakeError(ErrorCode::DriverFailure, "reflect SPIR-V",
                         "spvReflectEnumerateEntryPointInputVariables failed");
    }

    std::vector<SpvReflectInterfaceVariable*> vars(count);
    if (count > 0)
        spvReflectEnumerateEntryPointInputVariables(&module, entryPoint.c_str(), &count, vars.data());

    std::vector<ReflectedInput> inputs;
    inputs.reserve(count);
    for (const SpvReflectInterfaceVariable* v : vars) {
        if (v->decoration_flags & SPV_REFLECT_DECORATION_BUILT_IN) continue;
        if (v->location == UINT32_MAX) continue;
        ReflectedInput in;
        in.location = v->location;
        if (v->name) in.name = v->name;
        // SpvReflectFormat 的取值与 VkFormat 一致
        in.format = static_cast<VkFormat>(v->format);
        inputs.push_back(in);
    }
    spvReflectDestroyShaderModule(&module);

    std::sort(inputs.begin(), inputs.end(),
              [](const ReflectedInput& a, const ReflectedInput& b) { return a.location < b.location; });
    return inputs;
}

}  // namespace vesta_device
