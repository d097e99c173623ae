/**
 * @file spirv_builder.hpp
 * @brief 生成只含输入变量声明的最小顶点着色器 SPIR-V，供反射与管线测试使用
 *
 * 每个输入为 location + float 分量数（1..4）；可选加入 gl_VertexIndex 内建输入。
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vesta_test {

struct SpirvInput {
    std::uint32_t location = 0;
    std::uint32_t components = 4;
};

namespace spirv_detail {

inline std::uint32_t Op(std::uint32_t wordCount, std::uint32_t opcode) {
    return (wordCount << 16) | opcode;
}

inline std::vector<std::uint32_t> StringWords(const std::string& s) {
    std::vector<std::uint32_t> words((s.size() + 4) / 4, 0);
    for (std::size_t i = 0; i < s.size(); ++i)
        words[i / 4] |= static_cast<std::uint32_t>(static_cast<unsigned char>(s[i])) << (8 * (i % 4));
    return words;
}

}  // namespace spirv_detail

inline std::vector<std::uint32_t> BuildVertexShader(const std::vector<SpirvInput>& inputs,
                                                    bool withBuiltin = false,
                                                    const std::string& entryPoint = "main") {
    using spirv_detail::Op;
    enum : std::uint32_t {
        kVoid = 1,
        kFnType = 2,
        kFloat = 3,
        kMain = 4,
        kLabel = 5,
        kInt = 6,
        kIntPtr = 7,
        kVertexIndex = 8,
        kFirstFree = 9,
    };

    // 每个分量数一组 (向量类型, 指针类型)；1 分量直接用 float
    std::uint32_t next = kFirstFree;
    std::uint32_t valueType[5] = {0, kFloat, 0, 0, 0};
    std::uint32_t ptrType[5] = {0, 0, 0, 0, 0};
    for (std::uint32_t c = 2; c <= 4; ++c) valueType[c] = next++;
    for (std::uint32_t c = 1; c <= 4; ++c) ptrType[c] = next++;
    std::vector<std::uint32_t> varIds;
    for (std::size_t i = 0; i < inputs.size(); ++i) varIds.push_back(next++);

    std::vector<std::uint32_t> w = {0x07230203u, 0x00010000u, 0u, next, 0u};

    w.push_back(Op(2, 17));  // OpCapability Shader
    w.push_back(1);
    w.push_back(Op(3, 14));  // OpMemoryModel Logical GLSL450
    w.push_back(0);
    w.push_back(1);

    const std::vector<std::uint32_t> name = spirv_detail::StringWords(entryPoint);
    std::vector<std::uint32_t> iface = varIds;
    if (withBuiltin) iface.push_back(kVertexIndex);
    w.push_back(Op(static_cast<std::uint32_t>(3 + name.size() + iface.size()), 15));  // OpEntryPoint
    w.push_back(0);  // Vertex
    w.push_back(kMain);
    w.insert(w.end(), name.begin(), name.end());
    w.insert(w.end(), iface.begin(), iface.end());

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        w.push_back(Op(4, 71));  // OpDecorate Location
        w.push_back(varIds[i]);
        w.push_back(30);
        w.push_back(inputs[i].location);
    }
    if (withBuiltin) {
        w.push_back(Op(4, 71));  // OpDecorate BuiltIn VertexIndex
        w.push_back(kVertexIndex);
        w.push_back(11);
        w.push_back(42);
    }

    w.push_back(Op(2, 19));  // OpTypeVoid
    w.push_back(kVoid);
    w.push_back(Op(3, 33));  // OpTypeFunction
    w.push_back(kFnType);
    w.push_back(kVoid);
    w.push_back(Op(3, 22));  // OpTypeFloat 32
    w.push_back(kFloat);
    w.push_back(32);
    w.push_back(Op(4, 21));  // OpTypeInt 32 signed
    w.push_back(kInt);
    w.push_back(32);
    w.push_back(1);
    for (std::uint32_t c = 2; c <= 4; ++c) {
        w.push_back(Op(4, 23));  // OpTypeVector
        w.push_back(valueType[c]);
        w.push_back(kFloat);
        w.push_back(c);
    }
    for (std::uint32_t c = 1; c <= 4; ++c) {
        w.push_back(Op(4, 32));  // OpTypePointer Input
        w.push_back(ptrType[c]);
        w.push_back(1);
        w.push_back(valueType[c]);
    }
    w.push_back(Op(4, 32));
    w.push_back(kIntPtr);
    w.push_back(1);
    w.push_back(kInt);

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        w.push_back(Op(4, 59));  // OpVariable Input
        w.push_back(ptrType[inputs[i].components]);
        w.push_back(varIds[i]);
        w.push_back(1);
    }
    w.push_back(Op(4, 59));
    w.push_back(kIntPtr);
    w.push_back(kVertexIndex);
    w.push_back(1);

    w.push_back(Op(5, 54));  // OpFunction
    w.push_back(kVoid);
    w.push_back(kMain);
    w.push_back(0);
    w.push_back(kFnType);
    w.push_back(Op(2, 248));  // OpLabel
    w.push_back(kLabel);
    w.push_back(Op(1, 253));  // OpReturn
    w.push_back(Op(1, 56));   // OpFunctionEnd
    return w;
}

}  // namespace vesta_test
