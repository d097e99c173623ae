/**
 * @file graphics_backend.hpp
 * @brief 后端能力集接口
 *
 * 两个后端各自独立实现：OpenGLImmediateContext（即时上下文）与 VulkanDevice（显式堆）。
 * 二者只共享抽象数据模型，资源生命周期模型不同，不共享实现。
 */

#pragma once

#include <vesta_device/rdi_types.hpp>

#include <cstdint>
#include <string>

namespace vesta_device {

enum class Backend {
    Vulkan,
    OpenGL,
};

const char* ToString(Backend backend);

/** 后端能力查询结果 */
struct BackendCapabilities {
    /** 通过 IImmediateContext 回放命令流 */
    bool immediateContext = false;
    /** 调用方管理的堆 + 两阶段绑定 + 描述符堆 */
    bool explicitHeaps = false;
    /** 同一堆内可混放缓冲与图像（ResourceHeapType::Any） */
    bool heterogeneousHeaps = false;
    bool supportsGeometryShader = false;
    bool supportsTessellation = false;
    /** 实例步进除数大于 1（VK_EXT_vertex_attribute_divisor） */
    bool supportsInstanceRateDivisor = false;
    std::uint32_t maxTextureSize = 0;
    std::uint32_t maxVertexBuffers = kMaxVertexAttributes;
    std::uint32_t maxConstantBuffers = kMaxConstantBuffers;
    std::uint32_t maxResourceViews = kMaxResourceViews;
    std::uint32_t maxSamplers = kMaxSamplers;
    std::uint32_t maxColorTargets = kMaxColorTargets;
};

class IGraphicsBackend {
public:
    virtual ~IGraphicsBackend() = default;

    virtual Backend GetBackend() const = 0;
    virtual const BackendCapabilities& GetCapabilities() const = 0;
    /** 最近一次失败的详细原因 */
    virtual const std::string& GetLastError() const = 0;
    virtual void Shutdown() = 0;
};

}  // namespace vesta_device
