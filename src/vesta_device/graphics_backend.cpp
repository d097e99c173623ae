/**
 * @file graphics_backend.cpp
 * @brief 后端名称
 */

#include <vesta_device/graphics_backend.hpp>

namespace vesta_device {

const char* ToString(Backend backend) {
    switch (backend) {
        case Backend::Vulkan: return "Vulkan";
        case Backend::OpenGL: return "OpenGL";
    }
    return "Unknown";
}

}  // namespace vesta_device
