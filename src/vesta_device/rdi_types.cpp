/**
 * @file rdi_types.cpp
 * @brief 格式辅助：位宽与名称
 */

#include <vesta_device/rdi_types.hpp>

#include <algorithm>

namespace vesta_device {

void ImageKind::GetLevelDimensions(std::uint32_t level, std::uint32_t& w, std::uint32_t& h,
                                   std::uint32_t& d) const {
    auto half = [level](std::uint32_t v) { return level >= 32 ? 1u : std::max(1u, v >> level); };
    w = half(width);
    h = dimension == ImageDimension::D1 ? 1u : half(height);
    d = dimension == ImageDimension::D3 ? half(depth) : 1u;
}

std::uint32_t GetTotalBits(SurfaceType surface) {
    switch (surface) {
        case SurfaceType::R4_G4: return 8;
        case SurfaceType::R4_G4_B4_A4: return 16;
        case SurfaceType::R5_G6_B5: return 16;
        case SurfaceType::R8: return 8;
        case SurfaceType::R8_G8: return 16;
        case SurfaceType::R8_G8_B8_A8:
        case SurfaceType::B8_G8_R8_A8:
        case SurfaceType::R10_G10_B10_A2:
        case SurfaceType::R11_G11_B10: return 32;
        case SurfaceType::R16: return 16;
        case SurfaceType::R16_G16: return 32;
        case SurfaceType::R16_G16_B16: return 48;
        case SurfaceType::R16_G16_B16_A16: return 64;
        case SurfaceType::R32: return 32;
        case SurfaceType::R32_G32: return 64;
        case SurfaceType::R32_G32_B32: return 96;
        case SurfaceType::R32_G32_B32_A32: return 128;
        case SurfaceType::D16: return 16;
        case SurfaceType::D24: return 32;
        case SurfaceType::D24_S8: return 32;
        case SurfaceType::D32: return 32;
        case SurfaceType::D32_S8: return 64;
    }
    return 0;
}

bool IsDepthSurface(SurfaceType surface) {
    switch (surface) {
        case SurfaceType::D16:
        case SurfaceType::D24:
        case SurfaceType::D24_S8:
        case SurfaceType::D32:
        case SurfaceType::D32_S8: return true;
        default: return false;
    }
}

bool HasStencil(SurfaceType surface) {
    return surface == SurfaceType::D24_S8 || surface == SurfaceType::D32_S8;
}

const char* ToString(SurfaceType surface) {
    switch (surface) {
        case SurfaceType::R4_G4: return "R4_G4";
        case SurfaceType::R4_G4_B4_A4: return "R4_G4_B4_A4";
        case SurfaceType::R5_G6_B5: return "R5_G6_B5";
        case SurfaceType::R8: return "R8";
        case SurfaceType::R8_G8: return "R8_G8";
        case SurfaceType::R8_G8_B8_A8: return "R8_G8_B8_A8";
        case SurfaceType::B8_G8_R8_A8: return "B8_G8_R8_A8";
        case SurfaceType::R10_G10_B10_A2: return "R10_G10_B10_A2";
        case SurfaceType::R11_G11_B10: return "R11_G11_B10";
        case SurfaceType::R16: return "R16";
        case SurfaceType::R16_G16: return "R16_G16";
        case SurfaceType::R16_G16_B16: return "R16_G16_B16";
        case SurfaceType::R16_G16_B16_A16: return "R16_G16_B16_A16";
        case SurfaceType::R32: return "R32";
        case SurfaceType::R32_G32: return "R32_G32";
        case SurfaceType::R32_G32_B32: return "R32_G32_B32";
        case SurfaceType::R32_G32_B32_A32: return "R32_G32_B32_A32";
        case SurfaceType::D16: return "D16";
        case SurfaceType::D24: return "D24";
        case SurfaceType::D24_S8: return "D24_S8";
        case SurfaceType::D32: return "D32";
        case SurfaceType::D32_S8: return "D32_S8";
    }
    return "Unknown";
}

const char* ToString(ChannelType channel) {
    switch (channel) {
        case ChannelType::Int: return "Int";
        case ChannelType::Uint: return "Uint";
        case ChannelType::Inorm: return "Inorm";
        case ChannelType::Unorm: return "Unorm";
        case ChannelType::Float: return "Float";
        case ChannelType::Srgb: return "Srgb";
    }
    return "Unknown";
}

}  // namespace vesta_device
