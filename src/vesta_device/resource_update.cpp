/**
 * @file resource_update.cpp
 * @brief 资源更新引擎实现
 */

#include <vesta_device/resource_update.hpp>
#include <vesta_device/error.hpp>
#include <vesta_device/log.hpp>

#include <cstring>

namespace vesta_device {

namespace {

bool IsReadOnly(const Usage& usage) {
    return usage.kind == UsageKind::Immutable ||
           (usage.kind == UsageKind::CpuOnly && usage.access == CpuAccess::Read);
}

/** 更新盒是否落在 w×h×d 的 texel 范围内 */
bool BoxFits(const ImageInfo& info, std::uint32_t w, std::uint32_t h, std::uint32_t d) {
    return static_cast<std::uint64_t>(info.xoffset) + info.width <= w &&
           static_cast<std::uint64_t>(info.yoffset) + info.height <= h &&
           static_cast<std::uint64_t>(info.zoffset) + info.depth <= d;
}

}  // namespace

std::uint32_t CubeFaceToSlice(std::optional<CubeFace> face) {
    if (!face) return 0;
    switch (*face) {
        case CubeFace::PosX: return 0;
        case CubeFace::NegX: return 1;
        case CubeFace::PosY: return 2;
        case CubeFace::NegY: return 3;
        case CubeFace::PosZ: return 4;
        case CubeFace::NegZ: return 5;
    }
    return 0;
}

std::uint32_t CalcSubresource(std::uint32_t mipLevel, std::uint32_t arraySlice,
                              std::uint32_t mipLevels) {
    return arraySlice * mipLevels + mipLevel;
}

void UpdateBuffer(IImmediateContext& context, const BufferResource& buffer, const void* data,
                  std::size_t size, std::size_t offset) {
    if (IsReadOnly(buffer.usage)) {
        GetLogger()->error("Cannot update buffer {}: usage does not allow writes", buffer.handle.id);
        return;
    }
    if (buffer.usage.kind == UsageKind::Persistent)
        throw NotImplementedError("persistent-mapped buffer update");
    if (buffer.size == 0) {
        GetLogger()->error("Cannot update buffer {}: resource size is unknown", buffer.handle.id);
        return;
    }
    if (offset > buffer.size || size > buffer.size - offset) {
        GetLogger()->error("Buffer {} update [{}, {}) exceeds size {}", buffer.handle.id, offset,
                           offset + size, buffer.size);
        return;
    }

    if (buffer.usage.kind == UsageKind::GpuOnly) {
        Box box;
        box.left = static_cast<std::uint32_t>(offset);
        box.right = static_cast<std::uint32_t>(offset + size);
        context.UpdateSubresource(buffer.handle, box, data);
        return;
    }

    // Dynamic 或 CpuOnly(可写)
    MappedSubresource mapped;
    if (!context.MapDiscard(buffer.handle, mapped) || !mapped.data) {
        GetLogger()->error("Buffer {} failed to map for update", buffer.handle.id);
        return;
    }
    if (offset > mapped.size || size > mapped.size - offset) {
        GetLogger()->error("Buffer {} update [{}, {}) exceeds mapped size {}", buffer.handle.id, offset,
                           offset + size, mapped.size);
        context.Unmap(buffer.handle);
        return;
    }
    std::memcpy(static_cast<std::uint8_t*>(mapped.data) + offset, data, size);
    context.Unmap(buffer.handle);
}

void UpdateTexture(IImmediateContext& context, const TextureResource& texture,
                   const ImageKind& kind, std::optional<CubeFace> face, const void* data,
                   std::size_t size, const ImageInfo& info) {
    if (IsReadOnly(texture.usage)) {
        GetLogger()->error("Cannot update texture {}: usage does not allow writes", texture.handle.id);
        return;
    }
    if (texture.usage.kind == UsageKind::Persistent)
        throw NotImplementedError("persistent-mapped texture update");

    const std::uint32_t slice = kind.dimension == ImageDimension::Cube ? CubeFaceToSlice(face) : 0;
    const std::uint32_t subresource = CalcSubresource(info.mipLevel, slice, kSubresourceMipLevels);
    const std::uint32_t bitsPerTexel = GetTotalBits(info.format.surface);
    const std::size_t bytesPerTexel = bitsPerTexel / 8;
    const std::size_t rowBytes = static_cast<std::size_t>(info.width) * bytesPerTexel;
    const std::size_t needed = rowBytes * info.height * info.depth;
    if (size < needed) {
        GetLogger()->error("Texture {} update needs {} bytes, got {}", texture.handle.id, needed, size);
        return;
    }

    std::uint32_t levelWidth = 0, levelHeight = 0, levelDepth = 0;
    kind.GetLevelDimensions(info.mipLevel, levelWidth, levelHeight, levelDepth);
    if (!BoxFits(info, levelWidth, levelHeight, levelDepth)) {
        GetLogger()->error("Texture {} update box exceeds mip {} extent {}x{}x{}", texture.handle.id,
                           info.mipLevel, levelWidth, levelHeight, levelDepth);
        return;
    }

    if (texture.usage.kind == UsageKind::GpuOnly) {
        // 跨度取自目标 mip 级别尺寸，而非更新盒
        const std::uint32_t rowPitch = levelWidth * bitsPerTexel;
        const std::uint32_t depthPitch = levelHeight * rowPitch;
        Box box;
        box.left = info.xoffset;
        box.top = info.yoffset;
        box.front = info.zoffset;
        box.right = info.xoffset + info.width;
        box.bottom = info.yoffset + info.height;
        box.back = info.zoffset + info.depth;
        context.UpdateSubresource(texture.handle, subresource, box, data, rowPitch, depthPitch);
        return;
    }

    // Dynamic 或 CpuOnly(可写)：逐行拷贝到映射出的子资源
    MappedSubresource mapped;
    if (!context.MapDiscard(texture.handle, subresource, mapped) || !mapped.data) {
        GetLogger()->error("Texture {} subresource {} failed to map for update", texture.handle.id,
                           subresource);
        return;
    }
    if (!BoxFits(info, mapped.width, mapped.height, mapped.depth)) {
        GetLogger()->error("Texture {} update box exceeds mapped subresource {}x{}x{}", texture.handle.id,
                           mapped.width, mapped.height, mapped.depth);
        context.Unmap(texture.handle, subresource);
        return;
    }
    auto* dst = static_cast<std::uint8_t*>(mapped.data);
    const auto* src = static_cast<const std::uint8_t*>(data);
    for (std::uint32_t z = 0; z < info.depth; ++z) {
        for (std::uint32_t y = 0; y < info.height; ++y) {
            std::uint8_t* row = dst + static_cast<std::size_t>(info.zoffset + z) * mapped.depthPitch +
                                static_cast<std::size_t>(info.yoffset + y) * mapped.rowPitch +
                                info.xoffset * bytesPerTexel;
            std::memcpy(row, src + (static_cast<std::size_t>(z) * info.height + y) * rowBytes, rowBytes);
        }
    }
    context.Unmap(texture.handle, subresource);
}

}  // namespace vesta_device
