/**
 * @file resource_update.hpp
 * @brief 按用途选择策略的缓冲/纹理局部写入
 *
 * Immutable 与 CpuOnly(Read)：报告 error 事件，不写入。
 * GpuOnly：以更新盒走 UpdateSubresource。
 * Dynamic 与 CpuOnly(可写)：丢弃映射后在目标偏移处拷贝，再解除映射。
 * Persistent：本代未实现，抛出 NotImplementedError。
 */

#pragma once

#include <vesta_device/immediate_context.hpp>
#include <vesta_device/rdi_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace vesta_device {

/** 子资源索引中使用的 mip 数；当前固定为 1（多 mip 数组寻址尚未正确） */
constexpr std::uint32_t kSubresourceMipLevels = 1;

/** 立方体面到数组切片；无面时为 0 */
std::uint32_t CubeFaceToSlice(std::optional<CubeFace> face);

/** arraySlice * mipLevels + mipLevel */
std::uint32_t CalcSubresource(std::uint32_t mipLevel, std::uint32_t arraySlice,
                              std::uint32_t mipLevels);

void UpdateBuffer(IImmediateContext& context, const BufferResource& buffer, const void* data,
                  std::size_t size, std::size_t offset);

void UpdateTexture(IImmediateContext& context, const TextureResource& texture,
                   const ImageKind& kind, std::optional<CubeFace> face, const void* data,
                   std::size_t size, const ImageInfo& info);

}  // namespace vesta_device
