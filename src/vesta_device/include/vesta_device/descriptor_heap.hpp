/**
 * @file descriptor_heap.hpp
 * @brief 固定容量描述符堆的线性（bump）分配器
 *
 * 每次 AllocHandles(count) 返回连续 count 个槽位的 CPU/GPU 地址对，游标前进 count * handleSize。
 * 无释放接口，槽位生命周期与堆相同。AllocHandles 本身不检查容量，调用方用 HasCapacity 判断。
 */

#pragma once

#include <cstdint>

namespace vesta_device {

/** CPU 可写地址 + GPU 设备地址；仅 CPU 堆的 gpu 为 0 */
struct DualHandle {
    std::uintptr_t cpu = 0;
    std::uint64_t gpu = 0;
};

class DescriptorHeap {
public:
    DescriptorHeap() = default;
    DescriptorHeap(void* cpuBase, std::uint64_t gpuBase, std::uint32_t handleSize,
                   std::uint32_t totalHandles);

    DualHandle AllocHandles(std::uint32_t count);
    bool HasCapacity(std::uint32_t count) const;

    std::uint32_t GetHandleSize() const { return handleSize_; }
    std::uint32_t GetTotalHandles() const { return totalHandles_; }
    std::uint32_t GetAllocatedHandles() const { return allocated_; }
    bool IsShaderVisible() const { return gpuBase_ != 0; }

private:
    std::uintptr_t cpuBase_ = 0;
    std::uint64_t gpuBase_ = 0;
    std::uint32_t handleSize_ = 0;
    std::uint32_t totalHandles_ = 0;
    std::uint32_t allocated_ = 0;
};

}  // namespace vesta_device
