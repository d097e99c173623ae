/**
 * @file descriptor_heap.cpp
 * @brief 描述符堆线性分配
 */

#include <vesta_device/descriptor_heap.hpp>

namespace vesta_device {

DescriptorHeap::DescriptorHeap(void* cpuBase, std::uint64_t gpuBase, std::uint32_t handleSize,
                               std::uint32_t totalHandles)
    : cpuBase_(reinterpret_cast<std::uintptr_t>(cpuBase)),
      gpuBase_(gpuBase),
      handleSize_(handleSize),
      totalHandles_(totalHandles) {}

DualHandle DescriptorHeap::AllocHandles(std::uint32_t count) {
    const std::uint64_t offset = static_cast<std::uint64_t>(allocated_) * handleSize_;
    DualHandle h;
    h.cpu = cpuBase_ + static_cast<std::uintptr_t>(offset);
    h.gpu = gpuBase_ != 0 ? gpuBase_ + offset : 0;
    allocated_ += count;
    return h;
}

bool DescriptorHeap::HasCapacity(std::uint32_t count) const {
    return static_cast<std::uint64_t>(allocated_) + count <= totalHandles_;
}

}  // namespace vesta_device
