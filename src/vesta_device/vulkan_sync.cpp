/**
 * @file vulkan_sync.cpp
 * @brief VulkanDevice：基于 timeline semaphore 的栅栏与信号量
 *
 * 每个栅栏记录 base，计数 >= base + 1 即 signaled；ResetFences 把 base 移到当前计数。
 */

#include <vesta_device/error.hpp>
#include <vesta_device/log.hpp>
#include <vesta_device/vulkan_device.hpp>
#include <vesta_device/vulkan_rdi_utils.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vesta_device {

Result<VulkanDevice::FenceRes> VulkanDevice::CreateTimelineSemaphore(std::uint64_t initialValue) {
    VkSemaphoreTypeCreateInfo typeInfo{};
    typeInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO;
    typeInfo.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
    typeInfo.initialValue = initialValue;
    VkSemaphoreCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    ci.pNext = &typeInfo;

    FenceRes res;
    VkResult vr = fn_.vkCreateSemaphore(device_, &ci, nullptr, &res.semaphore);
    if (vr != VK_SUCCESS) return MakeVkError("create timeline semaphore", vr, "vkCreateSemaphore failed");
    res.base = 0;
    return res;
}

std::uint64_t VulkanDevice::GetCounterValue(VkSemaphore semaphore) const {
    std::uint64_t value = 0;
    VkResult vr = fn_.vkGetSemaphoreCounterValue(device_, semaphore, &value);
    if (vr != VK_SUCCESS)
        throw FatalDeviceError("vkGetSemaphoreCounterValue failed (" + std::to_string(vr) + ")");
    return value;
}

const VulkanDevice::FenceRes& VulkanDevice::GetFenceRes(FenceHandle fence) const {
    auto it = fences_.find(fence.id);
    if (it == fences_.end()) throw std::invalid_argument("unknown fence " + std::to_string(fence.id));
    return it->second;
}

Result<FenceHandle> VulkanDevice::CreateFence(bool signaled) {
    Result<FenceRes> res = CreateTimelineSemaphore(signaled ? 1 : 0);
    if (!res.ok()) return res.error();
    const std::uint64_t id = NextId();
    fences_[id] = res.value();
    FenceHandle h;
    h.id = id;
    return h;
}

Result<SemaphoreHandle> VulkanDevice::CreateSemaphore() {
    Result<FenceRes> res = CreateTimelineSemaphore(0);
    if (!res.ok()) return res.error();
    const std::uint64_t id = NextId();
    semaphores_[id] = res.value();
    SemaphoreHandle h;
    h.id = id;
    return h;
}

void VulkanDevice::ResetFences(const std::vector<FenceHandle>& fences) {
    for (FenceHandle f : fences) {
        auto it = fences_.find(f.id);
        if (it == fences_.end()) throw std::invalid_argument("ResetFences: unknown fence " + std::to_string(f.id));
        it->second.base = GetCounterValue(it->second.semaphore);
    }
}

bool VulkanDevice::WaitForFences(const std::vector<FenceHandle>& fences, WaitMode mode, std::uint32_t timeoutMs) {
    if (fences.empty()) return true;
    if (waitSemaphores_.size() < fences.size()) {
        waitSemaphores_.resize(fences.size());
        waitValues_.resize(fences.size());
    }
    for (std::size_t i = 0; i < fences.size(); ++i) {
        const FenceRes& f = GetFenceRes(fences[i]);
        waitSemaphores_[i] = f.semaphore;
        waitValues_[i] = f.base + 1;
    }

    VkSemaphoreWaitInfo wi{};
    wi.sType = VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO;
    wi.flags = mode == WaitMode::Any ? VK_SEMAPHORE_WAIT_ANY_BIT : 0;
    wi.semaphoreCount = static_cast<std::uint32_t>(fences.size());
    wi.pSemaphores = waitSemaphores_.data();
    wi.pValues = waitValues_.data();

    const std::uint64_t timeoutNs = static_cast<std::uint64_t>(timeoutMs) * 1000000ull;
    VkResult vr = fn_.vkWaitSemaphores(device_, &wi, timeoutNs);
    if (vr == VK_SUCCESS) return true;
    if (vr == VK_TIMEOUT) return false;
    GetLogger()->error("WaitForFences: vkWaitSemaphores returned {}", static_cast<int>(vr));
    throw FatalDeviceError("vkWaitSemaphores failed (" + std::to_string(vr) + ")");
}

void VulkanDevice::SignalFence(FenceHandle fence) {
    const FenceRes& f = GetFenceRes(fence);
    const std::uint64_t target = f.base + 1;
    // 计数只能递增，已达到则不再 signal
    if (GetCounterValue(f.semaphore) >= target) return;
    VkSemaphoreSignalInfo si{};
    si.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SIGNAL_INFO;
    si.semaphore = f.semaphore;
    si.value = target;
    VkResult vr = fn_.vkSignalSemaphore(device_, &si);
    if (vr != VK_SUCCESS) throw FatalDeviceError("vkSignalSemaphore failed (" + std::to_string(vr) + ")");
}

std::uint64_t VulkanDevice::GetFenceValue(FenceHandle fence) const {
    const FenceRes& f = GetFenceRes(fence);
    const std::uint64_t counter = GetCounterValue(f.semaphore);
    return counter > f.base ? counter - f.base : 0;
}

NativeFence VulkanDevice::GetNativeFence(FenceHandle fence) const {
    const FenceRes& f = GetFenceRes(fence);
    return NativeFence{f.semaphore, f.base + 1};
}

NativeFence VulkanDevice::GetNativeSemaphore(SemaphoreHandle semaphore) {
    auto it = semaphores_.find(semaphore.id);
    if (it == semaphores_.end())
        throw std::invalid_argument("unknown semaphore " + std::to_string(semaphore.id));
    FenceRes& s = it->second;
    s.pending = std::max(s.pending, GetCounterValue(s.semaphore)) + 1;
    return NativeFence{s.semaphore, s.pending};
}

void VulkanDevice::DestroyFence(FenceHandle fence) {
    auto it = fences_.find(fence.id);
    if (it == fences_.end()) return;
    fn_.vkDestroySemaphore(device_, it->second.semaphore, nullptr);
    fences_.erase(it);
}

void VulkanDevice::DestroySemaphore(SemaphoreHandle semaphore) {
    auto it = semaphores_.find(semaphore.id);
    if (it == semaphores_.end()) return;
    fn_.vkDestroySemaphore(device_, it->second.semaphore, nullptr);
    semaphores_.erase(it);
}

}  // namespace vesta_device
