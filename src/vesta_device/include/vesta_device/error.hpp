/**
 * @file error.hpp
 * @brief 显式后端错误类型与异常
 *
 * Error 描述一次失败的操作：错误码、操作名、原生 VkResult、出错字段（索引/格式）。
 * VkResult 以 int32_t 存储，避免每个头文件都引入 <vulkan/vulkan.h>。
 */

#pragma once

#include <vesta_device/rdi_types.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vesta_device {

enum class ErrorCode {
    OutOfMemory,
    UnsupportedType,
    OutOfHeap,
    Misaligned,
    IncompatibleHeap,
    AlreadyBound,
    UnsupportedFormat,
    BadFormat,
    OutOfBounds,
    InvalidSubpass,
    MissingVertexBuffer,
    MissingInputElement,
    MissingEntryPoint,
    CompilationFailed,
    InvalidArgument,
    DriverFailure,
};

const char* ToString(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::DriverFailure;
    std::string operation;      // 例如 "bind buffer memory"
    std::string message;
    std::int32_t vkResult = 0;  // 非原生错误时为 0 (VK_SUCCESS)
    std::uint32_t index = 0;    // InvalidSubpass / MissingVertexBuffer / MissingInputElement
    Format format;              // UnsupportedFormat / BadFormat 时为被拒绝的格式

    std::string ToString() const;
};

/** 本代尚未实现的路径：必须显式失败，不允许静默近似 */
class NotImplementedError : public std::logic_error {
public:
    explicit NotImplementedError(const std::string& what)
        : std::logic_error("not implemented: " + what) {}
};

/** 等待原语层的不可恢复失败 */
class FatalDeviceError : public std::runtime_error {
public:
    explicit FatalDeviceError(const std::string& what) : std::runtime_error(what) {}
};

/** Result<T>::orThrow 抛出 */
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(Error error)
        : std::runtime_error(error.ToString()), error_(std::move(error)) {}
    const Error& GetError() const { return error_; }

private:
    Error error_;
};

}  // namespace vesta_device
