/**
 * @file error.cpp
 * @brief Error 格式化
 */

#include <vesta_device/error.hpp>

#include <fmt/format.h>

namespace vesta_device {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::UnsupportedType: return "UnsupportedType";
        case ErrorCode::OutOfHeap: return "OutOfHeap";
        case ErrorCode::Misaligned: return "Misaligned";
        case ErrorCode::IncompatibleHeap: return "IncompatibleHeap";
        case ErrorCode::AlreadyBound: return "AlreadyBound";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::BadFormat: return "BadFormat";
        case ErrorCode::OutOfBounds: return "OutOfBounds";
        case ErrorCode::InvalidSubpass: return "InvalidSubpass";
        case ErrorCode::MissingVertexBuffer: return "MissingVertexBuffer";
        case ErrorCode::MissingInputElement: return "MissingInputElement";
        case ErrorCode::MissingEntryPoint: return "MissingEntryPoint";
        case ErrorCode::CompilationFailed: return "CompilationFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::DriverFailure: return "DriverFailure";
    }
    return "Unknown";
}

std::string Error::ToString() const {
    std::string out = fmt::format("[{}] {}", vesta_device::ToString(code), operation);
    switch (code) {
        case ErrorCode::InvalidSubpass:
            out += fmt::format(" (subpass {})", index);
            break;
        case ErrorCode::MissingVertexBuffer:
            out += fmt::format(" (binding {})", index);
            break;
        case ErrorCode::MissingInputElement:
            out += fmt::format(" (location {})", index);
            break;
        case ErrorCode::UnsupportedFormat:
        case ErrorCode::BadFormat:
            out += fmt::format(" ({}/{})", vesta_device::ToString(format.surface),
                               vesta_device::ToString(format.channel));
            break;
        default:
            break;
    }
    if (vkResult != 0) out += fmt::format(" VkResult={}", vkResult);
    if (!message.empty()) out += ": " + message;
    return out;
}

}  // namespace vesta_device
