/**
 * @file vulkan_rdi_utils.cpp
 * @brief RDI -> Vulkan 转换实现
 */

#include <vesta_device/vulkan_rdi_utils.hpp>

namespace vesta_device {

namespace {

/** 表列顺序：Unorm, Inorm, Uint, Int, Float, Srgb */
VkFormat Pick(ChannelType ch, VkFormat unorm, VkFormat snorm, VkFormat uint, VkFormat sint,
              VkFormat sfloat, VkFormat srgb) {
    switch (ch) {
        case ChannelType::Unorm: return unorm;
        case ChannelType::Inorm: return snorm;
        case ChannelType::Uint: return uint;
        case ChannelType::Int: return sint;
        case ChannelType::Float: return sfloat;
        case ChannelType::Srgb: return srgb;
    }
    return VK_FORMAT_UNDEFINED;
}

constexpr VkFormat kNone = VK_FORMAT_UNDEFINED;

}  // namespace

VkFormat ToVkFormat(Format f) {
    const ChannelType ch = f.channel;
    switch (f.surface) {
        case SurfaceType::R4_G4:
            return Pick(ch, VK_FORMAT_R4G4_UNORM_PACK8, kNone, kNone, kNone, kNone, kNone);
        case SurfaceType::R4_G4_B4_A4:
            return Pick(ch, VK_FORMAT_R4G4B4A4_UNORM_PACK16, kNone, kNone, kNone, kNone, kNone);
        case SurfaceType::R5_G6_B5:
            return Pick(ch, VK_FORMAT_R5G6B5_UNORM_PACK16, kNone, kNone, kNone, kNone, kNone);
        case SurfaceType::R8:
            return Pick(ch, VK_FORMAT_R8_UNORM, VK_FORMAT_R8_SNORM, VK_FORMAT_R8_UINT, VK_FORMAT_R8_SINT,
                        kNone, VK_FORMAT_R8_SRGB);
        case SurfaceType::R8_G8:
            return Pick(ch, VK_FORMAT_R8G8_UNORM, VK_FORMAT_R8G8_SNORM, VK_FORMAT_R8G8_UINT,
                        VK_FORMAT_R8G8_SINT, kNone, VK_FORMAT_R8G8_SRGB);
        case SurfaceType::R8_G8_B8_A8:
            return Pick(ch, VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_SNORM, VK_FORMAT_R8G8B8A8_UINT,
                        VK_FORMAT_R8G8B8A8_SINT, kNone, VK_FORMAT_R8G8B8A8_SRGB);
        case SurfaceType::B8_G8_R8_A8:
            return Pick(ch, VK_FORMAT_B8G8R8A8_UNORM, VK_FORMAT_B8G8R8A8_SNORM, VK_FORMAT_B8G8R8A8_UINT,
                        VK_FORMAT_B8G8R8A8_SINT, kNone, VK_FORMAT_B8G8R8A8_SRGB);
        case SurfaceType::R10_G10_B10_A2:
            return Pick(ch, VK_FORMAT_A2B10G10R10_UNORM_PACK32, kNone, VK_FORMAT_A2B10G10R10_UINT_PACK32,
                        kNone, kNone, kNone);
        case SurfaceType::R11_G11_B10:
            return Pick(ch, kNone, kNone, kNone, kNone, VK_FORMAT_B10G11R11_UFLOAT_PACK32, kNone);
        case SurfaceType::R16:
            return Pick(ch, VK_FORMAT_R16_UNORM, VK_FORMAT_R16_SNORM, VK_FORMAT_R16_UINT, VK_FORMAT_R16_SINT,
                        VK_FORMAT_R16_SFLOAT, kNone);
        case SurfaceType::R16_G16:
            return Pick(ch, VK_FORMAT_R16G16_UNORM, VK_FORMAT_R16G16_SNORM, VK_FORMAT_R16G16_UINT,
                        VK_FORMAT_R16G16_SINT, VK_FORMAT_R16G16_SFLOAT, kNone);
        case SurfaceType::R16_G16_B16:
            return Pick(ch, VK_FORMAT_R16G16B16_UNORM, VK_FORMAT_R16G16B16_SNORM, VK_FORMAT_R16G16B16_UINT,
                        VK_FORMAT_R16G16B16_SINT, VK_FORMAT_R16G16B16_SFLOAT, kNone);
        case SurfaceType::R16_G16_B16_A16:
            return Pick(ch, VK_FORMAT_R16G16B16A16_UNORM, VK_FORMAT_R16G16B16A16_SNORM,
                        VK_FORMAT_R16G16B16A16_UINT, VK_FORMAT_R16G16B16A16_SINT,
                        VK_FORMAT_R16G16B16A16_SFLOAT, kNone);
        case SurfaceType::R32:
            return Pick(ch, kNone, kNone, VK_FORMAT_R32_UINT, VK_FORMAT_R32_SINT, VK_FORMAT_R32_SFLOAT, kNone);
        case SurfaceType::R32_G32:
            return Pick(ch, kNone, kNone, VK_FORMAT_R32G32_UINT, VK_FORMAT_R32G32_SINT,
                        VK_FORMAT_R32G32_SFLOAT, kNone);
        case SurfaceType::R32_G32_B32:
            return Pick(ch, kNone, kNone, VK_FORMAT_R32G32B32_UINT, VK_FORMAT_R32G32B32_SINT,
                        VK_FORMAT_R32G32B32_SFLOAT, kNone);
        case SurfaceType::R32_G32_B32_A32:
            return Pick(ch, kNone, kNone, VK_FORMAT_R32G32B32A32_UINT, VK_FORMAT_R32G32B32A32_SINT,
                        VK_FORMAT_R32G32B32A32_SFLOAT, kNone);
        // 深度格式忽略通道类型
        case SurfaceType::D16: return VK_FORMAT_D16_UNORM;
        case SurfaceType::D24: return VK_FORMAT_X8_D24_UNORM_PACK32;
        case SurfaceType::D24_S8: return VK_FORMAT_D24_UNORM_S8_UINT;
        case SurfaceType::D32: return VK_FORMAT_D32_SFLOAT;
        case SurfaceType::D32_S8: return VK_FORMAT_D32_SFLOAT_S8_UINT;
    }
    return VK_FORMAT_UNDEFINED;
}

VkBufferUsageFlags ToVkBufferUsage(BufferUsage u) {
    VkBufferUsageFlags f = VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT;
    if (HasBufferUsage(u, BufferUsage::Vertex)) f |= VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
    if (HasBufferUsage(u, BufferUsage::Index)) f |= VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
    if (HasBufferUsage(u, BufferUsage::Constant)) f |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    if (HasBufferUsage(u, BufferUsage::Storage)) f |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    if (HasBufferUsage(u, BufferUsage::TransferSrc)) f |= VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    if (HasBufferUsage(u, BufferUsage::TransferDst)) f |= VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    return f;
}

VkImageUsageFlags ToVkImageUsage(BindFlags u) {
    VkImageUsageFlags f = 0;
    if (HasBindFlag(u, BindFlags::ShaderResource)) f |= VK_IMAGE_USAGE_SAMPLED_BIT;
    if (HasBindFlag(u, BindFlags::UnorderedAccess)) f |= VK_IMAGE_USAGE_STORAGE_BIT;
    if (HasBindFlag(u, BindFlags::RenderTarget)) f |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    if (HasBindFlag(u, BindFlags::DepthStencil)) f |= VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    if (HasBindFlag(u, BindFlags::TransferSrc)) f |= VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    if (HasBindFlag(u, BindFlags::TransferDst)) f |= VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    return f;
}

VkSampleCountFlagBits ToVkSampleCount(std::uint32_t samples) {
    switch (samples) {
        case 1: return VK_SAMPLE_COUNT_1_BIT;
        case 2: return VK_SAMPLE_COUNT_2_BIT;
        case 4: return VK_SAMPLE_COUNT_4_BIT;
        case 8: return VK_SAMPLE_COUNT_8_BIT;
        case 16: return VK_SAMPLE_COUNT_16_BIT;
        case 32: return VK_SAMPLE_COUNT_32_BIT;
        case 64: return VK_SAMPLE_COUNT_64_BIT;
        default: return static_cast<VkSampleCountFlagBits>(0);
    }
}

VkImageAspectFlags ToVkImageAspect(SurfaceType surface) {
    if (!IsDepthSurface(surface)) return VK_IMAGE_ASPECT_COLOR_BIT;
    VkImageAspectFlags f = VK_IMAGE_ASPECT_DEPTH_BIT;
    if (HasStencil(surface)) f |= VK_IMAGE_ASPECT_STENCIL_BIT;
    return f;
}

VkShaderStageFlagBits ToVkShaderStage(ShaderStage s) {
    switch (s) {
        case ShaderStage::Vertex: return VK_SHADER_STAGE_VERTEX_BIT;
        case ShaderStage::Fragment: return VK_SHADER_STAGE_FRAGMENT_BIT;
        case ShaderStage::Compute: return VK_SHADER_STAGE_COMPUTE_BIT;
        case ShaderStage::Geometry: return VK_SHADER_STAGE_GEOMETRY_BIT;
        case ShaderStage::TessControl: return VK_SHADER_STAGE_TESSELLATION_CONTROL_BIT;
        case ShaderStage::TessEvaluation: return VK_SHADER_STAGE_TESSELLATION_EVALUATION_BIT;
    }
    return VK_SHADER_STAGE_VERTEX_BIT;
}

VkShaderStageFlags ToVkShaderStageMask(std::uint32_t stageMask) {
    VkShaderStageFlags f = 0;
    for (std::uint32_t i = 0; i <= StageIndex(ShaderStage::Compute); ++i)
        if (stageMask & (1u << i)) f |= ToVkShaderStage(static_cast<ShaderStage>(i));
    return f;
}

VkPrimitiveTopology ToVkPrimitiveTopology(PrimitiveTopology t) {
    switch (t) {
        case PrimitiveTopology::TriangleList: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        case PrimitiveTopology::TriangleStrip: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP;
        case PrimitiveTopology::LineList: return VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
        case PrimitiveTopology::LineStrip: return VK_PRIMITIVE_TOPOLOGY_LINE_STRIP;
        case PrimitiveTopology::PointList: return VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
    }
    return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
}

VkCompareOp ToVkCompareOp(CompareOp o) {
    switch (o) {
        case CompareOp::Never: return VK_COMPARE_OP_NEVER;
        case CompareOp::Less: return VK_COMPARE_OP_LESS;
        case CompareOp::Equal: return VK_COMPARE_OP_EQUAL;
        case CompareOp::LessOrEqual: return VK_COMPARE_OP_LESS_OR_EQUAL;
        case CompareOp::Greater: return VK_COMPARE_OP_GREATER;
        case CompareOp::NotEqual: return VK_COMPARE_OP_NOT_EQUAL;
        case CompareOp::GreaterOrEqual: return VK_COMPARE_OP_GREATER_OR_EQUAL;
        case CompareOp::Always: return VK_COMPARE_OP_ALWAYS;
    }
    return VK_COMPARE_OP_LESS;
}

VkStencilOp ToVkStencilOp(StencilOp o) {
    switch (o) {
        case StencilOp::Keep: return VK_STENCIL_OP_KEEP;
        case StencilOp::Zero: return VK_STENCIL_OP_ZERO;
        case StencilOp::Replace: return VK_STENCIL_OP_REPLACE;
        case StencilOp::IncrementClamp: return VK_STENCIL_OP_INCREMENT_AND_CLAMP;
        case StencilOp::DecrementClamp: return VK_STENCIL_OP_DECREMENT_AND_CLAMP;
        case StencilOp::Invert: return VK_STENCIL_OP_INVERT;
        case StencilOp::IncrementWrap: return VK_STENCIL_OP_INCREMENT_AND_WRAP;
        case StencilOp::DecrementWrap: return VK_STENCIL_OP_DECREMENT_AND_WRAP;
    }
    return VK_STENCIL_OP_KEEP;
}

VkBlendFactor ToVkBlendFactor(BlendFactor f) {
    switch (f) {
        case BlendFactor::Zero: return VK_BLEND_FACTOR_ZERO;
        case BlendFactor::One: return VK_BLEND_FACTOR_ONE;
        case BlendFactor::SrcColor: return VK_BLEND_FACTOR_SRC_COLOR;
        case BlendFactor::OneMinusSrcColor: return VK_BLEND_FACTOR_ONE_MINUS_SRC_COLOR;
        case BlendFactor::DstColor: return VK_BLEND_FACTOR_DST_COLOR;
        case BlendFactor::OneMinusDstColor: return VK_BLEND_FACTOR_ONE_MINUS_DST_COLOR;
        case BlendFactor::SrcAlpha: return VK_BLEND_FACTOR_SRC_ALPHA;
        case BlendFactor::OneMinusSrcAlpha: return VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        case BlendFactor::DstAlpha: return VK_BLEND_FACTOR_DST_ALPHA;
        case BlendFactor::OneMinusDstAlpha: return VK_BLEND_FACTOR_ONE_MINUS_DST_ALPHA;
        case BlendFactor::ConstantColor: return VK_BLEND_FACTOR_CONSTANT_COLOR;
        case BlendFactor::OneMinusConstantColor: return VK_BLEND_FACTOR_ONE_MINUS_CONSTANT_COLOR;
    }
    return VK_BLEND_FACTOR_ONE;
}

VkBlendOp ToVkBlendOp(BlendOp o) {
    switch (o) {
        case BlendOp::Add: return VK_BLEND_OP_ADD;
        case BlendOp::Subtract: return VK_BLEND_OP_SUBTRACT;
        case BlendOp::ReverseSubtract: return VK_BLEND_OP_REVERSE_SUBTRACT;
        case BlendOp::Min: return VK_BLEND_OP_MIN;
        case BlendOp::Max: return VK_BLEND_OP_MAX;
    }
    return VK_BLEND_OP_ADD;
}

VkDescriptorType ToVkDescriptorType(DescriptorType t) {
    switch (t) {
        case DescriptorType::UniformBuffer: return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        case DescriptorType::SampledImage: return VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
        case DescriptorType::Sampler: return VK_DESCRIPTOR_TYPE_SAMPLER;
        case DescriptorType::StorageBuffer: return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        case DescriptorType::StorageImage: return VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    }
    return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
}

VkCullModeFlags ToVkCullMode(CullMode m) {
    switch (m) {
        case CullMode::None: return VK_CULL_MODE_NONE;
        case CullMode::Front: return VK_CULL_MODE_FRONT_BIT;
        case CullMode::Back: return VK_CULL_MODE_BACK_BIT;
    }
    return VK_CULL_MODE_NONE;
}

VkPolygonMode ToVkPolygonMode(FillMode m) {
    return m == FillMode::Wireframe ? VK_POLYGON_MODE_LINE : VK_POLYGON_MODE_FILL;
}

VkFilter ToVkFilter(FilterMode m) {
    return m == FilterMode::Nearest ? VK_FILTER_NEAREST : VK_FILTER_LINEAR;
}

VkSamplerMipmapMode ToVkMipmapMode(FilterMode m) {
    return m == FilterMode::Nearest ? VK_SAMPLER_MIPMAP_MODE_NEAREST : VK_SAMPLER_MIPMAP_MODE_LINEAR;
}

VkSamplerAddressMode ToVkAddressMode(AddressMode m) {
    switch (m) {
        case AddressMode::Repeat: return VK_SAMPLER_ADDRESS_MODE_REPEAT;
        case AddressMode::MirroredRepeat: return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
        case AddressMode::ClampToEdge: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        case AddressMode::ClampToBorder: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_BORDER;
    }
    return VK_SAMPLER_ADDRESS_MODE_REPEAT;
}

Error MakeVkError(const std::string& operation, VkResult vr, const std::string& message) {
    Error e;
    e.code = (vr == VK_ERROR_OUT_OF_HOST_MEMORY || vr == VK_ERROR_OUT_OF_DEVICE_MEMORY)
                 ? ErrorCode::OutOfMemory
                 : ErrorCode::DriverFailure;
    e.operation = operation;
    e.message = message;
    e.vkResult = static_cast<std::int32_t>(vr);
    return e;
}

Error MakeError(ErrorCode code, const std::string& operation, const std::string& message) {
    Error e;
    e.code = code;
    e.operation = operation;
    e.message = message;
    return e;
}

}  // namespace vesta_device
