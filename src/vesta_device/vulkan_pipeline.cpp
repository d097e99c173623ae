/**
 * @file vulkan_pipeline.cpp
 * @brief VulkanDevice：着色器库、描述符模型、管线布局与图形管线构建
 */

#include <vesta_device/error.hpp>
#include <vesta_device/log.hpp>
#include <vesta_device/shader_reflect.hpp>
#include <vesta_device/vulkan_device.hpp>
#include <vesta_device/vulkan_rdi_utils.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vesta_device {

// =============================================================================
// ShaderLib
// =============================================================================

bool ShaderLib::Add(const std::string& entryPoint, ShaderStage stage,
                    std::shared_ptr<const std::vector<std::uint32_t>> spirv) {
    Entry e;
    e.stage = stage;
    e.spirv = std::move(spirv);
    return entries_.emplace(entryPoint, std::move(e)).second;
}

const ShaderLib::Entry* ShaderLib::Find(const std::string& entryPoint) const {
    auto it = entries_.find(entryPoint);
    return it == entries_.end() ? nullptr : &it->second;
}

Result<ShaderLib> VulkanDevice::CreateShaderLibrary(const std::vector<ShaderEntry>& entries) {
    ShaderLib lib;
    std::vector<std::shared_ptr<const std::vector<std::uint32_t>>> modules;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const ShaderEntry& entry = entries[i];
        if (entry.spirv.empty() || entry.entryPoint.empty()) {
            Error e = MakeError(ErrorCode::InvalidArgument, "create shader library",
                                "entry " + std::to_string(i) + " has no name or no SPIR-V");
            e.index = static_cast<std::uint32_t>(i);
            return e;
        }
        // 相同字节码的入口共享同一模块
        std::shared_ptr<const std::vector<std::uint32_t>> module;
        for (const auto& m : modules) {
            if (*m == entry.spirv) {
                module = m;
                break;
            }
        }
        if (!module) {
            module = std::make_shared<const std::vector<std::uint32_t>>(entry.spirv);
            modules.push_back(module);
        }
        if (!lib.Add(entry.entryPoint, entry.stage, module))
            GetLogger()->warn("CreateShaderLibrary: duplicate entry point '{}' ignored", entry.entryPoint);
    }
    return lib;
}

Result<ShaderLib> VulkanDevice::CreateShaderLibraryFromSource(IShaderSourceCompiler& compiler,
                                                              const std::vector<ShaderSource>& sources) {
    std::vector<ShaderEntry> entries;
    entries.reserve(sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const ShaderSource& src = sources[i];
        ShaderCompileOutput out = compiler.Compile(src.entryPoint, src.stage, src.source);
        if (!out.success || out.spirv.empty()) {
            Error e = MakeError(ErrorCode::CompilationFailed, "compile shader '" + src.entryPoint + "'",
                                out.diagnostics);
            e.index = static_cast<std::uint32_t>(i);
            return e;
        }
        ShaderEntry entry;
        entry.entryPoint = src.entryPoint;
        entry.stage = src.stage;
        entry.spirv = std::move(out.spirv);
        entries.push_back(std::move(entry));
    }
    return CreateShaderLibrary(entries);
}

void VulkanDevice::DestroyShaderLibrary(ShaderLib& lib) {
    lib.Clear();
}

// =============================================================================
// 渲染通道（纯值）
// =============================================================================

Result<RenderPass> VulkanDevice::CreateRenderPass(const std::vector<AttachmentDesc>& attachments,
                                                  const std::vector<SubpassDesc>& subpasses) {
    static const char* kOp = "create render pass";
    for (std::size_t i = 0; i < attachments.size(); ++i) {
        if (ToVkFormat(attachments[i].format) == VK_FORMAT_UNDEFINED) {
            Error e = MakeError(ErrorCode::UnsupportedFormat, kOp, "attachment " + std::to_string(i));
            e.index = static_cast<std::uint32_t>(i);
            e.format = attachments[i].format;
            return e;
        }
        if (ToVkSampleCount(attachments[i].samples) == 0)
            return MakeError(ErrorCode::InvalidArgument, kOp,
                             "attachment " + std::to_string(i) + " has invalid sample count");
    }
    for (std::size_t s = 0; s < subpasses.size(); ++s) {
        const SubpassDesc& sp = subpasses[s];
        for (std::uint32_t a : sp.colorAttachments) {
            if (a >= attachments.size())
                return MakeError(ErrorCode::InvalidArgument, kOp,
                                 "subpass " + std::to_string(s) + " references attachment " + std::to_string(a));
            if (IsDepthSurface(attachments[a].format.surface)) {
                Error e = MakeError(ErrorCode::BadFormat, kOp, "depth format used as color attachment");
                e.format = attachments[a].format;
                return e;
            }
        }
        if (sp.depthStencilAttachment) {
            const std::uint32_t a = *sp.depthStencilAttachment;
            if (a >= attachments.size())
                return MakeError(ErrorCode::InvalidArgument, kOp,
                                 "subpass " + std::to_string(s) + " references attachment " + std::to_string(a));
            if (!IsDepthSurface(attachments[a].format.surface)) {
                Error e = MakeError(ErrorCode::BadFormat, kOp, "color format used as depth attachment");
                e.format = attachments[a].format;
                return e;
            }
        }
    }
    RenderPass pass;
    pass.attachments = attachments;
    pass.subpasses = subpasses;
    return pass;
}

void VulkanDevice::DestroyRenderPass(RenderPass& /*pass*/) {
    throw NotImplementedError("destroy render pass");
}

Result<Framebuffer> VulkanDevice::CreateFramebuffer(const RenderPass& pass,
                                                    const std::vector<RenderTargetViewHandle>& colors,
                                                    const std::vector<DepthStencilViewHandle>& depthStencil,
                                                    std::uint32_t width, std::uint32_t height,
                                                    std::uint32_t layers) {
    static const char* kOp = "create framebuffer";
    if (width == 0 || height == 0 || layers == 0)
        return MakeError(ErrorCode::InvalidArgument, kOp, "zero-sized framebuffer");
    if (colors.size() + depthStencil.size() > pass.attachments.size())
        return MakeError(ErrorCode::InvalidArgument, kOp,
                         std::to_string(colors.size() + depthStencil.size()) + " views for " +
                             std::to_string(pass.attachments.size()) + " render pass attachments");

    Framebuffer fb;
    fb.width = width;
    fb.height = height;
    fb.layers = layers;
    for (std::size_t i = 0; i < colors.size(); ++i) {
        auto it = renderTargetViews_.find(colors[i].id);
        if (it == renderTargetViews_.end()) {
            Error e = MakeError(ErrorCode::InvalidArgument, kOp, "unknown render target view");
            e.index = static_cast<std::uint32_t>(i);
            return e;
        }
        fb.colors.push_back(it->second.view);
    }
    for (std::size_t i = 0; i < depthStencil.size(); ++i) {
        auto it = depthStencilViews_.find(depthStencil[i].id);
        if (it == depthStencilViews_.end()) {
            Error e = MakeError(ErrorCode::InvalidArgument, kOp, "unknown depth stencil view");
            e.index = static_cast<std::uint32_t>(i);
            return e;
        }
        fb.depthStencil.push_back(it->second.view);
    }
    return fb;
}

void VulkanDevice::DestroyFramebuffer(Framebuffer& /*framebuffer*/) {
    throw NotImplementedError("destroy framebuffer");
}

// =============================================================================
// 描述符模型
// =============================================================================

DescriptorSetLayout VulkanDevice::CreateDescriptorSetLayout(const std::vector<DescriptorBinding>& bindings) {
    DescriptorSetLayout layout;
    layout.bindings = bindings;
    return layout;
}

void VulkanDevice::DestroyDescriptorSetLayout(DescriptorSetLayout& /*layout*/) {
    throw NotImplementedError("destroy descriptor set layout");
}

DescriptorPool VulkanDevice::CreateDescriptorPool(std::uint32_t maxSets, const std::vector<DescriptorRange>& ranges) {
    GetLogger()->warn("CreateDescriptorPool: heap-slice allocation for descriptor pools is not implemented "
                      "({} sets, {} ranges recorded only)",
                      maxSets, ranges.size());
    DescriptorPool pool;
    pool.maxSets = maxSets;
    pool.ranges = ranges;
    return pool;
}

void VulkanDevice::UpdateDescriptorSets(const std::vector<DescriptorSetWrite>& /*writes*/) {
    throw NotImplementedError("update descriptor sets");
}

void VulkanDevice::DestroyDescriptorPool(DescriptorPool& pool) {
    pool.maxSets = 0;
    pool.ranges.clear();
}

Result<PipelineLayoutHandle> VulkanDevice::CreatePipelineLayout(const std::vector<DescriptorSetLayout>& sets,
                                                                const std::vector<PushConstantRange>& pushConstants) {
    static const char* kOp = "create pipeline layout";
    std::vector<VkDescriptorSetLayout> setLayouts;
    setLayouts.reserve(sets.size());
    auto destroyTransient = [&]() {
        for (VkDescriptorSetLayout l : setLayouts) fn_.vkDestroyDescriptorSetLayout(device_, l, nullptr);
    };

    for (const DescriptorSetLayout& set : sets) {
        // 绑定按声明顺序展开，描述符缓冲内的偏移依赖此顺序
        std::vector<VkDescriptorSetLayoutBinding> vkBindings;
        vkBindings.reserve(set.bindings.size());
        for (const DescriptorBinding& b : set.bindings) {
            VkDescriptorSetLayoutBinding vb{};
            vb.binding = b.binding;
            vb.descriptorType = ToVkDescriptorType(b.type);
            vb.descriptorCount = b.count;
            vb.stageFlags = ToVkShaderStageMask(b.stageMask);
            vkBindings.push_back(vb);
        }
        VkDescriptorSetLayoutCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        ci.flags = VK_DESCRIPTOR_SET_LAYOUT_CREATE_DESCRIPTOR_BUFFER_BIT_EXT;
        ci.bindingCount = static_cast<std::uint32_t>(vkBindings.size());
        ci.pBindings = vkBindings.data();
        VkDescriptorSetLayout l = VK_NULL_HANDLE;
        VkResult vr = fn_.vkCreateDescriptorSetLayout(device_, &ci, nullptr, &l);
        if (vr != VK_SUCCESS) {
            destroyTransient();
            return MakeVkError(kOp, vr, "vkCreateDescriptorSetLayout failed");
        }
        setLayouts.push_back(l);
    }

    std::vector<VkPushConstantRange> ranges;
    for (const PushConstantRange& p : pushConstants)
        ranges.push_back({ToVkShaderStageMask(p.stageMask), p.offset, p.size});

    VkPipelineLayoutCreateInfo li{};
    li.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    li.setLayoutCount = static_cast<std::uint32_t>(setLayouts.size());
    li.pSetLayouts = setLayouts.data();
    li.pushConstantRangeCount = static_cast<std::uint32_t>(ranges.size());
    li.pPushConstantRanges = ranges.data();
    VkPipelineLayout layout = VK_NULL_HANDLE;
    VkResult vr = fn_.vkCreatePipelineLayout(device_, &li, nullptr, &layout);
    // 布局创建后集合布局即可释放
    destroyTransient();
    if (vr != VK_SUCCESS) return MakeVkError(kOp, vr, "vkCreatePipelineLayout failed");

    const std::uint64_t id = NextId();
    pipelineLayouts_[id] = layout;
    PipelineLayoutHandle h;
    h.id = id;
    return h;
}

void VulkanDevice::DestroyPipelineLayout(PipelineLayoutHandle /*layout*/) {
    throw NotImplementedError("destroy pipeline layout");
}

// =============================================================================
// 图形管线
// =============================================================================

std::vector<Result<PipelineHandle>> VulkanDevice::CreateGraphicsPipelines(
    const std::vector<GraphicsPipelineDesc>& descs) {
    std::vector<Result<PipelineHandle>> results;
    results.reserve(descs.size());
    for (std::size_t i = 0; i < descs.size(); ++i) {
        results.push_back(CreateGraphicsPipeline(descs[i], static_cast<std::uint32_t>(i)));
        if (!results.back().ok())
            GetLogger()->error("CreateGraphicsPipelines: pipeline {} failed: {}", i, results.back().error().ToString());
    }
    return results;
}

Result<PipelineHandle> VulkanDevice::CreateGraphicsPipeline(const GraphicsPipelineDesc& desc, std::uint32_t index) {
    const std::string op = "create graphics pipeline " + std::to_string(index);

    if (!desc.shaders) return MakeError(ErrorCode::InvalidArgument, op, "no shader library");
    auto layoutIt = pipelineLayouts_.find(desc.layout.id);
    if (layoutIt == pipelineLayouts_.end()) return MakeError(ErrorCode::InvalidArgument, op, "unknown pipeline layout");
    if (!desc.renderPass) return MakeError(ErrorCode::InvalidArgument, op, "no render pass");

    // --- 着色器阶段：入口缺失即阶段禁用，顶点阶段必需 ---
    const ShaderLib::Entry* vertex = desc.shaders->Find(desc.entries.vertex);
    if (!vertex) return MakeError(ErrorCode::MissingEntryPoint, op, "vertex entry '" + desc.entries.vertex + "'");

    struct StageSel {
        ShaderStage stage;
        const std::string* name;
        const ShaderLib::Entry* entry;
    };
    std::vector<StageSel> selected;
    selected.push_back({ShaderStage::Vertex, &desc.entries.vertex, vertex});
    const std::pair<ShaderStage, const std::string*> optional[] = {
        {ShaderStage::TessControl, &desc.entries.tessControl},
        {ShaderStage::TessEvaluation, &desc.entries.tessEvaluation},
        {ShaderStage::Geometry, &desc.entries.geometry},
        {ShaderStage::Fragment, &desc.entries.fragment},
    };
    for (const auto& o : optional) {
        if (o.second->empty()) continue;
        if (const ShaderLib::Entry* e = desc.shaders->Find(*o.second)) selected.push_back({o.first, o.second, e});
    }

    // --- 顶点输入：反射结果与属性逐一匹配 ---
    Result<std::vector<ReflectedInput>> reflected = ReflectVertexInputs(*vertex->spirv, desc.entries.vertex);
    if (!reflected.ok()) return reflected.error();

    std::vector<VkVertexInputAttributeDescription> attrs;
    attrs.reserve(desc.attributes.size());
    for (const VertexAttribute& a : desc.attributes) {
        if (a.binding >= desc.vertexBuffers.size()) {
            Error e = MakeError(ErrorCode::MissingVertexBuffer, op,
                                "attribute at location " + std::to_string(a.location) + " uses binding " +
                                    std::to_string(a.binding));
            e.index = a.binding;
            return e;
        }
        const auto match = std::find_if(reflected.value().begin(), reflected.value().end(),
                                        [&](const ReflectedInput& in) { return in.location == a.location; });
        if (match == reflected.value().end()) {
            Error e = MakeError(ErrorCode::MissingInputElement, op,
                                "vertex shader has no input at location " + std::to_string(a.location));
            e.index = a.location;
            return e;
        }
        const VkFormat format = ToVkFormat(a.format);
        if (format == VK_FORMAT_UNDEFINED) {
            Error e = MakeError(ErrorCode::UnsupportedFormat, op, "attribute " + std::to_string(a.location));
            e.index = a.location;
            e.format = a.format;
            return e;
        }
        attrs.push_back({a.location, a.binding, format, a.offset});
    }

    std::vector<VkVertexInputBindingDescription> bindings;
    std::vector<VkVertexInputBindingDivisorDescriptionEXT> divisors;
    for (std::uint32_t b = 0; b < desc.vertexBuffers.size(); ++b) {
        const VertexBufferDesc& vb = desc.vertexBuffers[b];
        bindings.push_back({b, vb.stride, vb.rate == 0 ? VK_VERTEX_INPUT_RATE_VERTEX : VK_VERTEX_INPUT_RATE_INSTANCE});
        if (vb.rate <= 1) continue;
        if (!capabilities_.supportsInstanceRateDivisor) {
            Error e = MakeError(ErrorCode::UnsupportedType, op,
                                "vertex buffer binding " + std::to_string(b) + " has instance rate " +
                                    std::to_string(vb.rate) + " but the device has no instance rate divisor");
            e.index = b;
            return e;
        }
        divisors.push_back({b, vb.rate});
    }

    VkPipelineVertexInputDivisorStateCreateInfoEXT divisorState{};
    divisorState.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_DIVISOR_STATE_CREATE_INFO_EXT;
    divisorState.vertexBindingDivisorCount = static_cast<std::uint32_t>(divisors.size());
    divisorState.pVertexBindingDivisors = divisors.data();

    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    if (!divisors.empty()) vertexInput.pNext = &divisorState;
    vertexInput.vertexBindingDescriptionCount = static_cast<std::uint32_t>(bindings.size());
    vertexInput.pVertexBindingDescriptions = bindings.data();
    vertexInput.vertexAttributeDescriptionCount = static_cast<std::uint32_t>(attrs.size());
    vertexInput.pVertexAttributeDescriptions = attrs.data();

    // --- 附件格式取自子通道 ---
    if (desc.subpass >= desc.renderPass->subpasses.size()) {
        Error e = MakeError(ErrorCode::InvalidSubpass, op,
                            "subpass " + std::to_string(desc.subpass) + " of " +
                                std::to_string(desc.renderPass->subpasses.size()));
        e.index = desc.subpass;
        return e;
    }
    const SubpassDesc& subpass = desc.renderPass->subpasses[desc.subpass];
    std::vector<VkFormat> colorFormats;
    for (std::uint32_t a : subpass.colorAttachments) {
        if (a >= desc.renderPass->attachments.size())
            return MakeError(ErrorCode::InvalidArgument, op, "color attachment index " + std::to_string(a));
        colorFormats.push_back(ToVkFormat(desc.renderPass->attachments[a].format));
    }
    VkPipelineRenderingCreateInfo rendering{};
    rendering.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    rendering.colorAttachmentCount = static_cast<std::uint32_t>(colorFormats.size());
    rendering.pColorAttachmentFormats = colorFormats.data();
    if (subpass.depthStencilAttachment) {
        const std::uint32_t a = *subpass.depthStencilAttachment;
        if (a >= desc.renderPass->attachments.size())
            return MakeError(ErrorCode::InvalidArgument, op, "depth attachment index " + std::to_string(a));
        const Format& df = desc.renderPass->attachments[a].format;
        rendering.depthAttachmentFormat = ToVkFormat(df);
        if (HasStencil(df.surface)) rendering.stencilAttachmentFormat = rendering.depthAttachmentFormat;
    }

    // --- 固定功能状态 ---
    const bool tessellated = std::any_of(selected.begin(), selected.end(), [](const StageSel& s) {
        return s.stage == ShaderStage::TessControl || s.stage == ShaderStage::TessEvaluation;
    });

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = tessellated ? VK_PRIMITIVE_TOPOLOGY_PATCH_LIST : ToVkPrimitiveTopology(desc.topology);
    inputAssembly.primitiveRestartEnable = VK_FALSE;

    VkPipelineTessellationStateCreateInfo tessellation{};
    tessellation.sType = VK_STRUCTURE_TYPE_PIPELINE_TESSELLATION_STATE_CREATE_INFO;
    tessellation.patchControlPoints = 3;

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo raster{};
    raster.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    raster.depthClampEnable = desc.rasterizer.depthClampEnable ? VK_TRUE : VK_FALSE;
    raster.rasterizerDiscardEnable = VK_FALSE;
    raster.polygonMode = ToVkPolygonMode(desc.rasterizer.fillMode);
    raster.cullMode = ToVkCullMode(desc.rasterizer.cullMode);
    raster.frontFace = desc.rasterizer.frontFaceCCW ? VK_FRONT_FACE_COUNTER_CLOCKWISE : VK_FRONT_FACE_CLOCKWISE;
    raster.lineWidth = desc.rasterizer.lineWidth;

    VkPipelineMultisampleStateCreateInfo multisample{};
    multisample.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisample.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;
    multisample.alphaToCoverageEnable = desc.blend.alphaToCoverage ? VK_TRUE : VK_FALSE;

    std::vector<VkPipelineColorBlendAttachmentState> blendAttachments(colorFormats.size());
    for (std::size_t i = 0; i < blendAttachments.size(); ++i) {
        const BlendState bs = i < desc.blend.targets.size() ? desc.blend.targets[i] : BlendState{};
        VkPipelineColorBlendAttachmentState& ba = blendAttachments[i];
        ba.colorWriteMask = static_cast<VkColorComponentFlags>(bs.writeMask & 0xF);
        ba.blendEnable = bs.blendEnable ? VK_TRUE : VK_FALSE;
        ba.srcColorBlendFactor = ToVkBlendFactor(bs.srcColorBlendFactor);
        ba.dstColorBlendFactor = ToVkBlendFactor(bs.dstColorBlendFactor);
        ba.colorBlendOp = ToVkBlendOp(bs.colorBlendOp);
        ba.srcAlphaBlendFactor = ToVkBlendFactor(bs.srcAlphaBlendFactor);
        ba.dstAlphaBlendFactor = ToVkBlendFactor(bs.dstAlphaBlendFactor);
        ba.alphaBlendOp = ToVkBlendOp(bs.alphaBlendOp);
    }

    VkPipelineColorBlendStateCreateInfo colorBlend{};
    colorBlend.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlend.logicOpEnable = VK_FALSE;
    colorBlend.attachmentCount = static_cast<std::uint32_t>(blendAttachments.size());
    colorBlend.pAttachments = blendAttachments.data();

    const DepthStencilState& ds = desc.depthStencil;
    auto toStencil = [&](const StencilFaceState& f) {
        VkStencilOpState s{};
        s.failOp = ToVkStencilOp(f.failOp);
        s.passOp = ToVkStencilOp(f.passOp);
        s.depthFailOp = ToVkStencilOp(f.depthFailOp);
        s.compareOp = ToVkCompareOp(f.compareOp);
        s.compareMask = ds.stencilReadMask;
        s.writeMask = ds.stencilWriteMask;
        return s;
    };
    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depthStencil.depthTestEnable = ds.depthTestEnable ? VK_TRUE : VK_FALSE;
    depthStencil.depthWriteEnable = ds.depthWriteEnable ? VK_TRUE : VK_FALSE;
    depthStencil.depthCompareOp = ToVkCompareOp(ds.depthCompareOp);
    depthStencil.stencilTestEnable = ds.stencilTestEnable ? VK_TRUE : VK_FALSE;
    depthStencil.front = toStencil(ds.front);
    depthStencil.back = toStencil(ds.back);
    depthStencil.maxDepthBounds = 1.0f;

    const VkDynamicState dynamicStates[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR,
                                            VK_DYNAMIC_STATE_STENCIL_REFERENCE, VK_DYNAMIC_STATE_BLEND_CONSTANTS};
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = static_cast<std::uint32_t>(sizeof(dynamicStates) / sizeof(dynamicStates[0]));
    dynamicState.pDynamicStates = dynamicStates;

    // --- 着色器模块仅在创建期间存在 ---
    std::vector<VkShaderModule> modules;
    std::vector<VkPipelineShaderStageCreateInfo> stages;
    auto destroyModules = [&]() {
        for (VkShaderModule m : modules) fn_.vkDestroyShaderModule(device_, m, nullptr);
    };
    for (const StageSel& s : selected) {
        VkShaderModuleCreateInfo mi{};
        mi.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        mi.codeSize = s.entry->spirv->size() * sizeof(std::uint32_t);
        mi.pCode = s.entry->spirv->data();
        VkShaderModule module = VK_NULL_HANDLE;
        VkResult vr = fn_.vkCreateShaderModule(device_, &mi, nullptr, &module);
        if (vr != VK_SUCCESS) {
            destroyModules();
            Error e = MakeError(ErrorCode::DriverFailure, op, "vkCreateShaderModule failed for '" + *s.name + "'");
            e.vkResult = static_cast<std::int32_t>(vr);
            return e;
        }
        modules.push_back(module);
        VkPipelineShaderStageCreateInfo si{};
        si.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        si.stage = ToVkShaderStage(s.stage);
        si.module = module;
        si.pName = s.name->c_str();
        stages.push_back(si);
    }

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.pNext = &rendering;
    pipelineInfo.flags = VK_PIPELINE_CREATE_DESCRIPTOR_BUFFER_BIT_EXT;
    pipelineInfo.stageCount = static_cast<std::uint32_t>(stages.size());
    pipelineInfo.pStages = stages.data();
    pipelineInfo.pVertexInputState = &vertexInput;
    pipelineInfo.pInputAssemblyState = &inputAssembly;
    pipelineInfo.pTessellationState = tessellated ? &tessellation : nullptr;
    pipelineInfo.pViewportState = &viewportState;
    pipelineInfo.pRasterizationState = &raster;
    pipelineInfo.pMultisampleState = &multisample;
    pipelineInfo.pDepthStencilState = &depthStencil;
    pipelineInfo.pColorBlendState = &colorBlend;
    pipelineInfo.pDynamicState = &dynamicState;
    pipelineInfo.layout = layoutIt->second;
    pipelineInfo.renderPass = VK_NULL_HANDLE;
    pipelineInfo.subpass = 0;

    VkPipeline pipeline = VK_NULL_HANDLE;
    VkResult vr = fn_.vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
    destroyModules();
    if (vr != VK_SUCCESS) {
        Error e = MakeError(ErrorCode::DriverFailure, op, "vkCreateGraphicsPipelines failed");
        e.vkResult = static_cast<std::int32_t>(vr);
        return e;
    }

    PipelineRes res;
    res.pipeline = pipeline;
    res.topology = desc.topology;
    const std::uint64_t id = NextId();
    pipelines_[id] = res;
    PipelineHandle h;
    h.id = id;
    return h;
}

std::vector<Result<PipelineHandle>> VulkanDevice::CreateComputePipelines(const std::vector<ShaderEntry>& /*entries*/,
                                                                         PipelineLayoutHandle /*layout*/) {
    throw NotImplementedError("create compute pipelines");
}

PrimitiveTopology VulkanDevice::GetPipelineTopology(PipelineHandle pipeline) const {
    auto it = pipelines_.find(pipeline.id);
    if (it == pipelines_.end()) throw std::invalid_argument("GetPipelineTopology: unknown pipeline");
    return it->second.topology;
}

void VulkanDevice::DestroyGraphicsPipeline(PipelineHandle pipeline) {
    auto it = pipelines_.find(pipeline.id);
    if (it == pipelines_.end()) return;
    fn_.vkDestroyPipeline(device_, it->second.pipeline, nullptr);
    pipelines_.erase(it);
}

void VulkanDevice::DestroyComputePipeline(PipelineHandle /*pipeline*/) {
    throw NotImplementedError("destroy compute pipeline");
}

}  // namespace vesta_device
