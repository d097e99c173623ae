/**
 * @file opengl_immediate_context.cpp
 * @brief OpenGL 4.5 即时上下文实现
 *
 * 资源创建使用 DSA（glCreate* / glNamed*）；GL 1.1 之外的函数经 SDL_GL_GetProcAddress 加载。
 * 纹理的丢弃映射经像素解包缓冲中转：Map 映射缓冲，Unmap 时 glTextureSubImage* 上传。
 */

#include <vesta_device/opengl_immediate_context.hpp>
#include <vesta_device/error.hpp>
#include <vesta_device/log.hpp>

#include <SDL3/SDL.h>
#include <SDL3/SDL_video.h>

#include <GL/gl.h>
#include <GL/glext.h>

#include <algorithm>
#include <vector>

// 加载 OpenGL 4.5 函数（gl.h 仅 1.1）
namespace {
#define GL_PFN(ret, name, args) typedef ret (GLAPIENTRY *PFN_##name) args; static PFN_##name pfn_##name;
GL_PFN(void, CreateBuffers, (GLsizei n, GLuint* buffers))
GL_PFN(void, NamedBufferStorage, (GLuint buffer, GLsizeiptr size, const void* data, GLbitfield flags))
GL_PFN(void, NamedBufferData, (GLuint buffer, GLsizeiptr size, const void* data, GLenum usage))
GL_PFN(void, NamedBufferSubData, (GLuint buffer, GLintptr offset, GLsizeiptr size, const void* data))
GL_PFN(void*, MapNamedBufferRange, (GLuint buffer, GLintptr offset, GLsizeiptr length, GLbitfield access))
GL_PFN(GLboolean, UnmapNamedBuffer, (GLuint buffer))
GL_PFN(void, DeleteBuffers, (GLsizei n, const GLuint* buffers))
GL_PFN(void, BindBuffer, (GLenum target, GLuint buffer))
GL_PFN(void, BindBufferBase, (GLenum target, GLuint index, GLuint buffer))
GL_PFN(void, CreateTextures, (GLenum target, GLsizei n, GLuint* textures))
GL_PFN(void, TextureStorage1D, (GLuint texture, GLsizei levels, GLenum internalformat, GLsizei width))
GL_PFN(void, TextureStorage2D, (GLuint texture, GLsizei levels, GLenum internalformat, GLsizei width, GLsizei height))
GL_PFN(void, TextureStorage3D, (GLuint texture, GLsizei levels, GLenum internalformat, GLsizei width, GLsizei height, GLsizei depth))
GL_PFN(void, TextureStorage2DMultisample, (GLuint texture, GLsizei samples, GLenum internalformat, GLsizei width, GLsizei height, GLboolean fixedsamplelocations))
GL_PFN(void, TextureSubImage1D, (GLuint texture, GLint level, GLint xoffset, GLsizei width, GLenum format, GLenum type, const void* pixels))
GL_PFN(void, TextureSubImage2D, (GLuint texture, GLint level, GLint xoffset, GLint yoffset, GLsizei width, GLsizei height, GLenum format, GLenum type, const void* pixels))
GL_PFN(void, TextureSubImage3D, (GLuint texture, GLint level, GLint xoffset, GLint yoffset, GLint zoffset, GLsizei width, GLsizei height, GLsizei depth, GLenum format, GLenum type, const void* pixels))
GL_PFN(void, BindTextureUnit, (GLuint unit, GLuint texture))
GL_PFN(void, GenerateTextureMipmap, (GLuint texture))
GL_PFN(GLuint, CreateShaderProgramv, (GLenum type, GLsizei count, const GLchar* const* strings))
GL_PFN(void, GetProgramiv, (GLuint program, GLenum pname, GLint* params))
GL_PFN(void, GetProgramInfoLog, (GLuint program, GLsizei maxLength, GLsizei* length, GLchar* infoLog))
GL_PFN(void, DeleteProgram, (GLuint program))
GL_PFN(void, GetActiveUniformBlockiv, (GLuint program, GLuint uniformBlockIndex, GLenum pname, GLint* params))
GL_PFN(void, UniformBlockBinding, (GLuint program, GLuint uniformBlockIndex, GLuint uniformBlockBinding))
GL_PFN(void, GetActiveUniform, (GLuint program, GLuint index, GLsizei bufSize, GLsizei* length, GLint* size, GLenum* type, GLchar* name))
GL_PFN(GLint, GetUniformLocation, (GLuint program, const GLchar* name))
GL_PFN(void, GetUniformiv, (GLuint program, GLint location, GLint* params))
GL_PFN(void, ProgramUniform1i, (GLuint program, GLint location, GLint v0))
GL_PFN(void, CreateProgramPipelines, (GLsizei n, GLuint* pipelines))
GL_PFN(void, BindProgramPipeline, (GLuint pipeline))
GL_PFN(void, UseProgramStages, (GLuint pipeline, GLbitfield stages, GLuint program))
GL_PFN(void, DeleteProgramPipelines, (GLsizei n, const GLuint* pipelines))
GL_PFN(void, CreateVertexArrays, (GLsizei n, GLuint* arrays))
GL_PFN(void, BindVertexArray, (GLuint array))
GL_PFN(void, DeleteVertexArrays, (GLsizei n, const GLuint* arrays))
GL_PFN(void, EnableVertexArrayAttrib, (GLuint vaobj, GLuint index))
GL_PFN(void, VertexArrayAttribFormat, (GLuint vaobj, GLuint attribindex, GLint size, GLenum type, GLboolean normalized, GLuint relativeoffset))
GL_PFN(void, VertexArrayAttribIFormat, (GLuint vaobj, GLuint attribindex, GLint size, GLenum type, GLuint relativeoffset))
GL_PFN(void, VertexArrayAttribBinding, (GLuint vaobj, GLuint attribindex, GLuint bindingindex))
GL_PFN(void, VertexArrayBindingDivisor, (GLuint vaobj, GLuint bindingindex, GLuint divisor))
GL_PFN(void, VertexArrayVertexBuffer, (GLuint vaobj, GLuint bindingindex, GLuint buffer, GLintptr offset, GLsizei stride))
GL_PFN(void, VertexArrayElementBuffer, (GLuint vaobj, GLuint buffer))
GL_PFN(void, CreateSamplers, (GLsizei n, GLuint* samplers))
GL_PFN(void, DeleteSamplers, (GLsizei n, const GLuint* samplers))
GL_PFN(void, BindSampler, (GLuint unit, GLuint sampler))
GL_PFN(void, SamplerParameteri, (GLuint sampler, GLenum pname, GLint param))
GL_PFN(void, SamplerParameterf, (GLuint sampler, GLenum pname, GLfloat param))
GL_PFN(void, CreateFramebuffers, (GLsizei n, GLuint* framebuffers))
GL_PFN(void, DeleteFramebuffers, (GLsizei n, const GLuint* framebuffers))
GL_PFN(void, BindFramebuffer, (GLenum target, GLuint framebuffer))
GL_PFN(void, NamedFramebufferTexture, (GLuint framebuffer, GLenum attachment, GLuint texture, GLint level))
GL_PFN(void, NamedFramebufferTextureLayer, (GLuint framebuffer, GLenum attachment, GLuint texture, GLint level, GLint layer))
GL_PFN(void, NamedFramebufferDrawBuffers, (GLuint framebuffer, GLsizei n, const GLenum* bufs))
GL_PFN(void, ClearNamedFramebufferfv, (GLuint framebuffer, GLenum buffer, GLint drawbuffer, const GLfloat* value))
GL_PFN(void, ClearNamedFramebufferfi, (GLuint framebuffer, GLenum buffer, GLint drawbuffer, GLfloat depth, GLint stencil))
GL_PFN(void, ClearNamedFramebufferiv, (GLuint framebuffer, GLenum buffer, GLint drawbuffer, const GLint* value))
GL_PFN(void, ViewportIndexedf, (GLuint index, GLfloat x, GLfloat y, GLfloat w, GLfloat h))
GL_PFN(void, DepthRangeIndexed, (GLuint index, GLdouble n, GLdouble f))
GL_PFN(void, Enablei, (GLenum target, GLuint index))
GL_PFN(void, Disablei, (GLenum target, GLuint index))
GL_PFN(void, BlendFuncSeparatei, (GLuint buf, GLenum srcRGB, GLenum dstRGB, GLenum srcAlpha, GLenum dstAlpha))
GL_PFN(void, BlendEquationSeparatei, (GLuint buf, GLenum modeRGB, GLenum modeAlpha))
GL_PFN(void, ColorMaski, (GLuint index, GLboolean r, GLboolean g, GLboolean b, GLboolean a))
GL_PFN(void, BlendColor, (GLfloat red, GLfloat green, GLfloat blue, GLfloat alpha))
GL_PFN(void, SampleMaski, (GLuint maskNumber, GLbitfield mask))
GL_PFN(void, StencilFuncSeparate, (GLenum face, GLenum func, GLint ref, GLuint mask))
GL_PFN(void, StencilOpSeparate, (GLenum face, GLenum sfail, GLenum dpfail, GLenum dppass))
GL_PFN(void, StencilMaskSeparate, (GLenum face, GLuint mask))
GL_PFN(void, DrawArraysInstancedBaseInstance, (GLenum mode, GLint first, GLsizei count, GLsizei instancecount, GLuint baseinstance))
GL_PFN(void, DrawElementsBaseVertex, (GLenum mode, GLsizei count, GLenum type, const void* indices, GLint basevertex))
GL_PFN(void, DrawElementsInstancedBaseVertexBaseInstance, (GLenum mode, GLsizei count, GLenum type, const void* indices, GLsizei instancecount, GLint basevertex, GLuint baseinstance))
GL_PFN(void, DebugMessageCallback, (GLDEBUGPROC callback, const void* userParam))

bool LoadGLFunctions() {
#define LOAD(name) do { pfn_##name = (PFN_##name)SDL_GL_GetProcAddress("gl" #name); if (!pfn_##name) return false; } while(0)
    LOAD(CreateBuffers);
    LOAD(NamedBufferStorage);
    LOAD(NamedBufferData);
    LOAD(NamedBufferSubData);
    LOAD(MapNamedBufferRange);
    LOAD(UnmapNamedBuffer);
    LOAD(DeleteBuffers);
    LOAD(BindBuffer);
    LOAD(BindBufferBase);
    LOAD(CreateTextures);
    LOAD(TextureStorage1D);
    LOAD(TextureStorage2D);
    LOAD(TextureStorage3D);
    LOAD(TextureStorage2DMultisample);
    LOAD(TextureSubImage1D);
    LOAD(TextureSubImage2D);
    LOAD(TextureSubImage3D);
    LOAD(BindTextureUnit);
    LOAD(GenerateTextureMipmap);
    LOAD(CreateShaderProgramv);
    LOAD(GetProgramiv);
    LOAD(GetProgramInfoLog);
    LOAD(DeleteProgram);
    LOAD(GetActiveUniformBlockiv);
    LOAD(UniformBlockBinding);
    LOAD(GetActiveUniform);
    LOAD(GetUniformLocation);
    LOAD(GetUniformiv);
    LOAD(ProgramUniform1i);
    LOAD(CreateProgramPipelines);
    LOAD(BindProgramPipeline);
    LOAD(UseProgramStages);
    LOAD(DeleteProgramPipelines);
    LOAD(CreateVertexArrays);
    LOAD(BindVertexArray);
    LOAD(DeleteVertexArrays);
    LOAD(EnableVertexArrayAttrib);
    LOAD(VertexArrayAttribFormat);
    LOAD(VertexArrayAttribIFormat);
    LOAD(VertexArrayAttribBinding);
    LOAD(VertexArrayBindingDivisor);
    LOAD(VertexArrayVertexBuffer);
    LOAD(VertexArrayElementBuffer);
    LOAD(CreateSamplers);
    LOAD(DeleteSamplers);
    LOAD(BindSampler);
    LOAD(SamplerParameteri);
    LOAD(SamplerParameterf);
    LOAD(CreateFramebuffers);
    LOAD(DeleteFramebuffers);
    LOAD(BindFramebuffer);
    LOAD(NamedFramebufferTexture);
    LOAD(NamedFramebufferTextureLayer);
    LOAD(NamedFramebufferDrawBuffers);
    LOAD(ClearNamedFramebufferfv);
    LOAD(ClearNamedFramebufferfi);
    LOAD(ClearNamedFramebufferiv);
    LOAD(ViewportIndexedf);
    LOAD(DepthRangeIndexed);
    LOAD(Enablei);
    LOAD(Disablei);
    LOAD(BlendFuncSeparatei);
    LOAD(BlendEquationSeparatei);
    LOAD(ColorMaski);
    LOAD(BlendColor);
    LOAD(SampleMaski);
    LOAD(StencilFuncSeparate);
    LOAD(StencilOpSeparate);
    LOAD(StencilMaskSeparate);
    LOAD(DrawArraysInstancedBaseInstance);
    LOAD(DrawElementsBaseVertex);
    LOAD(DrawElementsInstancedBaseVertexBaseInstance);
    LOAD(DebugMessageCallback);
#undef LOAD
    return true;
}
#undef GL_PFN
}  // namespace

namespace vesta_device {

// =============================================================================
// 常量与转换
// =============================================================================

namespace {

struct GLFormatInfo {
    GLenum internalFormat = 0;
    GLenum format = 0;
    GLenum type = 0;
};

/** 通道类型到表列：Unorm, Inorm, Uint, Int, Float */
int ChannelColumn(ChannelType ch) {
    switch (ch) {
        case ChannelType::Unorm: return 0;
        case ChannelType::Inorm: return 1;
        case ChannelType::Uint: return 2;
        case ChannelType::Int: return 3;
        case ChannelType::Float: return 4;
        case ChannelType::Srgb: return -1;
    }
    return -1;
}

bool IsIntegerChannel(ChannelType ch) {
    return ch == ChannelType::Uint || ch == ChannelType::Int;
}

/** 常规 R/RG/RGB/RGBA 8/16/32 位格式 */
bool ColorFormat(int components, int bits, ChannelType ch, GLFormatInfo& out) {
    static const GLenum k8[4][5] = {
        {GL_R8, GL_R8_SNORM, GL_R8UI, GL_R8I, 0},
        {GL_RG8, GL_RG8_SNORM, GL_RG8UI, GL_RG8I, 0},
        {GL_RGB8, GL_RGB8_SNORM, GL_RGB8UI, GL_RGB8I, 0},
        {GL_RGBA8, GL_RGBA8_SNORM, GL_RGBA8UI, GL_RGBA8I, 0},
    };
    static const GLenum k16[4][5] = {
        {GL_R16, GL_R16_SNORM, GL_R16UI, GL_R16I, GL_R16F},
        {GL_RG16, GL_RG16_SNORM, GL_RG16UI, GL_RG16I, GL_RG16F},
        {GL_RGB16, GL_RGB16_SNORM, GL_RGB16UI, GL_RGB16I, GL_RGB16F},
        {GL_RGBA16, GL_RGBA16_SNORM, GL_RGBA16UI, GL_RGBA16I, GL_RGBA16F},
    };
    static const GLenum k32[4][5] = {
        {0, 0, GL_R32UI, GL_R32I, GL_R32F},
        {0, 0, GL_RG32UI, GL_RG32I, GL_RG32F},
        {0, 0, GL_RGB32UI, GL_RGB32I, GL_RGB32F},
        {0, 0, GL_RGBA32UI, GL_RGBA32I, GL_RGBA32F},
    };
    static const GLenum kBase[4] = {GL_RED, GL_RG, GL_RGB, GL_RGBA};
    static const GLenum kBaseInteger[4] = {GL_RED_INTEGER, GL_RG_INTEGER, GL_RGB_INTEGER, GL_RGBA_INTEGER};

    const int col = ChannelColumn(ch);
    if (col < 0 || components < 1 || components > 4) return false;
    const int row = components - 1;
    switch (bits) {
        case 8:
            out.internalFormat = k8[row][col];
            out.type = (ch == ChannelType::Inorm || ch == ChannelType::Int) ? GL_BYTE : GL_UNSIGNED_BYTE;
            break;
        case 16:
            out.internalFormat = k16[row][col];
            out.type = ch == ChannelType::Float ? GL_HALF_FLOAT
                     : (ch == ChannelType::Inorm || ch == ChannelType::Int) ? GL_SHORT : GL_UNSIGNED_SHORT;
            break;
        case 32:
            out.internalFormat = k32[row][col];
            out.type = ch == ChannelType::Float ? GL_FLOAT
                     : ch == ChannelType::Int ? GL_INT : GL_UNSIGNED_INT;
            break;
        default:
            return false;
    }
    out.format = IsIntegerChannel(ch) ? kBaseInteger[row] : kBase[row];
    return out.internalFormat != 0;
}

bool ToGLFormat(const Format& f, GLFormatInfo& out) {
    switch (f.surface) {
        case SurfaceType::R8: return ColorFormat(1, 8, f.channel, out);
        case SurfaceType::R8_G8: return ColorFormat(2, 8, f.channel, out);
        case SurfaceType::R8_G8_B8_A8:
            if (f.channel == ChannelType::Srgb) {
                out = {GL_SRGB8_ALPHA8, GL_RGBA, GL_UNSIGNED_BYTE};
                return true;
            }
            return ColorFormat(4, 8, f.channel, out);
        case SurfaceType::B8_G8_R8_A8:
            if (f.channel == ChannelType::Srgb) {
                out = {GL_SRGB8_ALPHA8, GL_BGRA, GL_UNSIGNED_BYTE};
                return true;
            }
            if (f.channel != ChannelType::Unorm) return false;
            out = {GL_RGBA8, GL_BGRA, GL_UNSIGNED_BYTE};
            return true;
        case SurfaceType::R16: return ColorFormat(1, 16, f.channel, out);
        case SurfaceType::R16_G16: return ColorFormat(2, 16, f.channel, out);
        case SurfaceType::R16_G16_B16: return ColorFormat(3, 16, f.channel, out);
        case SurfaceType::R16_G16_B16_A16: return ColorFormat(4, 16, f.channel, out);
        case SurfaceType::R32: return ColorFormat(1, 32, f.channel, out);
        case SurfaceType::R32_G32: return ColorFormat(2, 32, f.channel, out);
        case SurfaceType::R32_G32_B32: return ColorFormat(3, 32, f.channel, out);
        case SurfaceType::R32_G32_B32_A32: return ColorFormat(4, 32, f.channel, out);
        case SurfaceType::R10_G10_B10_A2:
            if (f.channel == ChannelType::Unorm) {
                out = {GL_RGB10_A2, GL_RGBA, GL_UNSIGNED_INT_2_10_10_10_REV};
                return true;
            }
            if (f.channel == ChannelType::Uint) {
                out = {GL_RGB10_A2UI, GL_RGBA_INTEGER, GL_UNSIGNED_INT_2_10_10_10_REV};
                return true;
            }
            return false;
        case SurfaceType::R11_G11_B10:
            if (f.channel != ChannelType::Float) return false;
            out = {GL_R11F_G11F_B10F, GL_RGB, GL_UNSIGNED_INT_10F_11F_11F_REV};
            return true;
        case SurfaceType::R5_G6_B5:
            if (f.channel != ChannelType::Unorm) return false;
            out = {GL_RGB565, GL_RGB, GL_UNSIGNED_SHORT_5_6_5};
            return true;
        case SurfaceType::R4_G4_B4_A4:
            if (f.channel != ChannelType::Unorm) return false;
            out = {GL_RGBA4, GL_RGBA, GL_UNSIGNED_SHORT_4_4_4_4};
            return true;
        case SurfaceType::D16:
            out = {GL_DEPTH_COMPONENT16, GL_DEPTH_COMPONENT, GL_UNSIGNED_SHORT};
            return true;
        case SurfaceType::D24:
            out = {GL_DEPTH_COMPONENT24, GL_DEPTH_COMPONENT, GL_UNSIGNED_INT};
            return true;
        case SurfaceType::D24_S8:
            out = {GL_DEPTH24_STENCIL8, GL_DEPTH_STENCIL, GL_UNSIGNED_INT_24_8};
            return true;
        case SurfaceType::D32:
            out = {GL_DEPTH_COMPONENT32F, GL_DEPTH_COMPONENT, GL_FLOAT};
            return true;
        case SurfaceType::D32_S8:
            out = {GL_DEPTH32F_STENCIL8, GL_DEPTH_STENCIL, GL_FLOAT_32_UNSIGNED_INT_24_8_REV};
            return true;
        case SurfaceType::R4_G4:
            return false;
    }
    return false;
}

/** 顶点属性格式：分量数 + 分量类型 */
bool ToGLVertexFormat(const Format& f, GLint& components, GLenum& type) {
    GLFormatInfo info;
    switch (f.surface) {
        case SurfaceType::R10_G10_B10_A2:
            components = 4;
            type = f.channel == ChannelType::Inorm ? GL_INT_2_10_10_10_REV : GL_UNSIGNED_INT_2_10_10_10_REV;
            return true;
        case SurfaceType::R8: components = 1; break;
        case SurfaceType::R8_G8: components = 2; break;
        case SurfaceType::R8_G8_B8_A8: components = 4; break;
        case SurfaceType::R16: components = 1; break;
        case SurfaceType::R16_G16: components = 2; break;
        case SurfaceType::R16_G16_B16: components = 3; break;
        case SurfaceType::R16_G16_B16_A16: components = 4; break;
        case SurfaceType::R32: components = 1; break;
        case SurfaceType::R32_G32: components = 2; break;
        case SurfaceType::R32_G32_B32: components = 3; break;
        case SurfaceType::R32_G32_B32_A32: components = 4; break;
        default: return false;
    }
    if (!ToGLFormat(f, info)) return false;
    type = info.type;
    return true;
}

GLenum ToGLShaderType(ShaderStage s) {
    switch (s) {
        case ShaderStage::Vertex: return GL_VERTEX_SHADER;
        case ShaderStage::TessControl: return GL_TESS_CONTROL_SHADER;
        case ShaderStage::TessEvaluation: return GL_TESS_EVALUATION_SHADER;
        case ShaderStage::Geometry: return GL_GEOMETRY_SHADER;
        case ShaderStage::Fragment: return GL_FRAGMENT_SHADER;
        case ShaderStage::Compute: return GL_COMPUTE_SHADER;
    }
    return GL_VERTEX_SHADER;
}

GLbitfield ToGLShaderStageBit(ShaderStage s) {
    switch (s) {
        case ShaderStage::Vertex: return GL_VERTEX_SHADER_BIT;
        case ShaderStage::TessControl: return GL_TESS_CONTROL_SHADER_BIT;
        case ShaderStage::TessEvaluation: return GL_TESS_EVALUATION_SHADER_BIT;
        case ShaderStage::Geometry: return GL_GEOMETRY_SHADER_BIT;
        case ShaderStage::Fragment: return GL_FRAGMENT_SHADER_BIT;
        case ShaderStage::Compute: return GL_COMPUTE_SHADER_BIT;
    }
    return 0;
}

GLenum ToGLCompareFunc(CompareOp op) {
    switch (op) {
        case CompareOp::Never: return GL_NEVER;
        case CompareOp::Less: return GL_LESS;
        case CompareOp::Equal: return GL_EQUAL;
        case CompareOp::LessOrEqual: return GL_LEQUAL;
        case CompareOp::Greater: return GL_GREATER;
        case CompareOp::NotEqual: return GL_NOTEQUAL;
        case CompareOp::GreaterOrEqual: return GL_GEQUAL;
        case CompareOp::Always: return GL_ALWAYS;
    }
    return GL_ALWAYS;
}

GLenum ToGLStencilOp(StencilOp op) {
    switch (op) {
        case StencilOp::Keep: return GL_KEEP;
        case StencilOp::Zero: return GL_ZERO;
        case StencilOp::Replace: return GL_REPLACE;
        case StencilOp::IncrementClamp: return GL_INCR;
        case StencilOp::DecrementClamp: return GL_DECR;
        case StencilOp::Invert: return GL_INVERT;
        case StencilOp::IncrementWrap: return GL_INCR_WRAP;
        case StencilOp::DecrementWrap: return GL_DECR_WRAP;
    }
    return GL_KEEP;
}

GLenum ToGLBlendFactor(BlendFactor f) {
    switch (f) {
        case BlendFactor::Zero: return GL_ZERO;
        case BlendFactor::One: return GL_ONE;
        case BlendFactor::SrcColor: return GL_SRC_COLOR;
        case BlendFactor::OneMinusSrcColor: return GL_ONE_MINUS_SRC_COLOR;
        case BlendFactor::DstColor: return GL_DST_COLOR;
        case BlendFactor::OneMinusDstColor: return GL_ONE_MINUS_DST_COLOR;
        case BlendFactor::SrcAlpha: return GL_SRC_ALPHA;
        case BlendFactor::OneMinusSrcAlpha: return GL_ONE_MINUS_SRC_ALPHA;
        case BlendFactor::DstAlpha: return GL_DST_ALPHA;
        case BlendFactor::OneMinusDstAlpha: return GL_ONE_MINUS_DST_ALPHA;
        case BlendFactor::ConstantColor: return GL_CONSTANT_COLOR;
        case BlendFactor::OneMinusConstantColor: return GL_ONE_MINUS_CONSTANT_COLOR;
    }
    return GL_ONE;
}

GLenum ToGLBlendEquation(BlendOp op) {
    switch (op) {
        case BlendOp::Add: return GL_FUNC_ADD;
        case BlendOp::Subtract: return GL_FUNC_SUBTRACT;
        case BlendOp::ReverseSubtract: return GL_FUNC_REVERSE_SUBTRACT;
        case BlendOp::Min: return GL_MIN;
        case BlendOp::Max: return GL_MAX;
    }
    return GL_FUNC_ADD;
}

GLint ToGLAddressMode(AddressMode m) {
    switch (m) {
        case AddressMode::Repeat: return GL_REPEAT;
        case AddressMode::MirroredRepeat: return GL_MIRRORED_REPEAT;
        case AddressMode::ClampToEdge: return GL_CLAMP_TO_EDGE;
        case AddressMode::ClampToBorder: return GL_CLAMP_TO_BORDER;
    }
    return GL_REPEAT;
}

GLint ToGLMinFilter(FilterMode min, FilterMode mip) {
    if (min == FilterMode::Nearest)
        return mip == FilterMode::Nearest ? GL_NEAREST_MIPMAP_NEAREST : GL_NEAREST_MIPMAP_LINEAR;
    return mip == FilterMode::Nearest ? GL_LINEAR_MIPMAP_NEAREST : GL_LINEAR_MIPMAP_LINEAR;
}

GLenum ToGLTextureTarget(const ImageKind& kind) {
    switch (kind.dimension) {
        case ImageDimension::D1: return kind.layers > 1 ? GL_TEXTURE_1D_ARRAY : GL_TEXTURE_1D;
        case ImageDimension::D2:
            if (kind.samples > 1) return kind.layers > 1 ? GL_TEXTURE_2D_MULTISAMPLE_ARRAY : GL_TEXTURE_2D_MULTISAMPLE;
            return kind.layers > 1 ? GL_TEXTURE_2D_ARRAY : GL_TEXTURE_2D;
        case ImageDimension::D3: return GL_TEXTURE_3D;
        case ImageDimension::Cube: return kind.layers > 6 ? GL_TEXTURE_CUBE_MAP_ARRAY : GL_TEXTURE_CUBE_MAP;
    }
    return GL_TEXTURE_2D;
}

bool IsLayeredTarget(GLenum target) {
    return target == GL_TEXTURE_1D_ARRAY || target == GL_TEXTURE_2D_ARRAY ||
           target == GL_TEXTURE_2D_MULTISAMPLE_ARRAY || target == GL_TEXTURE_CUBE_MAP ||
           target == GL_TEXTURE_CUBE_MAP_ARRAY || target == GL_TEXTURE_3D;
}

bool IsSamplerUniformType(GLenum type) {
    switch (type) {
        case GL_SAMPLER_1D:
        case GL_SAMPLER_2D:
        case GL_SAMPLER_3D:
        case GL_SAMPLER_CUBE:
        case GL_SAMPLER_1D_SHADOW:
        case GL_SAMPLER_2D_SHADOW:
        case GL_SAMPLER_1D_ARRAY:
        case GL_SAMPLER_2D_ARRAY:
        case GL_SAMPLER_1D_ARRAY_SHADOW:
        case GL_SAMPLER_2D_ARRAY_SHADOW:
        case GL_SAMPLER_2D_MULTISAMPLE:
        case GL_SAMPLER_2D_MULTISAMPLE_ARRAY:
        case GL_SAMPLER_CUBE_SHADOW:
        case GL_SAMPLER_CUBE_MAP_ARRAY:
        case GL_SAMPLER_CUBE_MAP_ARRAY_SHADOW:
        case GL_INT_SAMPLER_1D:
        case GL_INT_SAMPLER_2D:
        case GL_INT_SAMPLER_3D:
        case GL_INT_SAMPLER_CUBE:
        case GL_INT_SAMPLER_1D_ARRAY:
        case GL_INT_SAMPLER_2D_ARRAY:
        case GL_UNSIGNED_INT_SAMPLER_1D:
        case GL_UNSIGNED_INT_SAMPLER_2D:
        case GL_UNSIGNED_INT_SAMPLER_3D:
        case GL_UNSIGNED_INT_SAMPLER_CUBE:
        case GL_UNSIGNED_INT_SAMPLER_1D_ARRAY:
        case GL_UNSIGNED_INT_SAMPLER_2D_ARRAY:
            return true;
        default:
            return false;
    }
}

void GLAPIENTRY OnGLDebugMessage(GLenum /*source*/, GLenum type, GLuint id, GLenum severity,
                                 GLsizei /*length*/, const GLchar* message, const void* /*user*/) {
    if (type == GL_DEBUG_TYPE_ERROR || severity == GL_DEBUG_SEVERITY_HIGH)
        GetLogger()->error("GL debug [{}]: {}", id, message);
    else if (severity != GL_DEBUG_SEVERITY_NOTIFICATION)
        GetLogger()->warn("GL debug [{}]: {}", id, message);
}

template <typename Map, typename Handle>
typename Map::mapped_type* Find(Map& map, Handle h) {
    auto it = map.find(h.id);
    return it == map.end() ? nullptr : &it->second;
}

}  // namespace

// =============================================================================
// 生命周期
// =============================================================================

OpenGLImmediateContext::~OpenGLImmediateContext() {
    Shutdown();
}

bool OpenGLImmediateContext::Initialize(const OpenGLContextConfig& config) {
    lastError_.clear();
    window_ = config.window;
    if (window_) {
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 4);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 5);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        if (config.debugOutput) SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_DEBUG_FLAG);

        SDL_GLContext ctx = SDL_GL_CreateContext(static_cast<SDL_Window*>(window_));
        if (!ctx) {
            lastError_ = std::string("SDL_GL_CreateContext: ") + SDL_GetError();
            return false;
        }
        glContext_ = ctx;
        ownsContext_ = true;
        if (!SDL_GL_MakeCurrent(static_cast<SDL_Window*>(window_), ctx)) {
            lastError_ = std::string("SDL_GL_MakeCurrent: ") + SDL_GetError();
            SDL_GL_DestroyContext(ctx);
            glContext_ = nullptr;
            ownsContext_ = false;
            return false;
        }
    } else if (!SDL_GL_GetCurrentContext()) {
        lastError_ = "OpenGL: no window given and no current GL context";
        return false;
    }

    if (!LoadGLFunctions()) {
        lastError_ = "OpenGL: failed to load GL functions (need 4.5 core)";
        if (ownsContext_) SDL_GL_DestroyContext(static_cast<SDL_GLContext>(glContext_));
        glContext_ = nullptr;
        ownsContext_ = false;
        return false;
    }

    if (config.debugOutput) {
        glEnable(GL_DEBUG_OUTPUT);
        glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
        pfn_DebugMessageCallback(OnGLDebugMessage, nullptr);
    }

    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    pfn_CreateProgramPipelines(1, &programPipeline_);
    pfn_BindProgramPipeline(programPipeline_);
    pfn_CreateVertexArrays(1, &defaultVertexArray_);
    currentVertexArray_ = defaultVertexArray_;
    pfn_BindVertexArray(currentVertexArray_);
    pfn_CreateFramebuffers(1, &drawFramebuffer_);
    pfn_CreateFramebuffers(1, &clearFramebuffer_);

    GLint maxTex = 0;
    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxTex);
    capabilities_ = BackendCapabilities{};
    capabilities_.immediateContext = true;
    capabilities_.explicitHeaps = false;
    capabilities_.heterogeneousHeaps = false;
    capabilities_.supportsGeometryShader = true;
    capabilities_.supportsTessellation = true;
    capabilities_.maxTextureSize = static_cast<std::uint32_t>(maxTex);
    return true;
}

void OpenGLImmediateContext::Shutdown() {
    if (!programPipeline_ && !glContext_) return;

    for (auto& p : buffers_) pfn_DeleteBuffers(1, &p.second.glBuffer);
    for (auto& p : textures_) {
        glDeleteTextures(1, &p.second.glTexture);
        if (p.second.unpackBuffer) pfn_DeleteBuffers(1, &p.second.unpackBuffer);
    }
    for (auto& p : shaders_) pfn_DeleteProgram(p.second.glProgram);
    for (auto& p : inputLayouts_) pfn_DeleteVertexArrays(1, &p.second.glVertexArray);
    for (auto& p : samplers_) pfn_DeleteSamplers(1, &p.second.glSampler);
    buffers_.clear();
    textures_.clear();
    shaders_.clear();
    inputLayouts_.clear();
    shaderResourceViews_.clear();
    renderTargetViews_.clear();
    depthStencilViews_.clear();
    samplers_.clear();
    rasterizerStates_.clear();
    depthStencilStates_.clear();
    blendStates_.clear();

    if (programPipeline_) {
        pfn_DeleteProgramPipelines(1, &programPipeline_);
        pfn_DeleteVertexArrays(1, &defaultVertexArray_);
        pfn_DeleteFramebuffers(1, &drawFramebuffer_);
        pfn_DeleteFramebuffers(1, &clearFramebuffer_);
    }
    programPipeline_ = defaultVertexArray_ = currentVertexArray_ = 0;
    drawFramebuffer_ = clearFramebuffer_ = 0;

    if (ownsContext_ && glContext_) SDL_GL_DestroyContext(static_cast<SDL_GLContext>(glContext_));
    glContext_ = nullptr;
    ownsContext_ = false;
    window_ = nullptr;
}

// =============================================================================
// 资源创建
// =============================================================================

BufferResource OpenGLImmediateContext::CreateBuffer(const BufferDesc& desc, const Usage& usage,
                                                    const void* data) {
    BufferResource result;
    result.usage = usage;
    if (desc.size == 0) {
        lastError_ = "CreateBuffer: size must be > 0";
        return result;
    }
    GLbitfield flags = 0;
    switch (usage.kind) {
        case UsageKind::Immutable:
            if (!data) {
                lastError_ = "CreateBuffer: immutable buffer requires initial data";
                return result;
            }
            break;
        case UsageKind::GpuOnly:
            flags = GL_DYNAMIC_STORAGE_BIT;
            break;
        case UsageKind::Dynamic:
            flags = GL_DYNAMIC_STORAGE_BIT | GL_MAP_WRITE_BIT;
            break;
        case UsageKind::CpuOnly:
            if (HasCpuAccess(usage.access, CpuAccess::Read)) flags |= GL_MAP_READ_BIT;
            if (HasCpuAccess(usage.access, CpuAccess::Write)) flags |= GL_MAP_WRITE_BIT;
            break;
        case UsageKind::Persistent:
            throw NotImplementedError("persistent-mapped OpenGL buffer");
    }

    GLuint buf = 0;
    pfn_CreateBuffers(1, &buf);
    pfn_NamedBufferStorage(buf, static_cast<GLsizeiptr>(desc.size), data, flags);
    if (glGetError() != GL_NO_ERROR) {
        pfn_DeleteBuffers(1, &buf);
        lastError_ = "CreateBuffer: glNamedBufferStorage failed";
        return result;
    }

    const std::uint64_t id = NextId();
    buffers_[id] = BufferRes{buf, desc.size, usage};
    result.handle.id = id;
    result.size = desc.size;
    return result;
}

TextureResource OpenGLImmediateContext::CreateTexture(const TextureDesc& desc, const Usage& usage,
                                                      const void* data) {
    TextureResource result;
    result.usage = usage;
    if (usage.kind == UsageKind::Persistent)
        throw NotImplementedError("persistent-mapped OpenGL texture");
    if (usage.kind == UsageKind::Immutable && !data) {
        lastError_ = "CreateTexture: immutable texture requires initial data";
        return result;
    }
    const ImageKind& k = desc.kind;
    if (k.width == 0 || k.height == 0 || k.depth == 0 || k.layers == 0 || desc.mipLevels == 0) {
        lastError_ = "CreateTexture: zero extent, layer or mip count";
        return result;
    }
    GLFormatInfo fmt;
    if (!ToGLFormat(desc.format, fmt)) {
        lastError_ = std::string("CreateTexture: unsupported format ") + ToString(desc.format.surface) +
                     "/" + ToString(desc.format.channel);
        return result;
    }

    const GLenum target = ToGLTextureTarget(k);
    const GLsizei levels = static_cast<GLsizei>(desc.mipLevels);
    GLuint tex = 0;
    pfn_CreateTextures(target, 1, &tex);
    switch (target) {
        case GL_TEXTURE_1D:
            pfn_TextureStorage1D(tex, levels, fmt.internalFormat, k.width);
            break;
        case GL_TEXTURE_1D_ARRAY:
            pfn_TextureStorage2D(tex, levels, fmt.internalFormat, k.width, k.layers);
            break;
        case GL_TEXTURE_2D:
        case GL_TEXTURE_CUBE_MAP:
            pfn_TextureStorage2D(tex, levels, fmt.internalFormat, k.width, k.height);
            break;
        case GL_TEXTURE_2D_MULTISAMPLE:
            pfn_TextureStorage2DMultisample(tex, k.samples, fmt.internalFormat, k.width, k.height, GL_TRUE);
            break;
        case GL_TEXTURE_2D_ARRAY:
        case GL_TEXTURE_CUBE_MAP_ARRAY:
            pfn_TextureStorage3D(tex, levels, fmt.internalFormat, k.width, k.height, k.layers);
            break;
        case GL_TEXTURE_3D:
            pfn_TextureStorage3D(tex, levels, fmt.internalFormat, k.width, k.height, k.depth);
            break;
        default:
            glDeleteTextures(1, &tex);
            lastError_ = "CreateTexture: unsupported image kind";
            return result;
    }
    if (glGetError() != GL_NO_ERROR) {
        glDeleteTextures(1, &tex);
        lastError_ = "CreateTexture: glTextureStorage failed";
        return result;
    }

    const std::uint64_t id = NextId();
    TextureRes res;
    res.glTexture = tex;
    res.target = target;
    res.desc = desc;
    res.usage = usage;
    textures_[id] = res;

    // 初始数据：逐层写入 mip 0
    if (data && k.samples <= 1) {
        const std::uint32_t layerCount = k.dimension == ImageDimension::D3 ? 1u : k.layers;
        const std::size_t layerBytes = static_cast<std::size_t>(k.width) * k.height * k.depth *
                                       (GetTotalBits(desc.format.surface) / 8);
        Box box;
        box.right = k.width;
        box.bottom = k.height;
        box.back = k.dimension == ImageDimension::D3 ? k.depth : 1u;
        for (std::uint32_t layer = 0; layer < layerCount; ++layer)
            UploadRegion(textures_[id], 0, layer, box, static_cast<const std::uint8_t*>(data) + layer * layerBytes);
    }

    result.handle.id = id;
    return result;
}

ShaderHandle OpenGLImmediateContext::CreateShader(ShaderStage stage, const std::string& source) {
    const GLchar* src = source.c_str();
    GLuint program = pfn_CreateShaderProgramv(ToGLShaderType(stage), 1, &src);
    if (!program) {
        lastError_ = "CreateShader: glCreateShaderProgramv failed";
        return {};
    }
    GLint linked = GL_FALSE;
    pfn_GetProgramiv(program, GL_LINK_STATUS, &linked);
    if (!linked) {
        GLint len = 0;
        pfn_GetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
        std::string log(static_cast<std::size_t>(std::max(len, 1)), '\0');
        pfn_GetProgramInfoLog(program, len, nullptr, &log[0]);
        lastError_ = "CreateShader: " + log;
        pfn_DeleteProgram(program);
        return {};
    }
    RemapProgramBindings(program, stage);

    const std::uint64_t id = NextId();
    shaders_[id] = ShaderRes{program, stage};
    ShaderHandle h;
    h.id = id;
    return h;
}

/** 将程序内 uniform block 绑定与采样器单元平移到该阶段的区段 */
void OpenGLImmediateContext::RemapProgramBindings(unsigned int program, ShaderStage stage) {
    const GLuint cbBase = StageIndex(stage) * kMaxConstantBuffers;
    const GLint unitBase = static_cast<GLint>(StageIndex(stage) * kMaxResourceViews);

    GLint blockCount = 0;
    pfn_GetProgramiv(program, GL_ACTIVE_UNIFORM_BLOCKS, &blockCount);
    for (GLint i = 0; i < blockCount; ++i) {
        GLint binding = 0;
        pfn_GetActiveUniformBlockiv(program, static_cast<GLuint>(i), GL_UNIFORM_BLOCK_BINDING, &binding);
        pfn_UniformBlockBinding(program, static_cast<GLuint>(i), cbBase + static_cast<GLuint>(binding));
    }

    GLint uniformCount = 0;
    pfn_GetProgramiv(program, GL_ACTIVE_UNIFORMS, &uniformCount);
    for (GLint i = 0; i < uniformCount; ++i) {
        GLchar name[256];
        GLsizei nameLen = 0;
        GLint size = 0;
        GLenum type = 0;
        pfn_GetActiveUniform(program, static_cast<GLuint>(i), sizeof(name), &nameLen, &size, &type, name);
        if (!IsSamplerUniformType(type)) continue;
        GLint location = pfn_GetUniformLocation(program, name);
        if (location < 0) continue;
        GLint unit = 0;
        pfn_GetUniformiv(program, location, &unit);
        pfn_ProgramUniform1i(program, location, unitBase + unit);
    }
}

InputLayoutHandle OpenGLImmediateContext::CreateInputLayout(const InputLayoutDesc& desc) {
    GLuint vao = 0;
    pfn_CreateVertexArrays(1, &vao);
    for (const VertexAttribute& attr : desc.attributes) {
        GLint components = 0;
        GLenum type = 0;
        if (!ToGLVertexFormat(attr.format, components, type)) {
            pfn_DeleteVertexArrays(1, &vao);
            lastError_ = "CreateInputLayout: unsupported attribute format at location " +
                         std::to_string(attr.location);
            return {};
        }
        pfn_EnableVertexArrayAttrib(vao, attr.location);
        if (IsIntegerChannel(attr.format.channel)) {
            pfn_VertexArrayAttribIFormat(vao, attr.location, components, type, attr.offset);
        } else {
            const GLboolean normalized =
                (attr.format.channel == ChannelType::Unorm || attr.format.channel == ChannelType::Inorm) ? GL_TRUE : GL_FALSE;
            pfn_VertexArrayAttribFormat(vao, attr.location, components, type, normalized, attr.offset);
        }
        pfn_VertexArrayAttribBinding(vao, attr.location, attr.binding);
    }
    for (std::size_t i = 0; i < desc.buffers.size(); ++i)
        pfn_VertexArrayBindingDivisor(vao, static_cast<GLuint>(i), desc.buffers[i].rate);

    const std::uint64_t id = NextId();
    inputLayouts_[id] = InputLayoutRes{vao};
    InputLayoutHandle h;
    h.id = id;
    return h;
}

ShaderResourceViewHandle OpenGLImmediateContext::CreateShaderResourceView(TextureHandle texture) {
    if (!Find(textures_, texture)) {
        lastError_ = "CreateShaderResourceView: invalid texture";
        return {};
    }
    const std::uint64_t id = NextId();
    shaderResourceViews_[id] = ViewRes{texture.id, 0, 0};
    ShaderResourceViewHandle h;
    h.id = id;
    return h;
}

RenderTargetViewHandle OpenGLImmediateContext::CreateRenderTargetView(TextureHandle texture,
                                                                      std::uint32_t mipLevel,
                                                                      std::uint32_t layer) {
    TextureRes* tex = Find(textures_, texture);
    if (!tex || IsDepthSurface(tex->desc.format.surface)) {
        lastError_ = "CreateRenderTargetView: invalid or depth texture";
        return {};
    }
    if (mipLevel >= tex->desc.mipLevels) {
        lastError_ = "CreateRenderTargetView: mip level out of range";
        return {};
    }
    const std::uint64_t id = NextId();
    renderTargetViews_[id] = ViewRes{texture.id, mipLevel, layer};
    RenderTargetViewHandle h;
    h.id = id;
    return h;
}

DepthStencilViewHandle OpenGLImmediateContext::CreateDepthStencilView(TextureHandle texture,
                                                                      std::uint32_t mipLevel,
                                                                      std::uint32_t layer) {
    TextureRes* tex = Find(textures_, texture);
    if (!tex || !IsDepthSurface(tex->desc.format.surface)) {
        lastError_ = "CreateDepthStencilView: invalid or non-depth texture";
        return {};
    }
    const std::uint64_t id = NextId();
    depthStencilViews_[id] = ViewRes{texture.id, mipLevel, layer};
    DepthStencilViewHandle h;
    h.id = id;
    return h;
}

SamplerHandle OpenGLImmediateContext::CreateSampler(const SamplerDesc& desc) {
    GLuint sampler = 0;
    pfn_CreateSamplers(1, &sampler);
    pfn_SamplerParameteri(sampler, GL_TEXTURE_MIN_FILTER, ToGLMinFilter(desc.minFilter, desc.mipFilter));
    pfn_SamplerParameteri(sampler, GL_TEXTURE_MAG_FILTER,
                          desc.magFilter == FilterMode::Nearest ? GL_NEAREST : GL_LINEAR);
    pfn_SamplerParameteri(sampler, GL_TEXTURE_WRAP_S, ToGLAddressMode(desc.addressU));
    pfn_SamplerParameteri(sampler, GL_TEXTURE_WRAP_T, ToGLAddressMode(desc.addressV));
    pfn_SamplerParameteri(sampler, GL_TEXTURE_WRAP_R, ToGLAddressMode(desc.addressW));
    pfn_SamplerParameterf(sampler, GL_TEXTURE_LOD_BIAS, desc.mipLodBias);
    pfn_SamplerParameterf(sampler, GL_TEXTURE_MIN_LOD, desc.minLod);
    pfn_SamplerParameterf(sampler, GL_TEXTURE_MAX_LOD, desc.maxLod);
    if (desc.maxAnisotropy > 1.0f)
        pfn_SamplerParameterf(sampler, GL_TEXTURE_MAX_ANISOTROPY_EXT, desc.maxAnisotropy);
    if (desc.compareEnable) {
        pfn_SamplerParameteri(sampler, GL_TEXTURE_COMPARE_MODE, GL_COMPARE_REF_TO_TEXTURE);
        pfn_SamplerParameteri(sampler, GL_TEXTURE_COMPARE_FUNC,
                              static_cast<GLint>(ToGLCompareFunc(desc.compareOp)));
    }
    const std::uint64_t id = NextId();
    samplers_[id] = SamplerRes{sampler};
    SamplerHandle h;
    h.id = id;
    return h;
}

RasterizerStateHandle OpenGLImmediateContext::CreateRasterizerState(const RasterizationState& desc) {
    const std::uint64_t id = NextId();
    rasterizerStates_[id] = desc;
    RasterizerStateHandle h;
    h.id = id;
    return h;
}

DepthStencilStateHandle OpenGLImmediateContext::CreateDepthStencilState(const DepthStencilState& desc) {
    const std::uint64_t id = NextId();
    depthStencilStates_[id] = desc;
    DepthStencilStateHandle h;
    h.id = id;
    return h;
}

BlendStateHandle OpenGLImmediateContext::CreateBlendState(const BlendDesc& desc) {
    if (desc.targets.size() > kMaxColorTargets) {
        lastError_ = "CreateBlendState: more targets than kMaxColorTargets";
        return {};
    }
    const std::uint64_t id = NextId();
    blendStates_[id] = desc;
    BlendStateHandle h;
    h.id = id;
    return h;
}

// =============================================================================
// 销毁（无效句柄为 no-op）
// =============================================================================

void OpenGLImmediateContext::DestroyBuffer(BufferHandle handle) {
    auto it = buffers_.find(handle.id);
    if (it == buffers_.end()) return;
    pfn_DeleteBuffers(1, &it->second.glBuffer);
    buffers_.erase(it);
}

void OpenGLImmediateContext::DestroyTexture(TextureHandle handle) {
    auto it = textures_.find(handle.id);
    if (it == textures_.end()) return;
    glDeleteTextures(1, &it->second.glTexture);
    if (it->second.unpackBuffer) pfn_DeleteBuffers(1, &it->second.unpackBuffer);
    textures_.erase(it);
}

void OpenGLImmediateContext::DestroyShader(ShaderHandle handle) {
    auto it = shaders_.find(handle.id);
    if (it == shaders_.end()) return;
    pfn_DeleteProgram(it->second.glProgram);
    shaders_.erase(it);
}

void OpenGLImmediateContext::DestroyInputLayout(InputLayoutHandle handle) {
    auto it = inputLayouts_.find(handle.id);
    if (it == inputLayouts_.end()) return;
    if (currentVertexArray_ == it->second.glVertexArray) {
        currentVertexArray_ = defaultVertexArray_;
        pfn_BindVertexArray(currentVertexArray_);
    }
    pfn_DeleteVertexArrays(1, &it->second.glVertexArray);
    inputLayouts_.erase(it);
}

void OpenGLImmediateContext::DestroyShaderResourceView(ShaderResourceViewHandle handle) {
    shaderResourceViews_.erase(handle.id);
}

void OpenGLImmediateContext::DestroyRenderTargetView(RenderTargetViewHandle handle) {
    renderTargetViews_.erase(handle.id);
}

void OpenGLImmediateContext::DestroyDepthStencilView(DepthStencilViewHandle handle) {
    depthStencilViews_.erase(handle.id);
}

void OpenGLImmediateContext::DestroySampler(SamplerHandle handle) {
    auto it = samplers_.find(handle.id);
    if (it == samplers_.end()) return;
    pfn_DeleteSamplers(1, &it->second.glSampler);
    samplers_.erase(it);
}

void OpenGLImmediateContext::DestroyRasterizerState(RasterizerStateHandle handle) {
    rasterizerStates_.erase(handle.id);
}

void OpenGLImmediateContext::DestroyDepthStencilState(DepthStencilStateHandle handle) {
    depthStencilStates_.erase(handle.id);
}

void OpenGLImmediateContext::DestroyBlendState(BlendStateHandle handle) {
    blendStates_.erase(handle.id);
}

// =============================================================================
// 管线阶段与输入装配
// =============================================================================

void OpenGLImmediateContext::SetShader(ShaderStage stage, ShaderHandle shader) {
    const ShaderRes* res = Find(shaders_, shader);
    pfn_UseProgramStages(programPipeline_, ToGLShaderStageBit(stage), res ? res->glProgram : 0);
}

void OpenGLImmediateContext::SetInputLayout(InputLayoutHandle layout) {
    const InputLayoutRes* res = Find(inputLayouts_, layout);
    currentVertexArray_ = res ? res->glVertexArray : defaultVertexArray_;
    pfn_BindVertexArray(currentVertexArray_);
    ApplyVertexArrayBindings();
}

/** GL 中顶点/索引缓冲属于 VAO：切换布局后重放上下文保留的绑定 */
void OpenGLImmediateContext::ApplyVertexArrayBindings() {
    for (std::uint32_t slot = 0; slot < kMaxVertexAttributes; ++slot) {
        const BufferRes* buf = Find(buffers_, vertexBuffers_[slot]);
        pfn_VertexArrayVertexBuffer(currentVertexArray_, slot, buf ? buf->glBuffer : 0,
                                    static_cast<GLintptr>(vertexOffsets_[slot]),
                                    static_cast<GLsizei>(vertexStrides_[slot]));
    }
    const BufferRes* index = Find(buffers_, indexBuffer_);
    pfn_VertexArrayElementBuffer(currentVertexArray_, index ? index->glBuffer : 0);
}

void OpenGLImmediateContext::SetIndexBuffer(BufferHandle buffer, IndexFormat format,
                                            std::uint32_t offset) {
    indexBuffer_ = buffer;
    indexFormat_ = format;
    indexOffset_ = offset;
    const BufferRes* res = Find(buffers_, buffer);
    pfn_VertexArrayElementBuffer(currentVertexArray_, res ? res->glBuffer : 0);
}

void OpenGLImmediateContext::SetVertexBuffers(std::uint32_t startSlot, std::uint32_t count,
                                              const BufferHandle* buffers,
                                              const std::uint32_t* strides,
                                              const std::uint32_t* offsets) {
    for (std::uint32_t i = 0; i < count && startSlot + i < kMaxVertexAttributes; ++i) {
        const std::uint32_t slot = startSlot + i;
        vertexBuffers_[slot] = buffers[i];
        vertexStrides_[slot] = strides[i];
        vertexOffsets_[slot] = offsets[i];
        const BufferRes* res = Find(buffers_, buffers[i]);
        pfn_VertexArrayVertexBuffer(currentVertexArray_, slot, res ? res->glBuffer : 0,
                                    static_cast<GLintptr>(offsets[i]), static_cast<GLsizei>(strides[i]));
    }
}

void OpenGLImmediateContext::SetPrimitiveTopology(PrimitiveTopology topology) {
    topology_ = topology;
}

unsigned int OpenGLImmediateContext::GetPrimitiveMode() const {
    switch (topology_) {
        case PrimitiveTopology::PointList: return GL_POINTS;
        case PrimitiveTopology::LineList: return GL_LINES;
        case PrimitiveTopology::LineStrip: return GL_LINE_STRIP;
        case PrimitiveTopology::TriangleList: return GL_TRIANGLES;
        case PrimitiveTopology::TriangleStrip: return GL_TRIANGLE_STRIP;
    }
    return GL_TRIANGLES;
}

// =============================================================================
// 每阶段资源
// =============================================================================

void OpenGLImmediateContext::SetConstantBuffers(ShaderStage stage, std::uint32_t startSlot,
                                                std::uint32_t count, const BufferHandle* buffers) {
    const GLuint base = StageIndex(stage) * kMaxConstantBuffers;
    for (std::uint32_t i = 0; i < count && startSlot + i < kMaxConstantBuffers; ++i) {
        const BufferRes* res = Find(buffers_, buffers[i]);
        pfn_BindBufferBase(GL_UNIFORM_BUFFER, base + startSlot + i, res ? res->glBuffer : 0);
    }
}

void OpenGLImmediateContext::SetShaderResources(ShaderStage stage, std::uint32_t startSlot,
                                                std::uint32_t count,
                                                const ShaderResourceViewHandle* views) {
    const GLuint base = StageIndex(stage) * kMaxResourceViews;
    for (std::uint32_t i = 0; i < count && startSlot + i < kMaxResourceViews; ++i) {
        GLuint tex = 0;
        if (const ViewRes* view = Find(shaderResourceViews_, views[i])) {
            auto it = textures_.find(view->texture);
            if (it != textures_.end()) tex = it->second.glTexture;
        }
        pfn_BindTextureUnit(base + startSlot + i, tex);
    }
}

void OpenGLImmediateContext::SetSamplers(ShaderStage stage, std::uint32_t startSlot,
                                         std::uint32_t count, const SamplerHandle* samplers) {
    const GLuint base = StageIndex(stage) * kMaxResourceViews;
    for (std::uint32_t i = 0; i < count && startSlot + i < kMaxSamplers; ++i) {
        const SamplerRes* res = Find(samplers_, samplers[i]);
        pfn_BindSampler(base + startSlot + i, res ? res->glSampler : 0);
    }
}

// =============================================================================
// 输出合并与固定功能状态
// =============================================================================

unsigned int OpenGLImmediateContext::ViewTexture(const ViewRes& view, bool& layered) const {
    auto it = textures_.find(view.texture);
    if (it == textures_.end()) return 0;
    layered = IsLayeredTarget(it->second.target);
    return it->second.glTexture;
}

void OpenGLImmediateContext::AttachColor(unsigned int fbo, std::uint32_t index, const ViewRes* view) {
    const GLenum attachment = GL_COLOR_ATTACHMENT0 + index;
    bool layered = false;
    const GLuint tex = view ? ViewTexture(*view, layered) : 0;
    if (tex && layered)
        pfn_NamedFramebufferTextureLayer(fbo, attachment, tex, static_cast<GLint>(view->mipLevel),
                                         static_cast<GLint>(view->layer));
    else
        pfn_NamedFramebufferTexture(fbo, attachment, tex, tex ? static_cast<GLint>(view->mipLevel) : 0);
}

void OpenGLImmediateContext::AttachDepthStencil(unsigned int fbo, const ViewRes* view) {
    bool layered = false;
    const GLuint tex = view ? ViewTexture(*view, layered) : 0;
    bool stencil = false;
    if (tex) {
        auto it = textures_.find(view->texture);
        stencil = HasStencil(it->second.desc.format.surface);
    }
    // 先拆掉两种挂点，避免旧的 depth-stencil 残留
    pfn_NamedFramebufferTexture(fbo, GL_DEPTH_STENCIL_ATTACHMENT, 0, 0);
    if (!tex) return;
    const GLenum attachment = stencil ? GL_DEPTH_STENCIL_ATTACHMENT : GL_DEPTH_ATTACHMENT;
    if (layered)
        pfn_NamedFramebufferTextureLayer(fbo, attachment, tex, static_cast<GLint>(view->mipLevel),
                                         static_cast<GLint>(view->layer));
    else
        pfn_NamedFramebufferTexture(fbo, attachment, tex, static_cast<GLint>(view->mipLevel));
}

void OpenGLImmediateContext::SetRenderTargets(std::uint32_t count,
                                              const RenderTargetViewHandle* colors,
                                              DepthStencilViewHandle depthStencil) {
    bool any = depthStencil.IsValid();
    for (std::uint32_t i = 0; i < count; ++i) any = any || colors[i].IsValid();
    if (!any) {
        pfn_BindFramebuffer(GL_DRAW_FRAMEBUFFER, 0);
        return;
    }

    std::array<GLenum, kMaxColorTargets> drawBuffers{};
    for (std::uint32_t i = 0; i < kMaxColorTargets; ++i) {
        const ViewRes* view = i < count ? Find(renderTargetViews_, colors[i]) : nullptr;
        AttachColor(drawFramebuffer_, i, view);
        drawBuffers[i] = view ? GL_COLOR_ATTACHMENT0 + i : GL_NONE;
    }
    AttachDepthStencil(drawFramebuffer_, Find(depthStencilViews_, depthStencil));
    pfn_NamedFramebufferDrawBuffers(drawFramebuffer_, static_cast<GLsizei>(kMaxColorTargets), drawBuffers.data());
    pfn_BindFramebuffer(GL_DRAW_FRAMEBUFFER, drawFramebuffer_);
}

void OpenGLImmediateContext::SetViewport(const Viewport& viewport) {
    pfn_ViewportIndexedf(0, viewport.x, viewport.y, viewport.width, viewport.height);
    pfn_DepthRangeIndexed(0, viewport.minDepth, viewport.maxDepth);
}

void OpenGLImmediateContext::SetScissor(const Rect& rect) {
    glScissor(rect.x, rect.y, static_cast<GLsizei>(rect.width), static_cast<GLsizei>(rect.height));
}

void OpenGLImmediateContext::ApplyRasterizer(const RasterizationState& desc) {
    glPolygonMode(GL_FRONT_AND_BACK, desc.fillMode == FillMode::Wireframe ? GL_LINE : GL_FILL);
    if (desc.cullMode == CullMode::None) {
        glDisable(GL_CULL_FACE);
    } else {
        glEnable(GL_CULL_FACE);
        glCullFace(desc.cullMode == CullMode::Front ? GL_FRONT : GL_BACK);
    }
    glFrontFace(desc.frontFaceCCW ? GL_CCW : GL_CW);
    if (desc.depthClampEnable) glEnable(GL_DEPTH_CLAMP); else glDisable(GL_DEPTH_CLAMP);
    if (desc.scissorEnable) glEnable(GL_SCISSOR_TEST); else glDisable(GL_SCISSOR_TEST);
    glLineWidth(desc.lineWidth);
    rasterizer_ = desc;
}

void OpenGLImmediateContext::SetRasterizerState(RasterizerStateHandle state) {
    const RasterizationState* desc = Find(rasterizerStates_, state);
    ApplyRasterizer(desc ? *desc : RasterizationState{});
}

void OpenGLImmediateContext::ApplyDepthStencil(const DepthStencilState& desc, std::uint32_t stencilRef) {
    if (desc.depthTestEnable) glEnable(GL_DEPTH_TEST); else glDisable(GL_DEPTH_TEST);
    glDepthFunc(ToGLCompareFunc(desc.depthCompareOp));
    glDepthMask(desc.depthWriteEnable ? GL_TRUE : GL_FALSE);
    if (desc.stencilTestEnable) glEnable(GL_STENCIL_TEST); else glDisable(GL_STENCIL_TEST);
    const GLint ref = static_cast<GLint>(stencilRef);
    pfn_StencilFuncSeparate(GL_FRONT, ToGLCompareFunc(desc.front.compareOp), ref, desc.stencilReadMask);
    pfn_StencilFuncSeparate(GL_BACK, ToGLCompareFunc(desc.back.compareOp), ref, desc.stencilReadMask);
    pfn_StencilOpSeparate(GL_FRONT, ToGLStencilOp(desc.front.failOp), ToGLStencilOp(desc.front.depthFailOp),
                          ToGLStencilOp(desc.front.passOp));
    pfn_StencilOpSeparate(GL_BACK, ToGLStencilOp(desc.back.failOp), ToGLStencilOp(desc.back.depthFailOp),
                          ToGLStencilOp(desc.back.passOp));
    pfn_StencilMaskSeparate(GL_FRONT_AND_BACK, desc.stencilWriteMask);
    depthStencil_ = desc;
    stencilRef_ = stencilRef;
}

void OpenGLImmediateContext::SetDepthStencilState(DepthStencilStateHandle state,
                                                  std::uint32_t stencilRef) {
    const DepthStencilState* desc = Find(depthStencilStates_, state);
    ApplyDepthStencil(desc ? *desc : DepthStencilState{}, stencilRef);
}

void OpenGLImmediateContext::SetBlendState(BlendStateHandle state, const glm::vec4& blendFactor,
                                           std::uint32_t sampleMask) {
    static const BlendDesc kDefaultBlend{};
    const BlendDesc* found = Find(blendStates_, state);
    const BlendDesc& desc = found ? *found : kDefaultBlend;
    const BlendState kDefaultTarget{};
    for (std::uint32_t i = 0; i < kMaxColorTargets; ++i) {
        // 单个目标描述时应用到全部目标
        const BlendState& t = desc.targets.empty() ? kDefaultTarget
                            : desc.targets.size() == 1 ? desc.targets[0]
                            : i < desc.targets.size() ? desc.targets[i] : kDefaultTarget;
        if (t.blendEnable) pfn_Enablei(GL_BLEND, i); else pfn_Disablei(GL_BLEND, i);
        pfn_BlendFuncSeparatei(i, ToGLBlendFactor(t.srcColorBlendFactor), ToGLBlendFactor(t.dstColorBlendFactor),
                               ToGLBlendFactor(t.srcAlphaBlendFactor), ToGLBlendFactor(t.dstAlphaBlendFactor));
        pfn_BlendEquationSeparatei(i, ToGLBlendEquation(t.colorBlendOp), ToGLBlendEquation(t.alphaBlendOp));
        pfn_ColorMaski(i, (t.writeMask & 1u) != 0, (t.writeMask & 2u) != 0, (t.writeMask & 4u) != 0,
                       (t.writeMask & 8u) != 0);
    }
    if (desc.alphaToCoverage) glEnable(GL_SAMPLE_ALPHA_TO_COVERAGE); else glDisable(GL_SAMPLE_ALPHA_TO_COVERAGE);
    pfn_BlendColor(blendFactor.r, blendFactor.g, blendFactor.b, blendFactor.a);
    if (sampleMask != 0xFFFFFFFFu) {
        glEnable(GL_SAMPLE_MASK);
        pfn_SampleMaski(0, sampleMask);
    } else {
        glDisable(GL_SAMPLE_MASK);
    }
}

// =============================================================================
// 资源写入
// =============================================================================

void OpenGLImmediateContext::UpdateSubresource(BufferHandle buffer, const Box& box, const void* data) {
    const BufferRes* res = Find(buffers_, buffer);
    if (!res) {
        GetLogger()->error("UpdateSubresource: unknown buffer {}", buffer.id);
        return;
    }
    if (box.right < box.left || box.right > res->size) {
        GetLogger()->error("UpdateSubresource: box [{}, {}) outside buffer {} of size {}", box.left,
                           box.right, buffer.id, res->size);
        return;
    }
    pfn_NamedBufferSubData(res->glBuffer, box.left, box.right - box.left, data);
}

bool OpenGLImmediateContext::ResolveSubresource(const TextureRes& tex, std::uint32_t subresource,
                                                SubresourceRegion& out) const {
    const std::uint32_t levels = tex.desc.mipLevels;
    const ImageKind& k = tex.desc.kind;
    out.level = subresource % levels;
    out.layer = subresource / levels;
    const std::uint32_t layerCount = k.dimension == ImageDimension::D3 ? 1u : k.layers;
    if (out.layer >= layerCount) return false;
    k.GetLevelDimensions(out.level, out.width, out.height, out.depth);
    return true;
}

void OpenGLImmediateContext::UploadRegion(const TextureRes& tex, std::uint32_t level,
                                          std::uint32_t layer, const Box& box, const void* data) {
    GLFormatInfo fmt;
    if (!ToGLFormat(tex.desc.format, fmt)) return;
    const GLint lv = static_cast<GLint>(level);
    const GLsizei w = static_cast<GLsizei>(box.right - box.left);
    const GLsizei h = static_cast<GLsizei>(box.bottom - box.top);
    const GLsizei d = static_cast<GLsizei>(box.back - box.front);
    switch (tex.target) {
        case GL_TEXTURE_1D:
            pfn_TextureSubImage1D(tex.glTexture, lv, box.left, w, fmt.format, fmt.type, data);
            break;
        case GL_TEXTURE_1D_ARRAY:
            pfn_TextureSubImage2D(tex.glTexture, lv, box.left, layer, w, 1, fmt.format, fmt.type, data);
            break;
        case GL_TEXTURE_2D:
            pfn_TextureSubImage2D(tex.glTexture, lv, box.left, box.top, w, h, fmt.format, fmt.type, data);
            break;
        case GL_TEXTURE_2D_ARRAY:
        case GL_TEXTURE_CUBE_MAP:
        case GL_TEXTURE_CUBE_MAP_ARRAY:
            pfn_TextureSubImage3D(tex.glTexture, lv, box.left, box.top, layer, w, h, 1, fmt.format, fmt.type, data);
            break;
        case GL_TEXTURE_3D:
            pfn_TextureSubImage3D(tex.glTexture, lv, box.left, box.top, box.front, w, h, d, fmt.format,
                                  fmt.type, data);
            break;
        default:
            GetLogger()->error("UploadRegion: texture target {:#x} cannot be written", tex.target);
            break;
    }
}

void OpenGLImmediateContext::UpdateSubresource(TextureHandle texture, std::uint32_t subresource,
                                               const Box& box, const void* data,
                                               std::uint32_t /*rowPitch*/,
                                               std::uint32_t /*depthPitch*/) {
    const TextureRes* tex = Find(textures_, texture);
    SubresourceRegion region;
    if (!tex || !ResolveSubresource(*tex, subresource, region)) {
        GetLogger()->error("UpdateSubresource: texture {} has no subresource {}", texture.id, subresource);
        return;
    }
    UploadRegion(*tex, region.level, region.layer, box, data);
}

bool OpenGLImmediateContext::MapDiscard(BufferHandle buffer, MappedSubresource& out) {
    const BufferRes* res = Find(buffers_, buffer);
    if (!res) return false;
    void* ptr = pfn_MapNamedBufferRange(res->glBuffer, 0, static_cast<GLsizeiptr>(res->size),
                                        GL_MAP_WRITE_BIT | GL_MAP_INVALIDATE_BUFFER_BIT);
    if (!ptr) return false;
    out.data = ptr;
    out.size = res->size;
    out.rowPitch = 0;
    out.depthPitch = 0;
    return true;
}

void OpenGLImmediateContext::Unmap(BufferHandle buffer) {
    const BufferRes* res = Find(buffers_, buffer);
    if (!res) return;
    if (pfn_UnmapNamedBuffer(res->glBuffer) == GL_FALSE)
        GetLogger()->error("Buffer {} contents were lost while mapped", buffer.id);
}

bool OpenGLImmediateContext::MapDiscard(TextureHandle texture, std::uint32_t subresource,
                                        MappedSubresource& out) {
    TextureRes* tex = Find(textures_, texture);
    SubresourceRegion region;
    if (!tex || !ResolveSubresource(*tex, subresource, region)) return false;

    const std::uint32_t bytesPerTexel = GetTotalBits(tex->desc.format.surface) / 8;
    const std::uint32_t rowPitch = region.width * bytesPerTexel;
    const std::uint32_t depthPitch = rowPitch * region.height;
    const std::size_t size = static_cast<std::size_t>(depthPitch) * region.depth;
    if (!tex->unpackBuffer) pfn_CreateBuffers(1, &tex->unpackBuffer);
    if (tex->unpackSize < size) {
        pfn_NamedBufferData(tex->unpackBuffer, static_cast<GLsizeiptr>(size), nullptr, GL_STREAM_DRAW);
        tex->unpackSize = size;
    }
    void* ptr = pfn_MapNamedBufferRange(tex->unpackBuffer, 0, static_cast<GLsizeiptr>(size),
                                        GL_MAP_WRITE_BIT | GL_MAP_INVALIDATE_BUFFER_BIT);
    if (!ptr) return false;
    out.data = ptr;
    out.size = size;
    out.rowPitch = rowPitch;
    out.depthPitch = depthPitch;
    out.width = region.width;
    out.height = region.height;
    out.depth = region.depth;
    return true;
}

void OpenGLImmediateContext::Unmap(TextureHandle texture, std::uint32_t subresource) {
    TextureRes* tex = Find(textures_, texture);
    SubresourceRegion region;
    if (!tex || !tex->unpackBuffer || !ResolveSubresource(*tex, subresource, region)) return;
    if (pfn_UnmapNamedBuffer(tex->unpackBuffer) == GL_FALSE) {
        GetLogger()->error("Texture {} staging contents were lost while mapped", texture.id);
        return;
    }
    Box box;
    box.right = region.width;
    box.bottom = region.height;
    box.back = region.depth;
    pfn_BindBuffer(GL_PIXEL_UNPACK_BUFFER, tex->unpackBuffer);
    UploadRegion(*tex, region.level, region.layer, box, nullptr);
    pfn_BindBuffer(GL_PIXEL_UNPACK_BUFFER, 0);
}

void OpenGLImmediateContext::GenerateMips(ShaderResourceViewHandle view) {
    const ViewRes* res = Find(shaderResourceViews_, view);
    auto it = res ? textures_.find(res->texture) : textures_.end();
    if (it == textures_.end()) {
        GetLogger()->error("GenerateMips: unknown shader resource view {}", view.id);
        return;
    }
    pfn_GenerateTextureMipmap(it->second.glTexture);
}

// =============================================================================
// 清除（不受剪裁与写掩码影响）
// =============================================================================

void OpenGLImmediateContext::ClearRenderTargetView(RenderTargetViewHandle target, const glm::vec4& color) {
    const ViewRes* view = Find(renderTargetViews_, target);
    if (!view) {
        GetLogger()->error("ClearColor: unknown render target view {}", target.id);
        return;
    }
    AttachColor(clearFramebuffer_, 0, view);
    const GLenum drawBuffer = GL_COLOR_ATTACHMENT0;
    pfn_NamedFramebufferDrawBuffers(clearFramebuffer_, 1, &drawBuffer);
    glDisable(GL_SCISSOR_TEST);
    pfn_ColorMaski(0, GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
    const GLfloat value[4] = {color.r, color.g, color.b, color.a};
    pfn_ClearNamedFramebufferfv(clearFramebuffer_, GL_COLOR, 0, value);
    AttachColor(clearFramebuffer_, 0, nullptr);
    if (rasterizer_.scissorEnable) glEnable(GL_SCISSOR_TEST);
}

void OpenGLImmediateContext::ClearDepthStencilView(DepthStencilViewHandle target, std::uint32_t flags,
                                                   float depth, std::uint8_t stencil) {
    const ViewRes* view = Find(depthStencilViews_, target);
    if (!view) {
        GetLogger()->error("ClearDepthStencil: unknown depth-stencil view {}", target.id);
        return;
    }
    AttachDepthStencil(clearFramebuffer_, view);
    glDisable(GL_SCISSOR_TEST);
    glDepthMask(GL_TRUE);
    pfn_StencilMaskSeparate(GL_FRONT_AND_BACK, 0xFFu);

    const bool clearDepth = (flags & kClearDepth) != 0;
    const bool clearStencil = (flags & kClearStencil) != 0;
    if (clearDepth && clearStencil) {
        pfn_ClearNamedFramebufferfi(clearFramebuffer_, GL_DEPTH_STENCIL, 0, depth, stencil);
    } else if (clearDepth) {
        pfn_ClearNamedFramebufferfv(clearFramebuffer_, GL_DEPTH, 0, &depth);
    } else if (clearStencil) {
        const GLint s = stencil;
        pfn_ClearNamedFramebufferiv(clearFramebuffer_, GL_STENCIL, 0, &s);
    }

    AttachDepthStencil(clearFramebuffer_, nullptr);
    if (rasterizer_.scissorEnable) glEnable(GL_SCISSOR_TEST);
    glDepthMask(depthStencil_.depthWriteEnable ? GL_TRUE : GL_FALSE);
    pfn_StencilMaskSeparate(GL_FRONT_AND_BACK, depthStencil_.stencilWriteMask);
}

// =============================================================================
// 绘制（直接透传，不做校验）
// =============================================================================

void OpenGLImmediateContext::Draw(std::uint32_t vertexCount, std::uint32_t startVertex) {
    glDrawArrays(GetPrimitiveMode(), static_cast<GLint>(startVertex), static_cast<GLsizei>(vertexCount));
}

void OpenGLImmediateContext::DrawInstanced(std::uint32_t vertexCount, std::uint32_t instanceCount,
                                           std::uint32_t startVertex, std::uint32_t startInstance) {
    pfn_DrawArraysInstancedBaseInstance(GetPrimitiveMode(), static_cast<GLint>(startVertex),
                                        static_cast<GLsizei>(vertexCount),
                                        static_cast<GLsizei>(instanceCount), startInstance);
}

void OpenGLImmediateContext::DrawIndexed(std::uint32_t indexCount, std::uint32_t startIndex,
                                         std::int32_t baseVertex) {
    const std::size_t indexSize = indexFormat_ == IndexFormat::Uint16 ? 2u : 4u;
    const GLenum type = indexFormat_ == IndexFormat::Uint16 ? GL_UNSIGNED_SHORT : GL_UNSIGNED_INT;
    const std::uintptr_t offset = indexOffset_ + static_cast<std::uintptr_t>(startIndex) * indexSize;
    pfn_DrawElementsBaseVertex(GetPrimitiveMode(), static_cast<GLsizei>(indexCount), type,
                               reinterpret_cast<const void*>(offset), baseVertex);
}

void OpenGLImmediateContext::DrawIndexedInstanced(std::uint32_t indexCount, std::uint32_t instanceCount,
                                                  std::uint32_t startIndex, std::int32_t baseVertex,
                                                  std::uint32_t startInstance) {
    const std::size_t indexSize = indexFormat_ == IndexFormat::Uint16 ? 2u : 4u;
    const GLenum type = indexFormat_ == IndexFormat::Uint16 ? GL_UNSIGNED_SHORT : GL_UNSIGNED_INT;
    const std::uintptr_t offset = indexOffset_ + static_cast<std::uintptr_t>(startIndex) * indexSize;
    pfn_DrawElementsInstancedBaseVertexBaseInstance(GetPrimitiveMode(), static_cast<GLsizei>(indexCount), type,
                                                    reinterpret_cast<const void*>(offset),
                                                    static_cast<GLsizei>(instanceCount), baseVertex,
                                                    startInstance);
}

}  // namespace vesta_device
