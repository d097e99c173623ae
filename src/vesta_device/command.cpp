/**
 * @file command.cpp
 * @brief DataBuffer 与 CommandBuffer 实现
 */

#include <vesta_device/command.hpp>


namespace vesta_device {

DataPointer DataBuffer::Add(const void* data, std::size_t size) {
    DataPointer ptr{bytes_.size(), size};
    if (size > 0) {
        const auto* src = static_cast<const std::uint8_t*>(data);
        bytes_.insert(bytes_.end(), src, src + size);
    }
    return ptr;
}

const std::uint8_t* DataBuffer::Get(const DataPointer& ptr) const {
    if (ptr.offset > bytes_.size() || ptr.size > bytes_.size() - ptr.offset) return nullptr;
    return bytes_.data() + ptr.offset;
}

void CommandBuffer::UpdateBuffer(const BufferResource& buffer, const void* data,
                                 std::size_t size, std::size_t offset) {
    cmd::UpdateBuffer c;
    c.buffer = buffer;
    c.data = data_.Add(data, size);
    c.offset = offset;
    commands_.push_back(c);
}

void CommandBuffer::UpdateTexture(const TextureResource& texture, const ImageKind& kind,
                                  std::optional<CubeFace> face, const void* data,
                                  std::size_t size, const ImageInfo& info) {
    cmd::UpdateTexture c;
    c.texture = texture;
    c.kind = kind;
    c.face = face;
    c.data = data_.Add(data, size);
    c.info = info;
    commands_.push_back(c);
}

void CommandBuffer::Reset() {
    commands_.clear();
    data_.Reset();
}

}  // namespace vesta_device
