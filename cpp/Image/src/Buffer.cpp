#include "Buffer.hpp"
#include <algorithm>
#include <cstring>

namespace XBridge {

Buffer::Buffer(std::size_t width, std::size_t height, std::size_t bytesPerPixel, std::size_t stride) {
    resize(width, height, bytesPerPixel, stride);
}

void Buffer::resize(std::size_t width, std::size_t height, std::size_t bytesPerPixel, std::size_t stride) {
    m_width = width;
    m_height = height;
    m_bytesPerPixel = bytesPerPixel;
    m_stride = std::max(stride, width * bytesPerPixel);

    m_data.assign(m_stride * m_height, 0);
}

void Buffer::copyFrom(const std::uint8_t* source, std::size_t sourceStride) {
    const std::size_t rowBytes = m_width * m_bytesPerPixel;
    if (sourceStride == m_stride) {
        std::memcpy(m_data.data(), source, m_stride * m_height);
        return;
    }
    for (std::size_t row = 0; row < m_height; ++row) {
        std::memcpy(m_data.data() + row * m_stride, source + row * sourceStride, rowBytes);
    }
}

std::size_t Buffer::width() const noexcept {
    return m_width;
}

std::size_t Buffer::height() const noexcept {
    return m_height;
}

std::size_t Buffer::stride() const noexcept {
    return m_stride;
}

std::size_t Buffer::bytesPerPixel() const noexcept {
    return m_bytesPerPixel;
}

std::size_t Buffer::size() const noexcept {
    return m_data.size();
}

std::uint8_t* Buffer::data() noexcept {
    return m_data.data();
}

const std::uint8_t* Buffer::data() const noexcept {
    return m_data.data();
}

} // namespace XBridge
