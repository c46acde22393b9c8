#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace XBridge {

/**
 * @brief Owned pixel storage with an arbitrary row stride.
 */
class Buffer {
public:
    Buffer(std::size_t width, std::size_t height, std::size_t bytesPerPixel = 4, std::size_t stride = 0);

    // A stride of 0 means tightly packed rows
    void resize(std::size_t width, std::size_t height, std::size_t bytesPerPixel = 4, std::size_t stride = 0);

    /**
     * @brief Copies height rows of width pixels from source, re-striding
     */
    void copyFrom(const std::uint8_t* source, std::size_t sourceStride);

    std::size_t width() const noexcept;
    std::size_t height() const noexcept;
    std::size_t stride() const noexcept;
    std::size_t bytesPerPixel() const noexcept;
    std::size_t size() const noexcept;

    std::uint8_t* data() noexcept;
    const std::uint8_t* data() const noexcept;

private:
    std::size_t m_width{};
    std::size_t m_height{};
    std::size_t m_bytesPerPixel{};
    std::size_t m_stride{};
    std::vector<std::uint8_t> m_data;
};

} // namespace XBridge
