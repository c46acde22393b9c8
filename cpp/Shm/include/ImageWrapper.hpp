#pragma once
#include "Buffer.hpp"
#include "ShmSegment.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace XBridge {

/**
 * @brief Pixel format name for an image layout ("BGRX", "BGRA", ...)
 * @return an empty string for layouts we don't know how to describe
 */
std::string pixelFormatFor(int depth, int bitsPerPixel, int byteOrder);

/**
 * @brief Read-only view over a region of a shared-memory segment.
 *
 * Holds one reference on its segment until release(), freeze() or
 * restride(), whichever comes first; the destructor releases a reference
 * still held. Pixels are only valid until release().
 */
class ImageWrapper {
public:
    ~ImageWrapper();

    ImageWrapper(const ImageWrapper&) = delete;
    ImageWrapper& operator=(const ImageWrapper&) = delete;

    int x() const { return m_x; }
    int y() const { return m_y; }
    unsigned int width() const { return m_width; }
    unsigned int height() const { return m_height; }
    int depth() const { return m_depth; }
    int bitsPerPixel() const { return m_bitsPerPixel; }
    std::size_t bytesPerPixel() const { return static_cast<std::size_t>(m_bitsPerPixel / 8); }
    std::size_t stride() const;
    const std::string& pixelFormat() const { return m_pixelFormat; }

    const std::uint8_t* pixels() const;
    std::size_t size() const;

    /**
     * @brief Copies the pixels into owned memory with a new row stride and
     * lets go of the segment
     * @return false if newStride can't hold a row
     */
    bool restride(std::size_t newStride);

    /**
     * @brief Copies the pixels (same stride) so the segment can be reused
     */
    void freeze();

    /**
     * @throws UsageError when called twice
     */
    void release();

    bool isReleased() const { return m_released; }
    bool isFrozen() const { return m_owned != nullptr; }
    bool holdsSegment() const { return m_holdsRef; }
    const std::shared_ptr<ShmSegment>& backing() const { return m_backing; }

private:
    friend class ShmFrameManager;

    // Takes over a reference already acquired on backing
    ImageWrapper(std::shared_ptr<ShmSegment> backing, int x, int y, unsigned int width, unsigned int height);

    void copyToOwned(std::size_t stride);
    void checkNotReleased(const char* operation) const;

    std::shared_ptr<ShmSegment> m_backing;
    int m_x;
    int m_y;
    unsigned int m_width;
    unsigned int m_height;
    int m_depth;
    int m_bitsPerPixel;
    std::string m_pixelFormat;
    std::unique_ptr<Buffer> m_owned;
    bool m_holdsRef = true;
    bool m_released = false;
};

} // namespace XBridge
