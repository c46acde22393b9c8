#include "ImageWrapper.hpp"
#include "Errors.hpp"
#include <iostream>
#include <utility>

namespace XBridge {

std::string pixelFormatFor(int depth, int bitsPerPixel, int byteOrder) {
    const bool lsb = byteOrder == LSBFirst;
    switch (depth) {
        case 24:
            if (bitsPerPixel == 32) {
                return lsb ? "BGRX" : "XRGB";
            }
            return lsb ? "BGR" : "RGB";
        case 32:
            return lsb ? "BGRA" : "ARGB";
        case 30:
            return lsb ? "r210" : "R210";
        case 16:
            return lsb ? "BGR565" : "RGB565";
        case 8:
            return "RLE8";
        default:
            return "";
    }
}

ImageWrapper::ImageWrapper(std::shared_ptr<ShmSegment> backing, int x, int y, unsigned int width, unsigned int height)
    : m_backing(std::move(backing)),
      m_x(x),
      m_y(y),
      m_width(width),
      m_height(height),
      m_depth(m_backing->depth()),
      m_bitsPerPixel(m_backing->bitsPerPixel()),
      m_pixelFormat(pixelFormatFor(m_backing->depth(), m_backing->bitsPerPixel(), m_backing->byteOrder())) {}

ImageWrapper::~ImageWrapper() {
    if (!m_holdsRef) {
        return;
    }
    m_holdsRef = false;
    try {
        m_backing->releaseRef();
    } catch (const UsageError& e) {
        std::cerr << "Image wrapper destroyed: " << e.what() << std::endl;
    }
}

void ImageWrapper::checkNotReleased(const char* operation) const {
    if (m_released) {
        throw UsageError(std::string(operation) + " on a released image wrapper");
    }
}

std::size_t ImageWrapper::stride() const {
    return m_owned ? m_owned->stride() : m_backing->stride();
}

const std::uint8_t* ImageWrapper::pixels() const {
    checkNotReleased("pixels()");
    if (m_owned) {
        return m_owned->data();
    }
    if (m_backing->isOrphaned()) {
        throw UsageError("pixels() after the frame manager tore the segment down");
    }
    return m_backing->pixelsAt(m_x, m_y);
}

std::size_t ImageWrapper::size() const {
    return stride() * m_height;
}

void ImageWrapper::copyToOwned(std::size_t stride) {
    auto owned = std::make_unique<Buffer>(m_width, m_height, bytesPerPixel(), stride);
    owned->copyFrom(pixels(), this->stride());
    m_owned = std::move(owned);
    if (m_holdsRef) {
        m_holdsRef = false;
        m_backing->releaseRef();
    }
}

bool ImageWrapper::restride(std::size_t newStride) {
    checkNotReleased("restride()");
    if (newStride < m_width * bytesPerPixel()) {
        return false;
    }
    if (newStride == stride() && m_owned) {
        return true;
    }
    copyToOwned(newStride);
    return true;
}

void ImageWrapper::freeze() {
    checkNotReleased("freeze()");
    if (m_owned) {
        return;
    }
    copyToOwned(stride());
}

void ImageWrapper::release() {
    if (m_released) {
        throw UsageError("image wrapper released twice");
    }
    m_released = true;
    m_owned.reset();
    if (m_holdsRef) {
        m_holdsRef = false;
        m_backing->releaseRef();
    }
}

} // namespace XBridge
