#include "ShmSegment.hpp"
#include "Errors.hpp"
#include <iostream>

namespace XBridge {

ShmSegment::ShmSegment(IShmTransport& transport, Window window, const WindowGeometry& geometry,
                       XImage* image, const XShmSegmentInfo& info,
                       unsigned int width, unsigned int height, int depth)
    : m_transport(transport),
      m_window(window),
      m_width(width),
      m_height(height),
      m_depth(depth),
      m_stride(static_cast<std::size_t>(image->bytes_per_line)),
      m_bitsPerPixel(image->bits_per_pixel),
      m_byteOrder(image->byte_order),
      m_segmentId(info.shmid),
      m_visualId(geometry.visualId),
      m_colormap(geometry.colormap),
      m_image(image),
      m_info(info) {}

ShmSegment::~ShmSegment() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != SegmentState::Closed) {
        std::cerr << "Shared memory segment for window 0x" << std::hex << m_window << std::dec
                  << " was never closed, tearing it down" << std::endl;
        teardownLocked();
    }
}

SegmentState ShmSegment::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool ShmSegment::hasPixels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_fetched;
}

const std::uint8_t* ShmSegment::pixelsAt(int x, int y) const {
    const auto* base = reinterpret_cast<const std::uint8_t*>(m_info.shmaddr);
    return base + static_cast<std::size_t>(y) * m_stride
                + static_cast<std::size_t>(x) * static_cast<std::size_t>(m_bitsPerPixel / 8);
}

bool ShmSegment::isOrphaned() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_orphaned;
}

void ShmSegment::releaseRef() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == SegmentState::Closed && m_orphaned) {
        // The transport may already be gone, only the count is left
        if (m_refs.load(std::memory_order_acquire) > 0) {
            m_refs.fetch_sub(1, std::memory_order_acq_rel);
        }
        return;
    }
    if (m_state == SegmentState::Closed) {
        throw UsageError("image wrapper released after its segment was torn down");
    }
    if (m_refs.load(std::memory_order_acquire) <= 0) {
        throw UsageError("shared memory segment released more often than acquired");
    }
    if (m_refs.fetch_sub(1, std::memory_order_acq_rel) == 1 && m_state == SegmentState::Closing) {
        teardownLocked();
    }
}

void ShmSegment::orphan() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == SegmentState::Closed) {
        return;
    }
    const int refs = m_refs.load(std::memory_order_acquire);
    if (refs > 0) {
        std::cerr << "Shared memory segment for window 0x" << std::hex << m_window << std::dec
                  << " torn down with " << refs << " image(s) still held" << std::endl;
    }
    teardownLocked();
    m_orphaned = true;
}

void ShmSegment::teardownLocked() {
    // Order matters: the server lets go first, then we unmap, then the
    // kernel may reclaim the segment.
    m_transport.detachServer(m_info);
    m_transport.unmapLocal(m_info.shmaddr);
    m_transport.markForRemoval(m_info.shmid);
    if (m_image) {
        m_transport.destroyImage(m_image);
        m_image = nullptr;
    }
    m_info.shmaddr = nullptr;
    m_info.shmid = -1;
    m_fetched = false;
    m_state = SegmentState::Closed;
}

} // namespace XBridge
