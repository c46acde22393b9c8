#pragma once
#include "IShmTransport.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace XBridge {

enum class SegmentState {
    Open,
    Closing,    // close requested, waiting for the last wrapper
    Closed
};

/**
 * @brief A shared-memory segment attached by both this process and the X
 * server, sized for one window at fixed dimensions.
 *
 * Created and driven by ShmFrameManager. Wrappers keep the record alive
 * through shared ownership; the kernel resources go away in teardown,
 * which only happens once close was requested and no wrapper remains.
 * When the manager goes away first it tears every segment down itself:
 * wrappers still holding one lose their pixels and release without
 * touching the transport.
 */
class ShmSegment {
public:
    ShmSegment(IShmTransport& transport, Window window, const WindowGeometry& geometry,
               XImage* image, const XShmSegmentInfo& info,
               unsigned int width, unsigned int height, int depth);
    ~ShmSegment();

    ShmSegment(const ShmSegment&) = delete;
    ShmSegment& operator=(const ShmSegment&) = delete;

    Window window() const { return m_window; }
    unsigned int width() const { return m_width; }
    unsigned int height() const { return m_height; }
    int depth() const { return m_depth; }
    std::size_t stride() const { return m_stride; }
    int bitsPerPixel() const { return m_bitsPerPixel; }
    int byteOrder() const { return m_byteOrder; }
    int segmentId() const { return m_segmentId; }
    std::size_t allocationSize() const { return m_stride * (m_height + 1); }
    VisualID visualId() const { return m_visualId; }
    Colormap colormap() const { return m_colormap; }

    SegmentState state() const;
    int refCount() const { return m_refs.load(std::memory_order_acquire); }

    // True once the pixels were fetched since the last discard
    bool hasPixels() const;

    // Torn down by its manager while wrappers still held it
    bool isOrphaned() const;

private:
    friend class ShmFrameManager;
    friend class ImageWrapper;

    const std::uint8_t* pixelsAt(int x, int y) const;
    void releaseRef();
    void teardownLocked();
    void orphan();

    IShmTransport& m_transport;
    Window m_window;
    unsigned int m_width;
    unsigned int m_height;
    int m_depth;
    std::size_t m_stride;
    int m_bitsPerPixel;
    int m_byteOrder;
    int m_segmentId;
    VisualID m_visualId;
    Colormap m_colormap;
    XImage* m_image;
    XShmSegmentInfo m_info;

    mutable std::mutex m_mutex;
    std::atomic<int> m_refs{0};
    SegmentState m_state = SegmentState::Open;
    bool m_fetched = false;
    bool m_orphaned = false;
};

} // namespace XBridge
