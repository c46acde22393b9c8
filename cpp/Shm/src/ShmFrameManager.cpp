#include "ShmFrameManager.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <iostream>

namespace XBridge {

ShmFrameManager::ShmFrameManager(DisplayContext& context, IShmTransport& transport, bool enabled)
    : m_context(context), m_transport(transport), m_enabled(enabled) {}

ShmFrameManager::~ShmFrameManager() {
    closeAll();
    // Segments still held by wrappers (or by a caller of openSegment) go
    // now, while the transport is known to be alive.
    for (auto& weak : m_opened) {
        if (auto segment = weak.lock()) {
            segment->orphan();
        }
    }
}

void ShmFrameManager::disable(const std::string& reason) {
    if (!m_disabled) {
        std::cerr << "XShm disabled for this session: " << reason << std::endl;
        std::cerr << "Falling back to non-SHM capture will be very slow." << std::endl;
    }
    m_disabled = true;
}

bool ShmFrameManager::negotiate() {
    if (m_supported) {
        return *m_supported;
    }
    if (!m_enabled) {
        std::cout << "XShm capture turned off by configuration" << std::endl;
        m_supported = false;
        return false;
    }
    m_context.checkUsable("ShmFrameManager::negotiate");
    m_supported = m_transport.queryExtension();
    if (*m_supported) {
        std::cout << "XShm extension available" << std::endl;
    } else {
        std::cerr << "XShm extension not supported!" << std::endl;
    }
    return *m_supported;
}

OpenResult ShmFrameManager::openSegment(Window window, unsigned int width, unsigned int height, int depth) {
    OpenResult result;
    if (m_disabled || !negotiate()) {
        result.status = OpenStatus::Disabled;
        result.reason = "XShm is not available";
        return result;
    }
    m_context.checkUsable("ShmFrameManager::openSegment");
    if (width == 0 || height == 0) {
        result.reason = "empty segment requested";
        return result;
    }

    auto geometry = m_transport.windowGeometry(window);
    if (!geometry) {
        result.reason = "window is gone";
        return result;
    }

    XShmSegmentInfo info{};
    info.shmid = -1;
    XImage* image = m_transport.createImage(*geometry, info, width, height, depth);
    if (!image) {
        result.reason = "the server rejected the image dimensions";
        return result;
    }

    // One spare row so stride-aligned reads of the last scanline stay
    // inside the allocation
    const std::size_t size = static_cast<std::size_t>(image->bytes_per_line) * (height + 1);
    info.shmid = m_transport.allocate(size);
    if (info.shmid == -1) {
        m_transport.destroyImage(image);
        disable("shared memory allocation failed");
        result.status = OpenStatus::Disabled;
        result.reason = "shmget failed";
        return result;
    }

    void* address = m_transport.mapLocal(info.shmid);
    if (!address) {
        m_transport.markForRemoval(info.shmid);
        m_transport.destroyImage(image);
        disable("shared memory attach failed");
        result.status = OpenStatus::Disabled;
        result.reason = "shmat failed";
        return result;
    }
    info.shmaddr = static_cast<char*>(address);
    info.readOnly = False;
    image->data = info.shmaddr;

    if (!m_transport.attachServer(info)) {
        m_transport.unmapLocal(address);
        m_transport.markForRemoval(info.shmid);
        m_transport.destroyImage(image);
        result.reason = "the server could not attach the segment";
        return result;
    }

    result.status = OpenStatus::Ok;
    result.segment = std::make_shared<ShmSegment>(m_transport, window, *geometry, image, info, width, height, depth);
    m_opened.erase(std::remove_if(m_opened.begin(), m_opened.end(),
                                  [](const std::weak_ptr<ShmSegment>& weak) { return weak.expired(); }),
                   m_opened.end());
    m_opened.push_back(result.segment);
    std::cout << "Created XShm segment " << info.shmid << " for window 0x" << std::hex << window << std::dec
              << ": " << width << "x" << height << " depth=" << depth
              << " bpp=" << image->bits_per_pixel << " (" << size << " bytes)" << std::endl;
    return result;
}

std::unique_ptr<ImageWrapper> ShmFrameManager::capture(const std::shared_ptr<ShmSegment>& segment, Drawable drawable,
                                                       int x, int y, int width, int height) {
    if (!segment) {
        throw UsageError("capture() without a segment");
    }
    std::lock_guard<std::mutex> lock(segment->m_mutex);
    if (segment->m_state != SegmentState::Open) {
        throw UsageError("capture() on a closed segment");
    }

    // Negative origins shrink the request
    if (x < 0) {
        width += x;
        x = 0;
    }
    if (y < 0) {
        height += y;
        y = 0;
    }
    const int segmentWidth = static_cast<int>(segment->m_width);
    const int segmentHeight = static_cast<int>(segment->m_height);
    if (width <= 0 || height <= 0 || x >= segmentWidth || y >= segmentHeight) {
        return nullptr;
    }
    width = std::min(width, segmentWidth - x);
    height = std::min(height, segmentHeight - y);

    if (!segment->m_fetched) {
        m_context.checkUsable("ShmFrameManager::capture");
        if (!m_transport.fetch(drawable, segment->m_image)) {
            std::cerr << "XShmGetImage failed for window 0x" << std::hex << segment->m_window << std::dec << std::endl;
            return nullptr;
        }
        segment->m_fetched = true;
        ++m_fetchCount;
    }

    segment->m_refs.fetch_add(1, std::memory_order_acq_rel);
    return std::unique_ptr<ImageWrapper>(new ImageWrapper(segment, x, y,
                                                          static_cast<unsigned int>(width),
                                                          static_cast<unsigned int>(height)));
}

void ShmFrameManager::discard(ShmSegment& segment) {
    std::lock_guard<std::mutex> lock(segment.m_mutex);
    segment.m_fetched = false;
}

void ShmFrameManager::release(ImageWrapper& wrapper) {
    wrapper.release();
}

void ShmFrameManager::close(ShmSegment& segment) {
    {
        std::lock_guard<std::mutex> lock(segment.m_mutex);
        if (segment.m_state != SegmentState::Open) {
            throw UsageError("shared memory segment closed twice");
        }
        if (segment.m_refs.load(std::memory_order_acquire) == 0) {
            segment.teardownLocked();
        } else {
            segment.m_state = SegmentState::Closing;
        }
    }
    auto it = m_segments.find(segment.m_window);
    if (it != m_segments.end() && it->second.get() == &segment) {
        m_segments.erase(it);
    }
}

std::optional<std::vector<PaletteEntry>> ShmFrameManager::readPalette(const ShmSegment& segment) {
    if (segment.depth() > 8) {
        std::cerr << "readPalette() on a depth " << segment.depth() << " segment" << std::endl;
        return std::nullopt;
    }
    m_context.checkUsable("ShmFrameManager::readPalette");

    std::vector<XVisualInfo> visuals = m_transport.visualsMatching(segment.visualId());
    if (visuals.size() != 1) {
        std::cerr << "Expected one visual for id 0x" << std::hex << segment.visualId() << std::dec
                  << " but found " << visuals.size() << std::endl;
        return std::nullopt;
    }

    const int count = std::min(visuals.front().colormap_size, 256);
    std::vector<PaletteEntry> palette(256);
    if (count <= 0) {
        return palette;
    }
    std::vector<XColor> colors = m_transport.queryColors(segment.colormap(), count);
    if (colors.empty()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < colors.size() && i < palette.size(); ++i) {
        palette[i].red = static_cast<std::uint8_t>(colors[i].red >> 8);
        palette[i].green = static_cast<std::uint8_t>(colors[i].green >> 8);
        palette[i].blue = static_cast<std::uint8_t>(colors[i].blue >> 8);
    }
    return palette;
}

std::unique_ptr<ImageWrapper> ShmFrameManager::getFrame(Window window, int x, int y, int width, int height) {
    if (m_disabled || !negotiate()) {
        return nullptr;
    }
    m_context.checkUsable("ShmFrameManager::getFrame");

    auto geometry = m_transport.windowGeometry(window);
    if (!geometry) {
        closeWindow(window);
        return nullptr;
    }

    std::shared_ptr<ShmSegment> segment = segmentFor(window);
    if (segment && (segment->width() != geometry->width || segment->height() != geometry->height
                    || segment->depth() != geometry->depth)) {
        // Segments never change size, replace it
        closeWindow(window);
        segment.reset();
    }
    if (!segment) {
        OpenResult result = openSegment(window, geometry->width, geometry->height, geometry->depth);
        if (!result.ok()) {
            std::cerr << "No XShm segment for window 0x" << std::hex << window << std::dec
                      << ": " << result.reason << std::endl;
            return nullptr;
        }
        segment = result.segment;
        m_segments[window] = segment;
    }
    return capture(segment, window, x, y, width, height);
}

std::shared_ptr<ShmSegment> ShmFrameManager::segmentFor(Window window) const {
    auto it = m_segments.find(window);
    return it == m_segments.end() ? nullptr : it->second;
}

void ShmFrameManager::discardAll() {
    for (auto& item : m_segments) {
        discard(*item.second);
    }
}

void ShmFrameManager::closeWindow(Window window) {
    auto it = m_segments.find(window);
    if (it == m_segments.end()) {
        return;
    }
    std::shared_ptr<ShmSegment> segment = it->second;
    m_segments.erase(it);
    if (segment->state() == SegmentState::Open) {
        close(*segment);
    }
}

void ShmFrameManager::closeAll() {
    while (!m_segments.empty()) {
        closeWindow(m_segments.begin()->first);
    }
}

nlohmann::json ShmFrameManager::info() const {
    nlohmann::json j;
    j["enabled"] = m_enabled;
    j["supported"] = m_supported.value_or(false);
    j["disabled"] = m_disabled;
    j["fetches"] = m_fetchCount;
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& item : m_segments) {
        const ShmSegment& segment = *item.second;
        segments.push_back({
            {"window", segment.window()},
            {"width", segment.width()},
            {"height", segment.height()},
            {"depth", segment.depth()},
            {"stride", segment.stride()},
            {"refs", segment.refCount()},
            {"has_pixels", segment.hasPixels()},
        });
    }
    j["segments"] = segments;
    return j;
}

} // namespace XBridge
