#pragma once
#include "DisplayContext.hpp"
#include "IShmTransport.hpp"
#include "ImageWrapper.hpp"
#include "ShmSegment.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace XBridge {

enum class OpenStatus {
    Ok,
    Retry,      // rejected for this window / size, another attempt may work
    Disabled    // shared memory is unusable for the rest of the session
};

struct OpenResult {
    OpenStatus status = OpenStatus::Retry;
    std::shared_ptr<ShmSegment> segment;
    std::string reason;

    bool ok() const { return status == OpenStatus::Ok; }
};

struct PaletteEntry {
    std::uint8_t red = 0;
    std::uint8_t green = 0;
    std::uint8_t blue = 0;
};

/**
 * @brief Captures window pixels through MIT-SHM segments.
 *
 * A segment's pixels are fetched at most once between two discard()
 * calls: the caller discards once per damage cycle, every capture in
 * between reuses the same pixels.
 */
class ShmFrameManager {
public:
    ShmFrameManager(DisplayContext& context, IShmTransport& transport, bool enabled = true);
    ~ShmFrameManager();

    ShmFrameManager(const ShmFrameManager&) = delete;
    ShmFrameManager& operator=(const ShmFrameManager&) = delete;

    /**
     * @brief Checks for MIT-SHM once per connection
     */
    bool negotiate();
    bool isDisabled() const { return m_disabled; }

    OpenResult openSegment(Window window, unsigned int width, unsigned int height, int depth);

    /**
     * @brief Returns a view of the clamped region, fetching the pixels
     * first if this segment has none since the last discard
     * @return nullptr when the region is outside the segment or the fetch
     * failed
     */
    std::unique_ptr<ImageWrapper> capture(const std::shared_ptr<ShmSegment>& segment, Drawable drawable,
                                          int x, int y, int width, int height);

    void discard(ShmSegment& segment);
    void release(ImageWrapper& wrapper);

    /**
     * @brief Tears the segment down now, or when its last wrapper goes
     * @throws UsageError if the segment was already closed
     */
    void close(ShmSegment& segment);

    /**
     * @brief Colormap of an indexed-color segment, 256 entries
     */
    std::optional<std::vector<PaletteEntry>> readPalette(const ShmSegment& segment);

    // One segment per window, recreated when the window is resized
    std::unique_ptr<ImageWrapper> getFrame(Window window, int x, int y, int width, int height);
    std::shared_ptr<ShmSegment> segmentFor(Window window) const;
    void discardAll();
    void closeWindow(Window window);
    void closeAll();

    std::uint64_t fetchCount() const { return m_fetchCount; }
    nlohmann::json info() const;

private:
    void disable(const std::string& reason);

    DisplayContext& m_context;
    IShmTransport& m_transport;
    bool m_enabled;
    std::optional<bool> m_supported;
    bool m_disabled = false;
    std::map<Window, std::shared_ptr<ShmSegment>> m_segments;
    // Every segment opened here, torn down at the latest with the manager
    std::vector<std::weak_ptr<ShmSegment>> m_opened;
    std::uint64_t m_fetchCount = 0;
};

} // namespace XBridge
