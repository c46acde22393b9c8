#pragma once
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XShm.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace XBridge {

struct WindowGeometry {
    int x = 0;
    int y = 0;
    unsigned int width = 0;
    unsigned int height = 0;
    int depth = 0;
    Visual* visual = nullptr;
    VisualID visualId = 0;
    Colormap colormap = None;
};

/**
 * @brief The kernel and protocol primitives behind a shared-memory segment.
 *
 * Each method is one call, the frame manager owns the ordering.
 */
class IShmTransport {
public:
    virtual ~IShmTransport() = default;

    virtual bool queryExtension() = 0;

    // Empty when the window no longer exists
    virtual std::optional<WindowGeometry> windowGeometry(Window window) = 0;

    /**
     * @brief Creates the image header for a segment (no pixel memory yet)
     * @return nullptr when the server side rejects these dimensions
     */
    virtual XImage* createImage(const WindowGeometry& geometry, XShmSegmentInfo& info,
                                unsigned int width, unsigned int height, int depth) = 0;
    virtual void destroyImage(XImage* image) = 0;

    // shmget, -1 on failure
    virtual int allocate(std::size_t size) = 0;
    // shmat, nullptr on failure
    virtual void* mapLocal(int shmid) = 0;

    /**
     * @brief Has the server attach the segment and waits for the answer
     */
    virtual bool attachServer(XShmSegmentInfo& info) = 0;

    /**
     * @brief Copies the drawable's pixels into the image's segment.
     * Returns once the server acknowledged the copy.
     */
    virtual bool fetch(Drawable drawable, XImage* image) = 0;

    virtual void detachServer(XShmSegmentInfo& info) = 0;
    virtual void unmapLocal(void* address) = 0;
    virtual void markForRemoval(int shmid) = 0;

    virtual std::vector<XVisualInfo> visualsMatching(VisualID visualId) = 0;

    // Empty on error
    virtual std::vector<XColor> queryColors(Colormap colormap, int count) = 0;
};

} // namespace XBridge
