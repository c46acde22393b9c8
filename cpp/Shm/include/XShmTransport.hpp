#pragma once
#include "DisplayContext.hpp"
#include "IShmTransport.hpp"

namespace XBridge {

/**
 * @brief MIT-SHM and SysV shared memory implementation of the transport.
 */
class XShmTransport : public IShmTransport {
public:
    explicit XShmTransport(DisplayContext& context);

    bool queryExtension() override;
    std::optional<WindowGeometry> windowGeometry(Window window) override;
    XImage* createImage(const WindowGeometry& geometry, XShmSegmentInfo& info,
                        unsigned int width, unsigned int height, int depth) override;
    void destroyImage(XImage* image) override;
    int allocate(std::size_t size) override;
    void* mapLocal(int shmid) override;
    bool attachServer(XShmSegmentInfo& info) override;
    bool fetch(Drawable drawable, XImage* image) override;
    void detachServer(XShmSegmentInfo& info) override;
    void unmapLocal(void* address) override;
    void markForRemoval(int shmid) override;
    std::vector<XVisualInfo> visualsMatching(VisualID visualId) override;
    std::vector<XColor> queryColors(Colormap colormap, int count) override;

private:
    Display* display() const;

    DisplayContext& m_context;
};

} // namespace XBridge
