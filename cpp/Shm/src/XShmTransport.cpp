#include "XShmTransport.hpp"
#include "ErrorTrap.hpp"
#include <sys/ipc.h>
#include <sys/shm.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace XBridge {

XShmTransport::XShmTransport(DisplayContext& context)
    : m_context(context) {}

Display* XShmTransport::display() const {
    return m_context.connection().handle();
}

bool XShmTransport::queryExtension() {
    return XShmQueryExtension(display()) != False;
}

std::optional<WindowGeometry> XShmTransport::windowGeometry(Window window) {
    XWindowAttributes attributes{};
    Status status = 0;
    auto error = trapErrors(m_context, [&]() {
        status = XGetWindowAttributes(display(), window, &attributes);
    }, SyncPolicy::NoSync);
    if (error || !status) {
        return std::nullopt;
    }
    WindowGeometry geometry;
    geometry.x = attributes.x;
    geometry.y = attributes.y;
    geometry.width = static_cast<unsigned int>(attributes.width);
    geometry.height = static_cast<unsigned int>(attributes.height);
    geometry.depth = attributes.depth;
    geometry.visual = attributes.visual;
    geometry.visualId = attributes.visual ? XVisualIDFromVisual(attributes.visual) : 0;
    geometry.colormap = attributes.colormap;
    return geometry;
}

XImage* XShmTransport::createImage(const WindowGeometry& geometry, XShmSegmentInfo& info,
                                   unsigned int width, unsigned int height, int depth) {
    // ZPixmap gives the full pixel data in one block
    XImage* image = XShmCreateImage(display(), geometry.visual, static_cast<unsigned int>(depth),
                                    ZPixmap, nullptr, &info, width, height);
    if (!image) {
        std::cerr << "XShmCreateImage(" << width << "x" << height << ", depth " << depth << ") failed" << std::endl;
    }
    return image;
}

void XShmTransport::destroyImage(XImage* image) {
    // The pixels belong to the segment, not to the image
    image->data = nullptr;
    XDestroyImage(image);
}

int XShmTransport::allocate(std::size_t size) {
    int shmid = shmget(IPC_PRIVATE, size, IPC_CREAT | 0600);
    if (shmid == -1) {
        std::cerr << "Failed to allocate " << size << " bytes of shared memory: " << std::strerror(errno) << std::endl;
    }
    return shmid;
}

void* XShmTransport::mapLocal(int shmid) {
    void* address = shmat(shmid, nullptr, 0);
    if (address == reinterpret_cast<void*>(-1)) {
        std::cerr << "Failed to attach shared memory: " << std::strerror(errno) << std::endl;
        return nullptr;
    }
    return address;
}

bool XShmTransport::attachServer(XShmSegmentInfo& info) {
    Bool attached = False;
    auto error = trapErrors(m_context, [&]() {
        attached = XShmAttach(display(), &info);
    }, SyncPolicy::Sync);
    if (error) {
        std::cerr << "X server refused the shared memory segment: "
                  << m_context.errorText(error->errorCode) << std::endl;
        return false;
    }
    return attached != False;
}

bool XShmTransport::fetch(Drawable drawable, XImage* image) {
    Bool ok = False;
    // XShmGetImage waits for its reply: the pixels are in place on return
    auto error = trapErrors(m_context, [&]() {
        ok = XShmGetImage(display(), drawable, image, 0, 0, AllPlanes);
    }, SyncPolicy::NoSync);
    if (error) {
        std::cerr << "XShmGetImage failed for drawable 0x" << std::hex << drawable << std::dec
                  << ": " << m_context.errorText(error->errorCode) << std::endl;
        return false;
    }
    return ok != False;
}

void XShmTransport::detachServer(XShmSegmentInfo& info) {
    if (!m_context.isUsable()) {
        // Server side is already gone with the connection
        return;
    }
    auto error = trapErrors(m_context, [&]() {
        XShmDetach(display(), &info);
    }, SyncPolicy::Sync);
    if (error) {
        std::cerr << "XShmDetach failed: " << m_context.errorText(error->errorCode) << std::endl;
    }
}

void XShmTransport::unmapLocal(void* address) {
    if (shmdt(address) != 0) {
        std::cerr << "Failed to detach shared memory: " << std::strerror(errno) << std::endl;
    }
}

void XShmTransport::markForRemoval(int shmid) {
    if (shmctl(shmid, IPC_RMID, nullptr) != 0) {
        std::cerr << "Failed to remove shared memory segment " << shmid << ": " << std::strerror(errno) << std::endl;
    }
}

std::vector<XVisualInfo> XShmTransport::visualsMatching(VisualID visualId) {
    XVisualInfo templ{};
    templ.visualid = visualId;
    int count = 0;
    XVisualInfo* infos = XGetVisualInfo(display(), VisualIDMask, &templ, &count);
    std::vector<XVisualInfo> visuals;
    if (infos) {
        visuals.assign(infos, infos + count);
        XFree(infos);
    }
    return visuals;
}

std::vector<XColor> XShmTransport::queryColors(Colormap colormap, int count) {
    std::vector<XColor> colors(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        colors[i].pixel = static_cast<unsigned long>(i);
    }
    auto error = trapErrors(m_context, [&]() {
        XQueryColors(display(), colormap, colors.data(), count);
    }, SyncPolicy::NoSync);
    if (error) {
        std::cerr << "XQueryColors failed for colormap 0x" << std::hex << colormap << std::dec
                  << ": " << m_context.errorText(error->errorCode) << std::endl;
        return {};
    }
    return colors;
}

} // namespace XBridge
