#include "DisplayProbe.hpp"
#include "Extension.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>

#ifdef XBRIDGE_WAYLAND_ENABLED
#include <wayland-client.h>
#endif

namespace XBridge {

ProbeResult runProbes(const std::vector<DisplayProbe>& probes, std::string* decidedBy) {
    for (const auto& probe : probes) {
        ProbeResult result = probe.run();
        if (result != ProbeResult::Inconclusive) {
            if (decidedBy) {
                *decidedBy = probe.name;
            }
            return result;
        }
    }
    if (decidedBy) {
        decidedBy->clear();
    }
    return ProbeResult::Inconclusive;
}

ProbeResult probeXWaylandExtension(bool extensionPresent) {
    // Absence proves nothing: older XWayland servers don't advertise it
    return extensionPresent ? ProbeResult::Yes : ProbeResult::Inconclusive;
}

ProbeResult probeSessionType(const char* sessionType) {
    if (!sessionType) {
        return ProbeResult::Inconclusive;
    }
    if (std::strcmp(sessionType, "wayland") == 0) {
        return ProbeResult::Yes;
    }
    if (std::strcmp(sessionType, "x11") == 0) {
        return ProbeResult::No;
    }
    return ProbeResult::Inconclusive;
}

ProbeResult probeWaylandCompositor(const char* waylandDisplay, const std::function<bool()>& connect) {
    if (!waylandDisplay || !*waylandDisplay) {
        return ProbeResult::Inconclusive;
    }
    return connect() ? ProbeResult::Yes : ProbeResult::Inconclusive;
}

#ifdef XBRIDGE_WAYLAND_ENABLED
bool waylandCompositorReachable() {
    struct wl_display* display = wl_display_connect(nullptr);
    if (!display) {
        return false;
    }
    wl_display_disconnect(display);
    return true;
}
#endif

std::vector<DisplayProbe> xwaylandProbes(IXConnection& connection) {
    std::vector<DisplayProbe> probes;
    probes.push_back({"xwayland-extension", [&connection]() {
        return probeXWaylandExtension(connection.queryExtension(kXWaylandExtension).has_value());
    }});
    probes.push_back({"session-type", []() {
        return probeSessionType(std::getenv("XDG_SESSION_TYPE"));
    }});
#ifdef XBRIDGE_WAYLAND_ENABLED
    probes.push_back({"wayland-compositor", []() {
        return probeWaylandCompositor(std::getenv("WAYLAND_DISPLAY"), &waylandCompositorReachable);
    }});
#endif
    return probes;
}

bool isXWayland(IXConnection& connection) {
    std::string decidedBy;
    ProbeResult result = runProbes(xwaylandProbes(connection), &decidedBy);
    if (result == ProbeResult::Yes) {
        std::cout << "Detected XWayland (" << decidedBy << ")" << std::endl;
        return true;
    }
    return false;
}

} // namespace XBridge
