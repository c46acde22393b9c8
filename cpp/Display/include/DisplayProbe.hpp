#pragma once
#include "IXConnection.hpp"
#include <functional>
#include <string>
#include <vector>

namespace XBridge {

enum class ProbeResult {
    Yes,
    No,
    Inconclusive
};

struct DisplayProbe {
    std::string name;
    std::function<ProbeResult()> run;
};

/**
 * @brief Runs the probes in order and stops at the first definitive answer
 * @param decidedBy receives the name of the deciding probe (empty if none)
 */
ProbeResult runProbes(const std::vector<DisplayProbe>& probes, std::string* decidedBy = nullptr);

// Individual probes, pure over their inputs
ProbeResult probeXWaylandExtension(bool extensionPresent);
ProbeResult probeSessionType(const char* sessionType);
ProbeResult probeWaylandCompositor(const char* waylandDisplay, const std::function<bool()>& connect);

#ifdef XBRIDGE_WAYLAND_ENABLED
bool waylandCompositorReachable();
#endif

std::vector<DisplayProbe> xwaylandProbes(IXConnection& connection);

/**
 * @brief True when the X server is XWayland rather than a native X server
 */
bool isXWayland(IXConnection& connection);

} // namespace XBridge
