#pragma once
#include "DisplayContext.hpp"
#include <optional>
#include <string>

namespace XBridge {

constexpr const char* kShapeExtension = "SHAPE";
constexpr const char* kDamageExtension = "DAMAGE";
constexpr const char* kXFixesExtension = "XFIXES";
constexpr const char* kXkbExtension = "XKEYBOARD";
constexpr const char* kShmExtension = "MIT-SHM";
constexpr const char* kXWaylandExtension = "XWAYLAND";

/**
 * @brief Capability check for one extension, queried once and cached.
 */
class Extension {
public:
    Extension(DisplayContext& context, std::string name);

    const std::string& name() const { return m_name; }

    bool hasSupport();

    /**
     * @throws ExtensionUnavailable when the server does not provide it
     */
    void ensureSupport();

    // Only meaningful once ensureSupport() succeeded
    int majorOpcode() const { return m_codes.majorOpcode; }
    int eventBase() const { return m_codes.eventBase; }
    int errorBase() const { return m_codes.errorBase; }

private:
    DisplayContext& m_context;
    std::string m_name;
    std::optional<bool> m_supported;
    ExtensionCodes m_codes;
};

} // namespace XBridge
