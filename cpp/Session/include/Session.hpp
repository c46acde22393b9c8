#pragma once
#include "AtomCache.hpp"
#include "Config.hpp"
#include "DisplayContext.hpp"
#include "EventLoop.hpp"
#include "EventRegistry.hpp"
#include "Extension.hpp"
#include "ShmFrameManager.hpp"
#include "WindowEventRouter.hpp"
#include "XShmTransport.hpp"
#include "XlibConnection.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace XBridge {

/**
 * @brief One X11 connection and everything built on top of it.
 *
 * init() sets things up in dependency order: error handlers first, then
 * the event registry (core, then every extension that passes its
 * capability check), then the shared-memory frame manager.
 */
class Session {
public:
    // Opens its own connection to config.displayName in init()
    explicit Session(Config config);
    // Borrows a connection the caller keeps open for the session's lifetime
    Session(Display* display, Config config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    bool init();
    void close();
    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Routes every pending event
     * @throws UsageError before init()
     */
    std::size_t drain();

    // Replaces the window router; the router must outlive the session
    void setRouter(IEventRouter& router);
    WindowEventRouter& windowRouter() { return m_windowRouter; }

    /**
     * @brief Asks the server for the given event mask on window
     * @return false if the window is gone
     */
    bool selectInput(Window window, long eventMask);

    /**
     * @brief Subscribes to cursor change notifications (XFIXES)
     */
    bool watchCursor();

    /**
     * @brief Frame of a window through its shared-memory segment
     * @return nullptr when XShm is unavailable or the capture failed
     */
    std::unique_ptr<ImageWrapper> getFrame(Window window, int x, int y, int width, int height);

    // For readiness-driven scheduling of drain()
    int fileDescriptor() const;

    const Config& config() const { return m_config; }
    const std::vector<std::string>& enabledExtensions() const { return m_enabledExtensions; }
    bool hasExtension(const std::string& name) const;
    bool isXWayland() const { return m_xwayland; }

    DisplayContext& context();
    AtomCache& atoms();
    EventRegistry& registry();
    EventLoop& loop();
    ShmFrameManager& frames();

    nlohmann::json info() const;

private:
    template <typename Register>
    void enableExtension(const char* name, Register registerEvents);
    void selectBellEvents();
    void checkInitialized(const char* operation) const;

    Config m_config;
    Display* m_borrowed = nullptr;
    bool m_initialized = false;
    bool m_xwayland = false;

    std::unique_ptr<XlibConnection> m_connection;
    std::unique_ptr<DisplayContext> m_context;
    std::unique_ptr<AtomCache> m_atoms;
    std::unique_ptr<EventRegistry> m_registry;
    WindowEventRouter m_windowRouter;
    std::unique_ptr<EventLoop> m_loop;
    std::unique_ptr<XShmTransport> m_transport;
    std::unique_ptr<ShmFrameManager> m_frames;
    std::map<std::string, std::unique_ptr<Extension>> m_extensions;
    std::vector<std::string> m_enabledExtensions;
};

} // namespace XBridge
