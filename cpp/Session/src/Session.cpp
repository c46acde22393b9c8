#include "Session.hpp"
#include "DisplayProbe.hpp"
#include "ErrorTrap.hpp"
#include "Errors.hpp"
#include "parsers/CoreParsers.hpp"
#include "parsers/ShapeParser.hpp"
#include "parsers/XFixesParser.hpp"
#include "parsers/XkbParser.hpp"
#include "parsers/DamageParser.hpp"
#include <X11/XKBlib.h>
#include <X11/extensions/Xfixes.h>
#include <chrono>
#include <iostream>
#include <utility>

namespace XBridge {

Session::Session(Config config) : m_config(std::move(config)) {}

Session::Session(Display* display, Config config)
    : m_config(std::move(config)), m_borrowed(display) {}

Session::~Session() {
    close();
}

bool Session::init() {
    if (m_initialized) {
        std::cout << "Session already initialized" << std::endl;
        return true;
    }

    std::cout << "=== Session Initialization ===" << std::endl;

    // Step 1: Connection
    if (m_borrowed) {
        m_connection = std::make_unique<XlibConnection>(m_borrowed);
    } else {
        m_connection = XlibConnection::open(m_config.displayName);
        if (!m_connection) {
            std::cerr << "Failed to open X11 display '" << m_config.displayName << "'" << std::endl;
            return false;
        }
    }

    // Step 2: Error handlers, before any request goes out
    m_context = std::make_unique<DisplayContext>(*m_connection);
    m_context->installErrorHandlers();
    if (m_config.synchronous) {
        std::cout << "Synchronous mode enabled (slow, for debugging)" << std::endl;
        XSynchronize(m_connection->handle(), True);
    }

    // Step 3: Event types
    m_atoms = std::make_unique<AtomCache>(*m_context);
    m_registry = std::make_unique<EventRegistry>();
    registerCoreEvents(*m_registry);
    std::cout << "Registered " << m_registry->size() << " core event types" << std::endl;

    enableExtension(kShapeExtension, registerShapeEvents);
    enableExtension(kXFixesExtension, registerXFixesEvents);
    enableExtension(kXkbExtension, registerXkbEvents);
    enableExtension(kDamageExtension, registerDamageEvents);
    if (hasExtension(kXkbExtension)) {
        selectBellEvents();
    }

    m_loop = std::make_unique<EventLoop>(*m_context, *m_registry, *m_atoms, m_windowRouter);
    m_loop->setDebug(m_config.debugEvents);
    m_loop->setSlowEventThreshold(std::chrono::milliseconds(m_config.slowEventMs));

    // Step 4: Shared memory
    m_transport = std::make_unique<XShmTransport>(*m_context);
    m_frames = std::make_unique<ShmFrameManager>(*m_context, *m_transport, m_config.useXShm);
    if (m_frames->negotiate()) {
        std::cout << "XShm extension available" << std::endl;
    } else {
        std::cout << "XShm capture unavailable" << std::endl;
    }

    m_xwayland = XBridge::isXWayland(*m_connection);
    std::cout << "X server: " << (m_xwayland ? "XWayland" : "native X11") << std::endl;

    m_initialized = true;
    std::cout << "Session initialized successfully!" << std::endl;
    std::cout << "==============================" << std::endl;
    return true;
}

template <typename Register>
void Session::enableExtension(const char* name, Register registerEvents) {
    auto extension = std::make_unique<Extension>(*m_context, name);
    try {
        registerEvents(*m_registry, *extension);
    } catch (const ExtensionUnavailable& e) {
        std::cerr << e.what() << ", its events will not be routed" << std::endl;
        return;
    }
    std::cout << "  " << name << " events enabled (base " << extension->eventBase() << ")" << std::endl;
    m_enabledExtensions.emplace_back(name);
    m_extensions.emplace(name, std::move(extension));
}

void Session::selectBellEvents() {
    Display* display = m_connection->handle();
    auto error = trapErrors(*m_context, [&] {
        XkbSelectEvents(display, XkbUseCoreKbd, XkbBellNotifyMask, XkbBellNotifyMask);
    });
    if (error) {
        std::cerr << "Could not select XKB bell events: " << describe(*error) << std::endl;
    }
}

void Session::close() {
    if (!m_connection) {
        return;
    }
    // Segments first: their teardown still talks to the server
    m_frames.reset();
    m_transport.reset();
    m_loop.reset();
    m_extensions.clear();
    m_enabledExtensions.clear();
    m_registry.reset();
    m_atoms.reset();
    m_context.reset();
    m_connection.reset();
    if (m_initialized) {
        std::cout << "Session closed" << std::endl;
    }
    m_initialized = false;
}

std::size_t Session::drain() {
    checkInitialized("drain");
    return m_loop->drain();
}

void Session::setRouter(IEventRouter& router) {
    checkInitialized("setRouter");
    m_loop->setRouter(router);
}

bool Session::selectInput(Window window, long eventMask) {
    checkInitialized("selectInput");
    m_context->checkUsable("selectInput");
    Display* display = m_connection->handle();
    auto error = trapErrors(*m_context, [&] { XSelectInput(display, window, eventMask); });
    if (error) {
        std::cerr << "Cannot select input on window 0x" << std::hex << window << std::dec
                  << ": " << describe(*error) << std::endl;
        return false;
    }
    return true;
}

bool Session::watchCursor() {
    checkInitialized("watchCursor");
    if (!hasExtension(kXFixesExtension)) {
        std::cerr << "Cursor tracking needs the XFIXES extension" << std::endl;
        return false;
    }
    m_context->checkUsable("watchCursor");
    Display* display = m_connection->handle();
    Window root = m_connection->defaultRootWindow();
    auto error = trapErrors(*m_context, [&] {
        XFixesSelectCursorInput(display, root, XFixesDisplayCursorNotifyMask);
    });
    if (error) {
        std::cerr << "Could not select cursor events: " << describe(*error) << std::endl;
        return false;
    }
    return true;
}

std::unique_ptr<ImageWrapper> Session::getFrame(Window window, int x, int y, int width, int height) {
    checkInitialized("getFrame");
    return m_frames->getFrame(window, x, y, width, height);
}

int Session::fileDescriptor() const {
    checkInitialized("fileDescriptor");
    return ConnectionNumber(m_connection->handle());
}

bool Session::hasExtension(const std::string& name) const {
    return m_extensions.count(name) > 0;
}

DisplayContext& Session::context() {
    checkInitialized("context");
    return *m_context;
}

AtomCache& Session::atoms() {
    checkInitialized("atoms");
    return *m_atoms;
}

EventRegistry& Session::registry() {
    checkInitialized("registry");
    return *m_registry;
}

EventLoop& Session::loop() {
    checkInitialized("loop");
    return *m_loop;
}

ShmFrameManager& Session::frames() {
    checkInitialized("frames");
    return *m_frames;
}

nlohmann::json Session::info() const {
    nlohmann::json j;
    j["config"] = m_config.toJson();
    j["initialized"] = m_initialized;
    if (!m_initialized) {
        return j;
    }
    j["xwayland"] = m_xwayland;
    j["extensions"] = m_enabledExtensions;
    j["event_types"] = m_registry->size();
    j["atoms"] = m_atoms->size();
    j["poisoned"] = m_context->isPoisoned();
    j["errors"] = {
        {"recorded", m_context->errors().recorded()},
        {"dropped", m_context->errors().dropped()},
    };
    const EventLoopStats& stats = m_loop->stats();
    j["events"] = {
        {"processed", stats.processed},
        {"routed", stats.routed},
        {"ignored", stats.ignored},
        {"unknown", stats.unknown},
        {"parse_failures", stats.parseFailures},
        {"router_failures", stats.routerFailures},
    };
    j["xshm"] = m_frames->info();
    return j;
}

void Session::checkInitialized(const char* operation) const {
    if (!m_initialized) {
        throw UsageError(std::string("Session::") + operation + "() called before init()");
    }
}

} // namespace XBridge
