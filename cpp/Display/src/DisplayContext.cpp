#include "DisplayContext.hpp"
#include "Errors.hpp"
#include <iostream>
#include <map>
#include <sstream>

namespace XBridge {

namespace {

// Xlib callbacks only receive a Display*, this maps it back to its context.
std::mutex g_contextsMutex;
std::map<Display*, DisplayContext*> g_contexts;
bool g_handlersInstalled = false;

DisplayContext* contextFor(Display* display) {
    std::lock_guard<std::mutex> lock(g_contextsMutex);
    auto it = g_contexts.find(display);
    return it == g_contexts.end() ? nullptr : it->second;
}

int handleProtocolError(Display* display, XErrorEvent* event) {
    XErrorInfo error;
    error.serial = event->serial;
    error.errorCode = event->error_code;
    error.requestCode = event->request_code;
    error.minorCode = event->minor_code;
    error.resourceId = event->resourceid;

    DisplayContext* context = contextFor(display);
    if (!context) {
        std::cerr << "X11 error on unregistered display: " << describe(error) << std::endl;
        return 0;
    }
    context->onProtocolError(error);
    return 0;
}

int handleIOError(Display* display) {
    DisplayContext* context = contextFor(display);
    if (context) {
        context->onIOError();
    } else {
        std::cerr << "X11 fatal IO error on unregistered display" << std::endl;
    }
    return 0;
}

// Replaces Xlib's exit(1) after an IO error so the process can unwind.
// data is null once the context is gone and the display outlived it.
void handleIOErrorExit(Display*, void* data) {
    auto* context = static_cast<DisplayContext*>(data);
    if (context) {
        context->onIOError();
    } else {
        std::cerr << "X11 connection lost after its context was released" << std::endl;
    }
}

} // namespace

std::string describe(const XErrorInfo& error) {
    std::ostringstream out;
    out << "error_code=" << error.errorCode
        << " request_code=" << error.requestCode
        << " minor_code=" << error.minorCode
        << " serial=" << error.serial
        << " resource=0x" << std::hex << error.resourceId;
    return out.str();
}

void ErrorCell::record(const XErrorInfo& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_recorded;
    if (m_error) {
        ++m_dropped;
        return;
    }
    m_error = error;
}

std::optional<XErrorInfo> ErrorCell::consume() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<XErrorInfo> error;
    error.swap(m_error);
    return error;
}

std::optional<XErrorInfo> ErrorCell::peek() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

void ErrorCell::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_error.reset();
}

void ErrorCell::restore(const XErrorInfo& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_error) {
        m_error = error;
    }
}

std::uint64_t ErrorCell::recorded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recorded;
}

std::uint64_t ErrorCell::dropped() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

DisplayContext::DisplayContext(IXConnection& connection)
    : m_connection(connection) {}

DisplayContext::~DisplayContext() {
    if (m_installed && m_connection.isOpen()) {
        // A borrowed display outlives us, its exit hook must not keep this pointer
        m_connection.setIOErrorExitHandler(&handleIOErrorExit, nullptr);
    }
    if (m_registeredDisplay) {
        std::lock_guard<std::mutex> lock(g_contextsMutex);
        auto it = g_contexts.find(m_registeredDisplay);
        if (it != g_contexts.end() && it->second == this) {
            g_contexts.erase(it);
        }
    }
}

void DisplayContext::installErrorHandlers() {
    if (m_installed) {
        return;
    }
    Display* display = m_connection.handle();
    if (display) {
        std::lock_guard<std::mutex> lock(g_contextsMutex);
        g_contexts[display] = this;
        m_registeredDisplay = display;
        if (!g_handlersInstalled) {
            XSetErrorHandler(&handleProtocolError);
            XSetIOErrorHandler(&handleIOError);
            g_handlersInstalled = true;
        }
    }
    m_connection.setIOErrorExitHandler(&handleIOErrorExit, this);
    m_installed = true;
}

void DisplayContext::onProtocolError(const XErrorInfo& error) {
    if (m_errors.peek()) {
        std::cerr << "X11 error while another is unacknowledged: " << describe(error) << std::endl;
    }
    m_errors.record(error);
}

void DisplayContext::onIOError() {
    if (!m_poisoned.exchange(true, std::memory_order_acq_rel)) {
        std::cerr << "X11 fatal IO error: the display connection is no longer usable" << std::endl;
    }
}

bool DisplayContext::isUsable() const {
    return !isPoisoned() && m_connection.isOpen();
}

void DisplayContext::checkUsable(const char* operation) const {
    if (isPoisoned()) {
        throw ConnectionError(std::string(operation) + ": display connection lost");
    }
    if (!m_connection.isOpen()) {
        throw ConnectionError(std::string(operation) + ": display connection is closed");
    }
}

std::string DisplayContext::errorText(int errorCode) const {
    Display* display = m_connection.handle();
    if (!display || !isUsable()) {
        return "X11 error " + std::to_string(errorCode);
    }
    char text[256] = "";
    XGetErrorText(display, errorCode, text, sizeof(text));
    return text;
}

} // namespace XBridge
