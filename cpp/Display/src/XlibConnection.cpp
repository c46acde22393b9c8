#include "XlibConnection.hpp"
#include <X11/XKBlib.h>
#include <X11/extensions/XShm.h>
#include <X11/extensions/Xdamage.h>
#include <X11/extensions/Xfixes.h>
#include <X11/extensions/shape.h>

#include <iostream>

namespace XBridge {

XlibConnection::XlibConnection(Display* display)
    : m_display(display), m_owned(false) {}

XlibConnection::~XlibConnection() {
    close();
}

std::unique_ptr<XlibConnection> XlibConnection::open(const std::string& displayName) {
    Display* display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
    if (!display) {
        std::cerr << "Failed to open X11 display '" << displayName << "'" << std::endl;
        return nullptr;
    }
    auto connection = std::make_unique<XlibConnection>(display);
    connection->m_owned = true;
    return connection;
}

void XlibConnection::close() {
    if (m_display && m_owned) {
        XCloseDisplay(m_display);
    }
    m_display = nullptr;
}

bool XlibConnection::isOpen() const {
    return m_display != nullptr;
}

Display* XlibConnection::handle() const {
    return m_display;
}

void XlibConnection::flush() {
    XFlush(m_display);
}

void XlibConnection::sync(bool discard) {
    XSync(m_display, discard ? True : False);
}

int XlibConnection::pending() {
    return XPending(m_display);
}

void XlibConnection::nextEvent(XEvent& event) {
    XNextEvent(m_display, &event);
}

Window XlibConnection::defaultRootWindow() const {
    return DefaultRootWindow(m_display);
}

void XlibConnection::setIOErrorExitHandler(XIOErrorExitHandler handler, void* data) {
    if (m_display) {
        XSetIOErrorExitHandler(m_display, handler, data);
    }
}

std::optional<ExtensionCodes> XlibConnection::queryExtension(const std::string& name) {
    ExtensionCodes codes;
    if (!XQueryExtension(m_display, name.c_str(), &codes.majorOpcode, &codes.eventBase, &codes.errorBase)) {
        return std::nullopt;
    }

    // The client libraries only convert wire events for extensions they
    // have been queried for, so go through their own query functions.
    int eventBase = 0;
    int errorBase = 0;
    if (name == "SHAPE") {
        if (!XShapeQueryExtension(m_display, &eventBase, &errorBase)) {
            return std::nullopt;
        }
    } else if (name == "XFIXES") {
        if (!XFixesQueryExtension(m_display, &eventBase, &errorBase)) {
            return std::nullopt;
        }
    } else if (name == "DAMAGE") {
        if (!XDamageQueryExtension(m_display, &eventBase, &errorBase)) {
            return std::nullopt;
        }
    } else if (name == "XKEYBOARD") {
        int major = XkbMajorVersion;
        int minor = XkbMinorVersion;
        int opcode = 0;
        if (!XkbQueryExtension(m_display, &opcode, &eventBase, &errorBase, &major, &minor)) {
            std::cerr << "XKEYBOARD version mismatch: server has " << major << "." << minor << std::endl;
            return std::nullopt;
        }
    } else if (name == "MIT-SHM") {
        if (!XShmQueryExtension(m_display)) {
            return std::nullopt;
        }
    }
    return codes;
}

Atom XlibConnection::internAtom(const std::string& name) {
    return XInternAtom(m_display, name.c_str(), False);
}

bool XlibConnection::internAtoms(const std::vector<std::string>& names, std::vector<Atom>& atoms) {
    std::vector<char*> cnames;
    cnames.reserve(names.size());
    for (const auto& name : names) {
        cnames.push_back(const_cast<char*>(name.c_str()));
    }
    atoms.assign(names.size(), None);
    Status status = XInternAtoms(m_display, cnames.data(), static_cast<int>(cnames.size()), False, atoms.data());
    return status != 0;
}

std::optional<std::string> XlibConnection::atomName(Atom atom) {
    char* name = XGetAtomName(m_display, atom);
    if (!name) {
        return std::nullopt;
    }
    std::string result(name);
    XFree(name);
    return result;
}

} // namespace XBridge
