#pragma once
#include <X11/Xlib.h>
#include <optional>
#include <string>
#include <vector>

namespace XBridge {

struct ExtensionCodes {
    int majorOpcode = 0;
    int eventBase = 0;
    int errorBase = 0;
};

/**
 * @brief The display connection as seen by the core.
 *
 * The handle is owned elsewhere; components only borrow it. Not safe for
 * concurrent use, callers serialize access through one thread.
 */
class IXConnection {
public:
    virtual ~IXConnection() = default;

    virtual bool isOpen() const = 0;
    virtual Display* handle() const = 0;
    virtual void flush() = 0;
    virtual void sync(bool discard) = 0;

    /**
     * @brief Number of events that can be read without blocking
     */
    virtual int pending() = 0;

    /**
     * @brief Reads exactly one event. Only call after pending() returned > 0.
     */
    virtual void nextEvent(XEvent& event) = 0;

    virtual Window defaultRootWindow() const = 0;

    /**
     * @brief Hook run by Xlib after a fatal IO error instead of exit()
     */
    virtual void setIOErrorExitHandler(XIOErrorExitHandler handler, void* data) = 0;

    /**
     * @brief Queries an extension by its protocol name ("SHAPE", "XFIXES"...)
     * @return the opcode and bases, or nothing when the server lacks it
     */
    virtual std::optional<ExtensionCodes> queryExtension(const std::string& name) = 0;

    virtual Atom internAtom(const std::string& name) = 0;

    /**
     * @brief Interns all names in one round trip
     * @return false if the server could not create any one of the atoms
     */
    virtual bool internAtoms(const std::vector<std::string>& names, std::vector<Atom>& atoms) = 0;

    virtual std::optional<std::string> atomName(Atom atom) = 0;
};

} // namespace XBridge
