#pragma once
#include "IXConnection.hpp"
#include <memory>
#include <string>

namespace XBridge {

/**
 * @brief Xlib implementation of the display connection.
 *
 * Borrows a Display* owned by the caller, or owns one it opened itself
 * (see open()). Only an owning instance closes the handle.
 */
class XlibConnection : public IXConnection {
public:
    explicit XlibConnection(Display* display);
    ~XlibConnection() override;

    XlibConnection(const XlibConnection&) = delete;
    XlibConnection& operator=(const XlibConnection&) = delete;

    /**
     * @brief Opens a dedicated connection (empty name uses $DISPLAY)
     * @return nullptr when the display cannot be reached
     */
    static std::unique_ptr<XlibConnection> open(const std::string& displayName);

    bool owned() const { return m_owned; }
    void close();

    bool isOpen() const override;
    Display* handle() const override;
    void flush() override;
    void sync(bool discard) override;
    int pending() override;
    void nextEvent(XEvent& event) override;
    Window defaultRootWindow() const override;
    void setIOErrorExitHandler(XIOErrorExitHandler handler, void* data) override;
    std::optional<ExtensionCodes> queryExtension(const std::string& name) override;
    Atom internAtom(const std::string& name) override;
    bool internAtoms(const std::vector<std::string>& names, std::vector<Atom>& atoms) override;
    std::optional<std::string> atomName(Atom atom) override;

private:
    Display* m_display = nullptr;
    bool m_owned = false;
};

} // namespace XBridge
