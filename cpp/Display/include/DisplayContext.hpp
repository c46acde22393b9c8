#pragma once
#include "IXConnection.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace XBridge {

struct XErrorInfo {
    unsigned long serial = 0;
    int errorCode = 0;
    int requestCode = 0;
    int minorCode = 0;
    unsigned long resourceId = 0;
};

std::string describe(const XErrorInfo& error);

/**
 * @brief Single-slot record of the first unacknowledged protocol error.
 *
 * Reading with consume() clears the slot, so a caller can check that no
 * error happened since its last check. Errors arriving while the slot is
 * full are counted and dropped.
 */
class ErrorCell {
public:
    void record(const XErrorInfo& error);
    std::optional<XErrorInfo> consume();
    std::optional<XErrorInfo> peek() const;
    void clear();

    // Puts back an error taken by a nested trap, without counting it again
    void restore(const XErrorInfo& error);

    std::uint64_t recorded() const;
    std::uint64_t dropped() const;

private:
    mutable std::mutex m_mutex;
    std::optional<XErrorInfo> m_error;
    std::uint64_t m_recorded = 0;
    std::uint64_t m_dropped = 0;
};

/**
 * @brief Per-connection state shared by every component.
 *
 * Owns the error cell and the poisoned flag. installErrorHandlers() is
 * called once by whoever owns the connection lifecycle, before anything
 * else touches the connection.
 */
class DisplayContext {
public:
    explicit DisplayContext(IXConnection& connection);
    ~DisplayContext();

    DisplayContext(const DisplayContext&) = delete;
    DisplayContext& operator=(const DisplayContext&) = delete;

    IXConnection& connection() const { return m_connection; }
    ErrorCell& errors() { return m_errors; }

    void installErrorHandlers();
    bool handlersInstalled() const { return m_installed; }

    // Called from the Xlib callbacks (and by tests standing in for them)
    void onProtocolError(const XErrorInfo& error);
    void onIOError();

    bool isPoisoned() const { return m_poisoned.load(std::memory_order_acquire); }
    bool isUsable() const;

    /**
     * @brief Fails fast when the connection is closed or poisoned
     * @throws ConnectionError
     */
    void checkUsable(const char* operation) const;

    std::string errorText(int errorCode) const;

    // Nesting depth of error trap spans, maintained by ErrorTrapSpan
    int enterTrap() { return m_trapDepth++; }
    void leaveTrap() { --m_trapDepth; }
    int trapDepth() const { return m_trapDepth; }

private:
    IXConnection& m_connection;
    ErrorCell m_errors;
    std::atomic<bool> m_poisoned{false};
    bool m_installed = false;
    int m_trapDepth = 0;
    Display* m_registeredDisplay = nullptr;
};

} // namespace XBridge
