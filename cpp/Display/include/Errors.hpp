#pragma once
#include <stdexcept>
#include <string>

namespace XBridge {

/**
 * @brief Programmer error: double release, re-closing a segment, using a
 * released wrapper. Never caught inside the library.
 */
class UsageError : public std::logic_error {
public:
    explicit UsageError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief The display connection is closed or poisoned by a fatal I/O error.
 */
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

class ExtensionUnavailable : public std::runtime_error {
public:
    explicit ExtensionUnavailable(const std::string& name)
        : std::runtime_error(name + " extension is not available"), m_name(name) {}

    const std::string& extension() const noexcept { return m_name; }

private:
    std::string m_name;
};

} // namespace XBridge
