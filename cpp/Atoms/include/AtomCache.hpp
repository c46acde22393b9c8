#pragma once
#include "DisplayContext.hpp"
#include <X11/Xlib.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace XBridge {

/**
 * @brief Caches atoms in both directions for the lifetime of a connection.
 *
 * Once an atom or a name is cached it is never queried again. None is
 * never cached.
 */
class AtomCache {
public:
    explicit AtomCache(DisplayContext& context);

    /**
     * @brief Resolves or creates the atom for name
     * @return None if the server could not create it
     * @throws ConnectionError on a closed or lost connection
     */
    Atom intern(const std::string& name);

    /**
     * @brief Interns every name in a single round trip
     * @return nothing if any one atom could not be created, nothing is
     * cached in that case
     */
    std::optional<std::vector<Atom>> internMany(const std::vector<std::string>& names);

    /**
     * @brief Reverse lookup, empty when the atom does not exist
     */
    std::optional<std::string> nameOf(Atom atom);

    std::size_t size() const { return m_byName.size(); }

private:
    void remember(const std::string& name, Atom atom);

    DisplayContext& m_context;
    std::unordered_map<std::string, Atom> m_byName;
    std::unordered_map<Atom, std::string> m_byAtom;
};

} // namespace XBridge
