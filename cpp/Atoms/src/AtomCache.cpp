#include "AtomCache.hpp"
#include "ErrorTrap.hpp"
#include <iostream>

namespace XBridge {

AtomCache::AtomCache(DisplayContext& context)
    : m_context(context) {}

void AtomCache::remember(const std::string& name, Atom atom) {
    m_byName[name] = atom;
    m_byAtom[atom] = name;
}

Atom AtomCache::intern(const std::string& name) {
    m_context.checkUsable("AtomCache::intern");
    auto it = m_byName.find(name);
    if (it != m_byName.end()) {
        return it->second;
    }

    Atom atom = None;
    auto error = trapErrors(m_context, [&]() {
        atom = m_context.connection().internAtom(name);
    }, SyncPolicy::NoSync);
    if (error || atom == None) {
        std::cerr << "Failed to intern atom '" << name << "'" << std::endl;
        return None;
    }
    remember(name, atom);
    return atom;
}

std::optional<std::vector<Atom>> AtomCache::internMany(const std::vector<std::string>& names) {
    m_context.checkUsable("AtomCache::internMany");

    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (m_byName.find(name) == m_byName.end()) {
            missing.push_back(name);
        }
    }

    if (!missing.empty()) {
        std::vector<Atom> atoms;
        bool ok = false;
        auto error = trapErrors(m_context, [&]() {
            ok = m_context.connection().internAtoms(missing, atoms);
        }, SyncPolicy::NoSync);
        if (error || !ok || atoms.size() != missing.size()) {
            std::cerr << "Failed to intern " << missing.size() << " atoms" << std::endl;
            return std::nullopt;
        }
        for (Atom atom : atoms) {
            if (atom == None) {
                std::cerr << "Failed to intern " << missing.size() << " atoms" << std::endl;
                return std::nullopt;
            }
        }
        for (std::size_t i = 0; i < missing.size(); ++i) {
            remember(missing[i], atoms[i]);
        }
    }

    std::vector<Atom> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(m_byName[name]);
    }
    return result;
}

std::optional<std::string> AtomCache::nameOf(Atom atom) {
    m_context.checkUsable("AtomCache::nameOf");
    if (atom == None) {
        return std::nullopt;
    }
    auto it = m_byAtom.find(atom);
    if (it != m_byAtom.end()) {
        return it->second;
    }

    std::optional<std::string> name;
    // XGetAtomName waits for its reply, a BadAtom is already in the cell
    auto error = trapErrors(m_context, [&]() {
        name = m_context.connection().atomName(atom);
    }, SyncPolicy::NoSync);
    if (error || !name) {
        return std::nullopt;
    }
    remember(*name, atom);
    return name;
}

} // namespace XBridge
