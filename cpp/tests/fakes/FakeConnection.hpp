#pragma once
#include "IXConnection.hpp"
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace XBridge {
namespace Testing {

// In-memory display connection: queued events, a scripted atom table and
// extension list. handle() is null, so no global Xlib handler gets
// installed; the IO exit hook is recorded instead.
class FakeConnection : public IXConnection {
public:
    bool open = true;
    Window root = 0x1e6;
    std::deque<XEvent> events;
    std::map<std::string, ExtensionCodes> extensions;
    std::map<std::string, Atom> atoms;
    std::set<std::string> unresolvable;
    Atom nextAtom = 300;

    int syncCalls = 0;
    int internCalls = 0;
    int internManyCalls = 0;
    int atomNameCalls = 0;

    XIOErrorExitHandler ioExitHandler = nullptr;
    void* ioExitData = nullptr;

    // Runs on every sync(), stands in for errors arriving with the reply
    std::function<void()> onSync;
    // Runs when an atom name is looked up (e.g. to simulate BadAtom)
    std::function<void(Atom)> onAtomName;

    bool isOpen() const override { return open; }
    Display* handle() const override { return nullptr; }
    void flush() override {}

    void sync(bool) override {
        ++syncCalls;
        if (onSync) {
            onSync();
        }
    }

    int pending() override { return static_cast<int>(events.size()); }

    void nextEvent(XEvent& event) override {
        event = events.front();
        events.pop_front();
    }

    Window defaultRootWindow() const override { return root; }

    void setIOErrorExitHandler(XIOErrorExitHandler handler, void* data) override {
        ioExitHandler = handler;
        ioExitData = data;
    }

    // What Xlib does once the server is gone
    void loseServer() {
        if (ioExitHandler) {
            ioExitHandler(nullptr, ioExitData);
        }
    }

    std::optional<ExtensionCodes> queryExtension(const std::string& name) override {
        auto it = extensions.find(name);
        if (it == extensions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Atom internAtom(const std::string& name) override {
        ++internCalls;
        return resolve(name);
    }

    bool internAtoms(const std::vector<std::string>& names, std::vector<Atom>& result) override {
        ++internManyCalls;
        result.clear();
        bool ok = true;
        for (const auto& name : names) {
            Atom atom = resolve(name);
            ok = ok && atom != None;
            result.push_back(atom);
        }
        return ok;
    }

    std::optional<std::string> atomName(Atom atom) override {
        ++atomNameCalls;
        if (onAtomName) {
            onAtomName(atom);
        }
        for (const auto& item : atoms) {
            if (item.second == atom) {
                return item.first;
            }
        }
        return std::nullopt;
    }

    void push(const XEvent& event) { events.push_back(event); }

private:
    Atom resolve(const std::string& name) {
        if (unresolvable.count(name)) {
            return None;
        }
        auto it = atoms.find(name);
        if (it != atoms.end()) {
            return it->second;
        }
        Atom atom = nextAtom++;
        atoms[name] = atom;
        return atom;
    }
};

} // namespace Testing
} // namespace XBridge
