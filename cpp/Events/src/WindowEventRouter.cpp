#include "WindowEventRouter.hpp"
#include <algorithm>
#include <utility>

namespace XBridge {

namespace {

template <typename Receivers>
bool eraseReceiver(Receivers& receivers, std::uint64_t id) {
    auto it = std::remove_if(receivers.begin(), receivers.end(),
                             [id](const auto& receiver) { return receiver.id == id; });
    bool found = it != receivers.end();
    receivers.erase(it, receivers.end());
    return found;
}

} // namespace

WindowEventRouter::ReceiverId WindowEventRouter::addReceiver(Window window, EventHandler handler) {
    ReceiverId id = m_nextId++;
    m_receivers[window].push_back({id, std::move(handler)});
    return id;
}

bool WindowEventRouter::removeReceiver(Window window, ReceiverId id) {
    auto it = m_receivers.find(window);
    if (it == m_receivers.end()) {
        return false;
    }
    bool found = eraseReceiver(it->second, id);
    if (it->second.empty()) {
        m_receivers.erase(it);
    }
    return found;
}

void WindowEventRouter::removeWindow(Window window) {
    m_receivers.erase(window);
}

WindowEventRouter::ReceiverId WindowEventRouter::addFallbackReceiver(const std::string& signal, EventHandler handler) {
    ReceiverId id = m_nextId++;
    m_fallbacks[signal].push_back({id, std::move(handler)});
    return id;
}

bool WindowEventRouter::removeFallbackReceiver(const std::string& signal, ReceiverId id) {
    auto it = m_fallbacks.find(signal);
    if (it == m_fallbacks.end()) {
        return false;
    }
    return eraseReceiver(it->second, id);
}

std::size_t WindowEventRouter::receiverCount(Window window) const {
    auto it = m_receivers.find(window);
    return it == m_receivers.end() ? 0 : it->second.size();
}

bool WindowEventRouter::deliver(Window window, const std::string& signal, const ParsedEvent& event) {
    auto it = m_receivers.find(window);
    if (it == m_receivers.end() || it->second.empty()) {
        return false;
    }
    // A handler may add or remove receivers for this window
    std::vector<Receiver> receivers = it->second;
    for (const auto& receiver : receivers) {
        receiver.handler(signal, event);
    }
    return true;
}

void WindowEventRouter::route(int, const ParsedEvent& event,
                              const std::string& signalName, const std::string& parentSignalName) {
    bool handled = false;
    if (!parentSignalName.empty()) {
        handled = deliver(event.deliveredTo, parentSignalName, event) || handled;
    }
    if (!signalName.empty()) {
        handled = deliver(event.window, signalName, event) || handled;
    }
    if (handled) {
        return;
    }

    for (const std::string* signal : {&signalName, &parentSignalName}) {
        if (signal->empty()) {
            continue;
        }
        auto it = m_fallbacks.find(*signal);
        if (it == m_fallbacks.end()) {
            continue;
        }
        std::vector<Receiver> receivers = it->second;
        for (const auto& receiver : receivers) {
            receiver.handler(*signal, event);
        }
    }
}

} // namespace XBridge
