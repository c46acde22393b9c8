#pragma once
#include "IEventRouter.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace XBridge {

using EventHandler = std::function<void(const std::string& signal, const ParsedEvent& event)>;

/**
 * @brief Routes events to the receivers registered for a window.
 *
 * The signal goes to receivers of event.window, the parent signal to
 * receivers of event.deliveredTo. Fallback receivers get a signal
 * nobody registered for the window handled.
 */
class WindowEventRouter : public IEventRouter {
public:
    using ReceiverId = std::uint64_t;

    ReceiverId addReceiver(Window window, EventHandler handler);
    bool removeReceiver(Window window, ReceiverId id);
    void removeWindow(Window window);

    ReceiverId addFallbackReceiver(const std::string& signal, EventHandler handler);
    bool removeFallbackReceiver(const std::string& signal, ReceiverId id);

    std::size_t receiverCount(Window window) const;

    void route(int code, const ParsedEvent& event,
               const std::string& signalName, const std::string& parentSignalName) override;

private:
    struct Receiver {
        ReceiverId id;
        EventHandler handler;
    };

    bool deliver(Window window, const std::string& signal, const ParsedEvent& event);

    std::map<Window, std::vector<Receiver>> m_receivers;
    std::map<std::string, std::vector<Receiver>> m_fallbacks;
    ReceiverId m_nextId = 1;
};

} // namespace XBridge
