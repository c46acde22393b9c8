#include "EventLoop.hpp"
#include "Errors.hpp"
#include <exception>
#include <iostream>

namespace XBridge {

EventLoop::EventLoop(DisplayContext& context, EventRegistry& registry, AtomCache& atoms, IEventRouter& router)
    : m_context(context), m_registry(registry), m_atoms(atoms), m_router(&router) {}

std::size_t EventLoop::drain() {
    if (m_state != LoopState::Idle) {
        std::cerr << "EventLoop::drain() called from inside an event handler, ignored" << std::endl;
        return 0;
    }
    if (!m_context.isUsable()) {
        return 0;
    }

    struct IdleOnExit {
        LoopState& state;
        ~IdleOnExit() { state = LoopState::Idle; }
    } idleOnExit{m_state};

    IXConnection& connection = m_context.connection();
    std::size_t count = 0;
    m_state = LoopState::Draining;
    while (m_context.isUsable() && connection.pending() > 0) {
        XEvent event;
        connection.nextEvent(event);
        ++count;
        ++m_stats.processed;
        m_state = LoopState::Dispatching;
        dispatch(event);
        m_state = LoopState::Draining;
    }
    return count;
}

void EventLoop::dispatch(const XEvent& event) {
    const int code = EventRegistry::classify(event);
    const RegisteredEventType* entry = m_registry.lookup(code);
    if (!entry) {
        ++m_stats.unknown;
        if (m_reportedUnknown.insert(code).second) {
            std::cerr << "Ignoring unregistered X11 event type " << code << std::endl;
        }
        return;
    }

    const auto start = std::chrono::steady_clock::now();
    std::optional<ParsedEvent> parsed;
    try {
        ParseContext parseContext{m_context.connection(), m_atoms};
        parsed = entry->parser(parseContext, event);
    } catch (const UsageError&) {
        throw;
    } catch (const std::exception& e) {
        ++m_stats.parseFailures;
        std::cerr << "Failed to parse " << entry->shortName << " (type " << code
                  << ", serial " << event.xany.serial << "): " << e.what() << std::endl;
        return;
    } catch (...) {
        ++m_stats.parseFailures;
        std::cerr << "Failed to parse " << entry->shortName << " (type " << code
                  << ", serial " << event.xany.serial << "): unknown exception" << std::endl;
        return;
    }

    if (!parsed) {
        ++m_stats.ignored;
        return;
    }
    parsed->type = code;
    parsed->name = entry->shortName;

    if (m_debug) {
        std::cout << "X11 event " << entry->shortName << " window=0x" << std::hex << parsed->window
                  << " delivered_to=0x" << parsed->deliveredTo << std::dec
                  << " " << toJson(*parsed).dump() << std::endl;
    }

    try {
        m_router->route(code, *parsed, entry->signalName, entry->parentSignalName);
        ++m_stats.routed;
    } catch (const UsageError&) {
        throw;
    } catch (const std::exception& e) {
        ++m_stats.routerFailures;
        std::cerr << "Error routing " << entry->shortName << " for window 0x" << std::hex
                  << parsed->window << std::dec << ": " << e.what() << std::endl;
    } catch (...) {
        ++m_stats.routerFailures;
        std::cerr << "Error routing " << entry->shortName << " for window 0x" << std::hex
                  << parsed->window << std::dec << ": unknown exception" << std::endl;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed > m_slowThreshold) {
        std::cerr << "Slow X11 event handler: " << entry->shortName << " took "
                  << elapsed.count() << "ms" << std::endl;
    }
}

} // namespace XBridge
