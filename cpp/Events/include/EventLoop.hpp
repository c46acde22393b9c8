#pragma once
#include "AtomCache.hpp"
#include "DisplayContext.hpp"
#include "EventRegistry.hpp"
#include "IEventRouter.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>

namespace XBridge {

enum class LoopState {
    Idle,
    Draining,
    Dispatching
};

struct EventLoopStats {
    std::uint64_t processed = 0;
    std::uint64_t routed = 0;
    std::uint64_t ignored = 0;        // recognized, nothing to route
    std::uint64_t unknown = 0;
    std::uint64_t parseFailures = 0;
    std::uint64_t routerFailures = 0;
};

/**
 * @brief Drains pending events, parses them and hands them to the router.
 *
 * drain() is driven by an external scheduler (timer or fd readiness) and
 * never waits on the connection.
 */
class EventLoop {
public:
    EventLoop(DisplayContext& context, EventRegistry& registry, AtomCache& atoms, IEventRouter& router);

    /**
     * @brief Processes every event that is already pending
     * @return the number of events read
     */
    std::size_t drain();

    void setRouter(IEventRouter& router) { m_router = &router; }
    void setDebug(bool debug) { m_debug = debug; }
    void setSlowEventThreshold(std::chrono::milliseconds threshold) { m_slowThreshold = threshold; }

    LoopState state() const { return m_state; }
    const EventLoopStats& stats() const { return m_stats; }

private:
    void dispatch(const XEvent& event);

    DisplayContext& m_context;
    EventRegistry& m_registry;
    AtomCache& m_atoms;
    IEventRouter* m_router;
    LoopState m_state = LoopState::Idle;
    EventLoopStats m_stats;
    std::set<int> m_reportedUnknown;
    bool m_debug = false;
    std::chrono::milliseconds m_slowThreshold{50};
};

} // namespace XBridge
