#pragma once
#include <X11/Xlib.h>
#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <variant>

namespace XBridge {

struct Rectangle {
    int x = 0;
    int y = 0;
    unsigned int width = 0;
    unsigned int height = 0;
};

// Core protocol payloads

struct MapRequestEvent {};
struct DestroyEvent {};

struct ConfigureRequestEvent {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    int borderWidth = 0;
    Window above = None;
    int detail = 0;
    unsigned long valueMask = 0;
};

struct CirculateRequestEvent {
    int place = 0;
};

struct CreateEvent {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    int borderWidth = 0;
    bool overrideRedirect = false;
};

struct MapEvent {
    bool overrideRedirect = false;
};

struct UnmapEvent {
    bool fromConfigure = false;
};

struct ConfigureEvent {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    int borderWidth = 0;
    Window above = None;
    bool overrideRedirect = false;
};

struct ReparentEvent {
    Window parent = None;
    int x = 0;
    int y = 0;
    bool overrideRedirect = false;
};

struct PropertyEvent {
    Atom atom = None;
    std::string atomName;
    int state = 0;
    Time time = 0;
};

struct ClientMessageEvent {
    Atom messageType = None;
    std::string messageTypeName;
    int format = 0;
    std::array<long, 5> data{};
};

struct FocusEvent {
    int mode = 0;
    int detail = 0;
};

struct CrossingEvent {
    Window root = None;
    Window subwindow = None;
    int x = 0;
    int y = 0;
    int xRoot = 0;
    int yRoot = 0;
    int mode = 0;
    int detail = 0;
    bool focus = false;
    unsigned int state = 0;
    Time time = 0;
};

struct MotionEvent {
    Window root = None;
    Window subwindow = None;
    int x = 0;
    int y = 0;
    int xRoot = 0;
    int yRoot = 0;
    unsigned int state = 0;
    bool isHint = false;
    Time time = 0;
};

struct KeyEvent {
    Window root = None;
    Window subwindow = None;
    unsigned int keycode = 0;
    unsigned int state = 0;
    Time time = 0;
};

struct ButtonEvent {
    Window root = None;
    Window subwindow = None;
    int x = 0;
    int y = 0;
    int xRoot = 0;
    int yRoot = 0;
    unsigned int button = 0;
    unsigned int state = 0;
    Time time = 0;
};

struct SelectionRequestEvent {
    Window owner = None;
    Window requestor = None;
    std::string selection;
    std::string target;
    std::string property;
    Time time = 0;
};

struct SelectionClearEvent {
    std::string selection;
    Time time = 0;
};

struct SelectionNotifyEvent {
    Window requestor = None;
    std::string selection;
    std::string target;
    std::string property;
    Time time = 0;
};

// Extension payloads

struct DamageEvent {
    unsigned long damage = 0;
    int level = 0;
    bool more = false;
    Time timestamp = 0;
    Rectangle area;
    Rectangle geometry;
};

struct ShapeEvent {
    int kind = 0;
    Rectangle region;
    bool shaped = false;
    Time time = 0;
};

struct BellEvent {
    std::string subtype = "bell";
    int device = 0;
    int percent = 0;
    int pitch = 0;
    int duration = 0;
    int bellClass = 0;
    int bellId = 0;
    Atom nameAtom = None;
    std::string bellName;
    bool eventOnly = false;
    Time time = 0;
};

struct CursorEvent {
    int subtype = 0;
    unsigned long cursorSerial = 0;
    Atom cursorName = None;
    std::string cursorNameString;
    Time timestamp = 0;
};

struct XFixesSelectionEvent {
    int subtype = 0;
    Window owner = None;
    std::string selection;
    Time timestamp = 0;
    Time selectionTimestamp = 0;
};

using EventPayload = std::variant<
    MapRequestEvent,
    ConfigureRequestEvent,
    CirculateRequestEvent,
    CreateEvent,
    MapEvent,
    UnmapEvent,
    DestroyEvent,
    ConfigureEvent,
    ReparentEvent,
    PropertyEvent,
    ClientMessageEvent,
    FocusEvent,
    CrossingEvent,
    MotionEvent,
    KeyEvent,
    ButtonEvent,
    SelectionRequestEvent,
    SelectionClearEvent,
    SelectionNotifyEvent,
    DamageEvent,
    ShapeEvent,
    BellEvent,
    CursorEvent,
    XFixesSelectionEvent>;

/**
 * @brief A decoded event, ready for routing.
 *
 * window is the window the event is about, deliveredTo the window whose
 * event mask selected it (the parent for substructure events).
 */
struct ParsedEvent {
    int type = 0;
    std::string name;
    unsigned long serial = 0;
    bool sendEvent = false;
    Window window = None;
    Window deliveredTo = None;
    EventPayload payload;
};

/**
 * @brief Field mapping view of the event, for logging and Python routers
 */
nlohmann::json toJson(const ParsedEvent& event);

} // namespace XBridge
