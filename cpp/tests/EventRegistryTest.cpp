#include <gtest/gtest.h>

#include "EventRegistry.hpp"
#include "Errors.hpp"
#include "Extension.hpp"
#include "parsers/CoreParsers.hpp"
#include "parsers/DamageParser.hpp"
#include "parsers/ShapeParser.hpp"
#include "parsers/XFixesParser.hpp"
#include "parsers/XkbParser.hpp"
#include "fakes/FakeConnection.hpp"
#include <X11/XKBlib.h>
#include <X11/extensions/Xdamage.h>
#include <X11/extensions/Xfixes.h>
#include <X11/extensions/shape.h>

using namespace XBridge;
using XBridge::Testing::FakeConnection;

namespace {

EventParser constantParser(Window window) {
    return [window](ParseContext&, const XEvent&) -> std::optional<ParsedEvent> {
        ParsedEvent event;
        event.window = window;
        return event;
    };
}

} // namespace

TEST(EventRegistryTest, ReRegisteringOverwrites) {
    FakeConnection connection;
    DisplayContext context(connection);
    AtomCache atoms(context);
    ParseContext parseContext{connection, atoms};
    XEvent event{};

    EventRegistry registry;
    registry.registerType(64, "First", "first-signal", "", constantParser(1));
    registry.registerType(64, "Second", "second-signal", "second-parent", constantParser(2));

    EXPECT_EQ(registry.size(), 1u);
    const RegisteredEventType* entry = registry.lookup(64);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->shortName, "Second");
    EXPECT_EQ(entry->signalName, "second-signal");
    EXPECT_EQ(entry->parentSignalName, "second-parent");
    EXPECT_EQ(entry->parser(parseContext, event)->window, 2u);
}

TEST(EventRegistryTest, UnknownCodes) {
    EventRegistry registry;
    EXPECT_EQ(registry.lookup(99), nullptr);
    EXPECT_EQ(registry.name(99), "unknown-event-99");
}

TEST(EventRegistryTest, ClassifyReadsTypeOnly) {
    XEvent event{};
    event.type = MapNotify;
    EXPECT_EQ(EventRegistry::classify(event), MapNotify);
    event.type = MapNotify | 0x80;
    EXPECT_EQ(EventRegistry::classify(event), MapNotify);
}

TEST(EventRegistryTest, CoreRegistrationIsIdempotent) {
    EventRegistry registry;
    registerCoreEvents(registry);
    const std::size_t count = registry.size();
    registerCoreEvents(registry);
    EXPECT_EQ(registry.size(), count);

    const RegisteredEventType* map = registry.lookup(MapNotify);
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(map->signalName, "x11-map-event");
    EXPECT_EQ(map->parentSignalName, "x11-child-map-event");

    const RegisteredEventType* mapRequest = registry.lookup(MapRequest);
    ASSERT_NE(mapRequest, nullptr);
    EXPECT_TRUE(mapRequest->signalName.empty());
    EXPECT_EQ(mapRequest->parentSignalName, "x11-child-map-request-event");
}

TEST(EventRegistryTest, ExtensionEventsUseEventBase) {
    FakeConnection connection;
    connection.extensions["SHAPE"] = {129, 64, 128};
    connection.extensions["XFIXES"] = {138, 87, 140};
    connection.extensions["XKEYBOARD"] = {135, 85, 137};
    connection.extensions["DAMAGE"] = {143, 91, 152};
    DisplayContext context(connection);

    EventRegistry registry;
    Extension shape(context, kShapeExtension);
    Extension xfixes(context, kXFixesExtension);
    Extension xkb(context, kXkbExtension);
    Extension damage(context, kDamageExtension);
    registerShapeEvents(registry, shape);
    registerXFixesEvents(registry, xfixes);
    registerXkbEvents(registry, xkb);
    registerDamageEvents(registry, damage);

    EXPECT_EQ(registry.name(64 + ShapeNotify), "ShapeNotify");
    EXPECT_EQ(registry.name(87 + XFixesCursorNotify), "XFixesCursorNotify");
    EXPECT_EQ(registry.name(87 + XFixesSelectionNotify), "XFixesSelectionNotify");
    EXPECT_EQ(registry.name(85 + XkbEventCode), "XKBNotify");
    EXPECT_EQ(registry.lookup(85)->signalName, "x11-xkb-event");
    EXPECT_EQ(registry.name(91 + XDamageNotify), "DamageNotify");
    EXPECT_EQ(registry.lookup(91 + XDamageNotify)->signalName, "x11-damage-event");
}

TEST(EventRegistryTest, MissingExtensionRegistersNothing) {
    FakeConnection connection;
    DisplayContext context(connection);
    EventRegistry registry;
    Extension shape(context, kShapeExtension);

    try {
        registerShapeEvents(registry, shape);
        FAIL() << "expected ExtensionUnavailable";
    } catch (const ExtensionUnavailable& e) {
        EXPECT_EQ(e.extension(), "SHAPE");
    }
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(shape.hasSupport());
}
