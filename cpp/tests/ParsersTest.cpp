#include <gtest/gtest.h>

#include "Extension.hpp"
#include "parsers/CoreParsers.hpp"
#include "parsers/ShapeParser.hpp"
#include "parsers/XFixesParser.hpp"
#include "parsers/XkbParser.hpp"
#include "parsers/DamageParser.hpp"
#include <X11/extensions/Xdamage.h>
#include "fakes/FakeConnection.hpp"
#include <X11/XKBlib.h>
#include <X11/extensions/Xfixes.h>
#include <X11/extensions/shape.h>
#include <cstring>

using namespace XBridge;
using XBridge::Testing::FakeConnection;

class ParsersTest : public ::testing::Test {
protected:
    FakeConnection connection;
    DisplayContext context{connection};
    AtomCache atoms{context};
    ParseContext parseContext{connection, atoms};

    // Extension structs are overlaid on XEvent the way Xlib delivers them
    template <typename T>
    static XEvent overlay(const T& source) {
        static_assert(sizeof(T) <= sizeof(XEvent), "event struct larger than XEvent");
        XEvent event{};
        std::memcpy(&event, &source, sizeof(T));
        return event;
    }
};

TEST_F(ParsersTest, MapNotifyTargetsWindowAndParent) {
    XEvent event{};
    event.xmap.type = MapNotify;
    event.xmap.serial = 17;
    event.xmap.event = 0x100;
    event.xmap.window = 0x200;
    event.xmap.override_redirect = True;

    auto parsed = parseMapNotify(parseContext, event);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->window, 0x200u);
    EXPECT_EQ(parsed->deliveredTo, 0x100u);
    EXPECT_EQ(parsed->serial, 17u);
    EXPECT_TRUE(std::get<MapEvent>(parsed->payload).overrideRedirect);
}

TEST_F(ParsersTest, PropertyNotifyResolvesAtomName) {
    connection.atoms["_NET_WM_NAME"] = 311;
    XEvent event{};
    event.xproperty.type = PropertyNotify;
    event.xproperty.window = 0x400001;
    event.xproperty.atom = 311;
    event.xproperty.state = PropertyNewValue;
    event.xproperty.time = 1234;

    auto parsed = parsePropertyNotify(parseContext, event);
    ASSERT_TRUE(parsed.has_value());
    const auto& payload = std::get<PropertyEvent>(parsed->payload);
    EXPECT_EQ(payload.atomName, "_NET_WM_NAME");
    EXPECT_EQ(payload.time, 1234u);
    EXPECT_EQ(parsed->window, parsed->deliveredTo);
}

TEST_F(ParsersTest, PropertyNotifyRejectsBadState) {
    XEvent event{};
    event.xproperty.type = PropertyNotify;
    event.xproperty.state = 7;
    EXPECT_THROW(parsePropertyNotify(parseContext, event), EventParseError);
}

TEST_F(ParsersTest, ClientMessageCopiesData) {
    connection.atoms["_NET_WM_STATE"] = 320;
    XEvent event{};
    event.xclient.type = ClientMessage;
    event.xclient.window = 0x600001;
    event.xclient.message_type = 320;
    event.xclient.format = 32;
    for (int i = 0; i < 5; ++i) {
        event.xclient.data.l[i] = 10 + i;
    }

    auto parsed = parseClientMessage(parseContext, event);
    ASSERT_TRUE(parsed.has_value());
    const auto& payload = std::get<ClientMessageEvent>(parsed->payload);
    EXPECT_EQ(payload.messageTypeName, "_NET_WM_STATE");
    EXPECT_EQ(payload.data[0], 10);
    EXPECT_EQ(payload.data[4], 14);
}

TEST_F(ParsersTest, ClientMessageRejectsBadFormat) {
    XEvent event{};
    event.xclient.type = ClientMessage;
    event.xclient.format = 12;
    EXPECT_THROW(parseClientMessage(parseContext, event), EventParseError);
}

TEST_F(ParsersTest, BellWithoutWindowFallsBackToRoot) {
    XkbEvent xkb{};
    xkb.bell.type = 85 + XkbEventCode;
    xkb.bell.serial = 55;
    xkb.bell.xkb_type = XkbBellNotify;
    xkb.bell.window = None;
    xkb.bell.percent = 50;
    xkb.bell.pitch = 400;
    xkb.bell.duration = 100;
    xkb.bell.bell_class = 1;
    xkb.bell.bell_id = 2;
    xkb.bell.event_only = True;

    auto parsed = parseXkbEvent(parseContext, xkb.core);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->window, connection.root);
    EXPECT_EQ(parsed->deliveredTo, connection.root);
    const auto& bell = std::get<BellEvent>(parsed->payload);
    EXPECT_EQ(bell.subtype, "bell");
    EXPECT_EQ(bell.percent, 50);
    EXPECT_EQ(bell.pitch, 400);
    EXPECT_EQ(bell.duration, 100);
    EXPECT_TRUE(bell.eventOnly);
    EXPECT_TRUE(bell.bellName.empty());
}

TEST_F(ParsersTest, BellOnWindowKeepsWindow) {
    connection.atoms["bell-alert"] = 401;
    XkbEvent xkb{};
    xkb.bell.type = 85 + XkbEventCode;
    xkb.bell.xkb_type = XkbBellNotify;
    xkb.bell.window = 0x800003;
    xkb.bell.name = 401;

    auto parsed = parseXkbEvent(parseContext, xkb.core);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->window, 0x800003u);
    EXPECT_EQ(parsed->deliveredTo, 0x800003u);
    EXPECT_EQ(std::get<BellEvent>(parsed->payload).bellName, "bell-alert");
}

TEST_F(ParsersTest, OtherXkbEventsAreIgnored) {
    XkbEvent xkb{};
    xkb.any.type = 85 + XkbEventCode;
    xkb.any.xkb_type = XkbStateNotify;
    EXPECT_FALSE(parseXkbEvent(parseContext, xkb.core).has_value());
}

TEST_F(ParsersTest, ShapeNotify) {
    XShapeEvent shape{};
    shape.type = 64 + ShapeNotify;
    shape.window = 0x500002;
    shape.kind = ShapeBounding;
    shape.x = -2;
    shape.y = 3;
    shape.width = 640;
    shape.height = 480;
    shape.shaped = True;

    auto parsed = parseShapeNotify(parseContext, overlay(shape));
    ASSERT_TRUE(parsed.has_value());
    const auto& payload = std::get<ShapeEvent>(parsed->payload);
    EXPECT_EQ(payload.region.x, -2);
    EXPECT_EQ(payload.region.width, 640u);
    EXPECT_TRUE(payload.shaped);
    EXPECT_EQ(parsed->window, 0x500002u);
}

TEST_F(ParsersTest, ShapeNotifyRejectsUnknownKind) {
    XShapeEvent shape{};
    shape.type = 64 + ShapeNotify;
    shape.kind = 9;
    EXPECT_THROW(parseShapeNotify(parseContext, overlay(shape)), EventParseError);
}

TEST_F(ParsersTest, CursorNotifyResolvesName) {
    connection.atoms["left_ptr"] = 500;
    XFixesCursorNotifyEvent cursor{};
    cursor.type = 87 + XFixesCursorNotify;
    cursor.window = connection.root;
    cursor.subtype = XFixesDisplayCursorNotify;
    cursor.cursor_serial = 12;
    cursor.cursor_name = 500;

    auto parsed = parseCursorNotify(parseContext, overlay(cursor));
    ASSERT_TRUE(parsed.has_value());
    const auto& payload = std::get<CursorEvent>(parsed->payload);
    EXPECT_EQ(payload.cursorSerial, 12u);
    EXPECT_EQ(payload.cursorNameString, "left_ptr");
}

TEST_F(ParsersTest, XFixesSelectionRejectsUnknownSubtype) {
    XFixesSelectionNotifyEvent selection{};
    selection.type = 87 + XFixesSelectionNotify;
    selection.subtype = 42;
    EXPECT_THROW(parseXFixesSelectionNotify(parseContext, overlay(selection)), EventParseError);
}

TEST_F(ParsersTest, DamageNotifyCarriesAreaAndGeometry) {
    XDamageNotifyEvent damage{};
    damage.type = 91 + XDamageNotify;
    damage.drawable = 0x700001;
    damage.damage = 0x700010;
    damage.level = XDamageReportNonEmpty;
    damage.more = True;
    damage.area = {4, 8, 16, 32};
    damage.geometry = {0, 0, 640, 480};

    auto parsed = parseDamageNotify(parseContext, overlay(damage));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->window, 0x700001u);
    const auto& payload = std::get<DamageEvent>(parsed->payload);
    EXPECT_EQ(payload.damage, 0x700010u);
    EXPECT_TRUE(payload.more);
    EXPECT_EQ(payload.area.y, 8);
    EXPECT_EQ(payload.area.height, 32u);
    EXPECT_EQ(payload.geometry.width, 640u);
}

TEST_F(ParsersTest, JsonViewCarriesHeader) {
    XEvent event{};
    event.xdestroywindow.type = DestroyNotify;
    event.xdestroywindow.serial = 99;
    event.xdestroywindow.event = 0x300;
    event.xdestroywindow.window = 0x300;

    auto parsed = parseDestroyNotify(parseContext, event);
    ASSERT_TRUE(parsed.has_value());
    parsed->type = DestroyNotify;
    parsed->name = "DestroyNotify";
    nlohmann::json j = toJson(*parsed);
    EXPECT_EQ(j["name"], "DestroyNotify");
    EXPECT_EQ(j["serial"], 99);
    EXPECT_EQ(j["window"], 0x300);
    EXPECT_EQ(j["delivered_to"], 0x300);
    EXPECT_EQ(j["send_event"], false);
}
