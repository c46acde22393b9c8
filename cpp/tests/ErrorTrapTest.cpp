#include <gtest/gtest.h>

#include "DisplayContext.hpp"
#include "ErrorTrap.hpp"
#include "Errors.hpp"
#include "fakes/FakeConnection.hpp"
#include <stdexcept>

using namespace XBridge;
using XBridge::Testing::FakeConnection;

namespace {

XErrorInfo makeError(int code, unsigned long serial) {
    XErrorInfo error;
    error.errorCode = code;
    error.serial = serial;
    error.requestCode = 18;
    error.resourceId = 0x400001;
    return error;
}

} // namespace

TEST(ErrorCellTest, ConsumeReturnsErrorOnce) {
    ErrorCell cell;
    cell.record(makeError(BadWindow, 42));

    auto first = cell.consume();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->errorCode, BadWindow);
    EXPECT_EQ(first->serial, 42u);

    EXPECT_FALSE(cell.consume().has_value());
}

TEST(ErrorCellTest, KeepsFirstErrorAndCountsDropped) {
    ErrorCell cell;
    cell.record(makeError(BadWindow, 1));
    cell.record(makeError(BadMatch, 2));
    cell.record(makeError(BadAtom, 3));

    auto error = cell.consume();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->errorCode, BadWindow);
    EXPECT_EQ(cell.recorded(), 3u);
    EXPECT_EQ(cell.dropped(), 2u);
}

TEST(ErrorCellTest, PeekDoesNotClear) {
    ErrorCell cell;
    cell.record(makeError(BadValue, 7));
    EXPECT_TRUE(cell.peek().has_value());
    EXPECT_TRUE(cell.peek().has_value());
    cell.clear();
    EXPECT_FALSE(cell.peek().has_value());
}

TEST(ErrorTrapTest, SpanDiscardsStaleError) {
    FakeConnection connection;
    DisplayContext context(connection);
    context.onProtocolError(makeError(BadWindow, 1));

    ErrorTrapSpan span(context, SyncPolicy::NoSync);
    EXPECT_FALSE(span.finish().has_value());
}

TEST(ErrorTrapTest, SyncPolicyRoundTripsBeforeReading) {
    FakeConnection connection;
    DisplayContext context(connection);
    connection.onSync = [&]() { context.onProtocolError(makeError(BadDrawable, 9)); };

    auto error = trapErrors(context, []() {});
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->errorCode, BadDrawable);
    EXPECT_EQ(connection.syncCalls, 1);
}

TEST(ErrorTrapTest, NoSyncPolicySkipsRoundTrip) {
    FakeConnection connection;
    DisplayContext context(connection);

    auto error = trapErrors(context, [&]() { context.onProtocolError(makeError(BadAtom, 3)); }, SyncPolicy::NoSync);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->errorCode, BadAtom);
    EXPECT_EQ(connection.syncCalls, 0);
}

TEST(ErrorTrapTest, FinishTwiceReportsNothing) {
    FakeConnection connection;
    DisplayContext context(connection);
    ErrorTrapSpan span(context, SyncPolicy::NoSync);
    context.onProtocolError(makeError(BadMatch, 4));
    EXPECT_TRUE(span.finish().has_value());
    EXPECT_FALSE(span.finish().has_value());
}

TEST(ErrorTrapTest, NestedSpanKeepsOuterError) {
    FakeConnection connection;
    DisplayContext context(connection);

    std::optional<XErrorInfo> inner;
    auto outer = trapErrors(context, [&]() {
        context.onProtocolError(makeError(BadWindow, 42));
        inner = trapErrors(context, []() {}, SyncPolicy::NoSync);
    }, SyncPolicy::NoSync);

    EXPECT_FALSE(inner.has_value());
    ASSERT_TRUE(outer.has_value());
    EXPECT_EQ(outer->errorCode, BadWindow);
    EXPECT_EQ(outer->serial, 42u);
    EXPECT_EQ(context.trapDepth(), 0);
}

TEST(ErrorTrapTest, NestedSpanErrorReachesOuterSpan) {
    FakeConnection connection;
    DisplayContext context(connection);

    std::optional<XErrorInfo> inner;
    auto outer = trapErrors(context, [&]() {
        inner = trapErrors(context, [&]() { context.onProtocolError(makeError(BadAtom, 5)); }, SyncPolicy::NoSync);
        context.onProtocolError(makeError(BadMatch, 6));
    }, SyncPolicy::NoSync);

    ASSERT_TRUE(inner.has_value());
    EXPECT_EQ(inner->errorCode, BadAtom);
    ASSERT_TRUE(outer.has_value());
    EXPECT_EQ(outer->errorCode, BadAtom);
    EXPECT_EQ(outer->serial, 5u);
}

TEST(ErrorTrapTest, NestedSpanReportsFirstOfBoth) {
    FakeConnection connection;
    DisplayContext context(connection);

    ErrorTrapSpan outer(context, SyncPolicy::NoSync);
    context.onProtocolError(makeError(BadWindow, 1));
    {
        ErrorTrapSpan inner(context, SyncPolicy::NoSync);
        context.onProtocolError(makeError(BadValue, 2));
        auto error = inner.finish();
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->serial, 2u);
    }
    auto error = outer.finish();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->serial, 1u);
}

TEST(ErrorTrapTest, AbandonedNestedSpanHandsErrorBack) {
    FakeConnection connection;
    DisplayContext context(connection);

    auto outer = trapErrors(context, [&]() {
        try {
            trapErrors(context, [&]() {
                context.onProtocolError(makeError(BadDrawable, 8));
                throw std::runtime_error("request failed");
            }, SyncPolicy::NoSync);
        } catch (const std::runtime_error&) {
        }
    }, SyncPolicy::NoSync);

    ASSERT_TRUE(outer.has_value());
    EXPECT_EQ(outer->errorCode, BadDrawable);
    EXPECT_EQ(context.trapDepth(), 0);
}

TEST(ErrorTrapTest, ThrowIfErrorRaisesXError) {
    FakeConnection connection;
    DisplayContext context(connection);
    EXPECT_NO_THROW(throwIfError(context, std::nullopt));
    try {
        throwIfError(context, makeError(BadWindow, 11));
        FAIL() << "expected XError";
    } catch (const XError& e) {
        EXPECT_EQ(e.info().errorCode, BadWindow);
        EXPECT_EQ(e.info().serial, 11u);
    }
}

TEST(DisplayContextTest, IOErrorPoisonsContext) {
    FakeConnection connection;
    DisplayContext context(connection);
    context.installErrorHandlers();
    EXPECT_TRUE(context.handlersInstalled());
    EXPECT_TRUE(context.isUsable());

    context.onIOError();
    EXPECT_TRUE(context.isPoisoned());
    EXPECT_FALSE(context.isUsable());
    EXPECT_THROW(context.checkUsable("test"), ConnectionError);
}

TEST(DisplayContextTest, LostServerPoisonsThroughExitHook) {
    FakeConnection connection;
    DisplayContext context(connection);
    context.installErrorHandlers();
    ASSERT_NE(connection.ioExitHandler, nullptr);
    EXPECT_EQ(connection.ioExitData, &context);

    connection.loseServer();
    EXPECT_TRUE(context.isPoisoned());
}

TEST(DisplayContextTest, DestructorDetachesExitHookFromOpenDisplay) {
    FakeConnection connection;
    {
        DisplayContext context(connection);
        context.installErrorHandlers();
    }
    ASSERT_NE(connection.ioExitHandler, nullptr);
    EXPECT_EQ(connection.ioExitData, nullptr);
    EXPECT_NO_FATAL_FAILURE(connection.loseServer());
}

TEST(DisplayContextTest, ClosedConnectionIsNotUsable) {
    FakeConnection connection;
    DisplayContext context(connection);
    connection.open = false;
    EXPECT_FALSE(context.isUsable());
    EXPECT_THROW(context.checkUsable("test"), ConnectionError);
}

TEST(DisplayContextTest, PoisonedSpanSkipsSync) {
    FakeConnection connection;
    DisplayContext context(connection);
    context.onIOError();
    auto error = trapErrors(context, []() {});
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(connection.syncCalls, 0);
}

TEST(DisplayContextTest, ErrorTextWithoutDisplay) {
    FakeConnection connection;
    DisplayContext context(connection);
    EXPECT_EQ(context.errorText(BadWindow), "X11 error 3");
}
