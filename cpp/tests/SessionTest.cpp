#include <gtest/gtest.h>

#include "Session.hpp"
#include "Errors.hpp"

using namespace XBridge;

// Everything past init() needs a live X server; only the lifecycle guards
// are checked here.
TEST(SessionTest, UseBeforeInitIsUsageError) {
    Session session(Config{});
    EXPECT_FALSE(session.isInitialized());
    EXPECT_THROW(session.drain(), UsageError);
    EXPECT_THROW(session.frames(), UsageError);
    EXPECT_THROW(session.getFrame(1, 0, 0, 1, 1), UsageError);
    EXPECT_THROW(session.fileDescriptor(), UsageError);
    EXPECT_TRUE(session.enabledExtensions().empty());
}

TEST(SessionTest, InfoBeforeInit) {
    Config config;
    config.displayName = ":42";
    Session session(config);
    nlohmann::json info = session.info();
    EXPECT_EQ(info["initialized"], false);
    EXPECT_EQ(info["config"]["display"], ":42");
}

TEST(SessionTest, CloseWithoutInitIsHarmless) {
    Session session(Config{});
    EXPECT_NO_THROW(session.close());
    EXPECT_NO_THROW(session.close());
}
