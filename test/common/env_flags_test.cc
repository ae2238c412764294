#include <gtest/gtest.h>
#include <cstdlib>
#include "common/env_flags.h"

using namespace Flotilla;

TEST(EnvFlagsTest, DebugOutputIsPresenceOnly) {
    unsetenv(kDebugOutputEnv);
    EXPECT_FALSE(DebugOutputRequested());

    setenv(kDebugOutputEnv, "", 1);
    EXPECT_TRUE(DebugOutputRequested());

    setenv(kDebugOutputEnv, "0", 1);
    EXPECT_TRUE(DebugOutputRequested());

    unsetenv(kDebugOutputEnv);
}

TEST(EnvFlagsTest, ReadEnvString) {
    const char* name = "FLOTILLA_TEST_STRING";
    unsetenv(name);
    EXPECT_FALSE(ReadEnvString(name).has_value());

    setenv(name, "value", 1);
    ASSERT_TRUE(ReadEnvString(name).has_value());
    EXPECT_EQ(*ReadEnvString(name), "value");

    unsetenv(name);
}
