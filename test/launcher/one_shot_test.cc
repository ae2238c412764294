#include <gtest/gtest.h>
#include <functional>
#include <stdexcept>
#include "launcher/one_shot.h"

using namespace Flotilla;

TEST(OneShotTest, TakeMovesTheValueOutOnce) {
    OneShot<std::function<int()>> slot([]() { return 7; });
    ASSERT_TRUE(slot.present());

    auto f = slot.Take();
    EXPECT_EQ(f(), 7);
    EXPECT_FALSE(slot.present());
    EXPECT_THROW(slot.Take(), std::logic_error);
}

TEST(OneShotTest, EmptyFunctionIsNotPresent) {
    OneShot<std::function<int()>> empty_function{std::function<int()>()};
    EXPECT_FALSE(empty_function.present());

    OneShot<std::function<int()>> unset;
    EXPECT_FALSE(unset.present());
    EXPECT_THROW(unset.Take(), std::logic_error);
}
