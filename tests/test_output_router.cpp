#include <gatedrepl/repl/output_router.hpp>

#include <gtest/gtest.h>

using namespace gatedrepl;

TEST(OutputRouterTest, WritesToPrimaryByDefault) {
    OutputRouter router;
    EXPECT_EQ(router.target(), OutputTarget::PRIMARY);
    router.write("hello ");
    router.write("world");
    EXPECT_EQ(router.buffer(OutputTarget::PRIMARY), "hello world");
    EXPECT_EQ(router.buffer(OutputTarget::SECONDARY), "");
    EXPECT_EQ(router.size(OutputTarget::PRIMARY), 11u);
}

TEST(OutputRouterTest, TargetSwitch) {
    OutputRouter router;
    router.write("a");
    router.set_target(OutputTarget::SECONDARY);
    router.write("b");
    router.set_target(OutputTarget::PRIMARY);
    router.write("c");
    EXPECT_EQ(router.buffer(OutputTarget::PRIMARY), "ac");
    EXPECT_EQ(router.buffer(OutputTarget::SECONDARY), "b");
}

TEST(OutputRouterTest, ScopedRedirectRestoresTarget) {
    OutputRouter router;
    {
        OutputRouter::ScopedRedirect redirect(router, OutputTarget::SECONDARY);
        EXPECT_EQ(router.target(), OutputTarget::SECONDARY);
        router.write("inner");
    }
    EXPECT_EQ(router.target(), OutputTarget::PRIMARY);
    router.write("outer");
    EXPECT_EQ(router.buffer(OutputTarget::SECONDARY), "inner");
    EXPECT_EQ(router.buffer(OutputTarget::PRIMARY), "outer");
}

TEST(OutputRouterTest, ScopedRedirectRestoresOnException) {
    OutputRouter router;
    try {
        OutputRouter::ScopedRedirect redirect(router, OutputTarget::SECONDARY);
        throw std::runtime_error("model failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(router.target(), OutputTarget::PRIMARY);
}

TEST(OutputRouterTest, BuffersAccumulateUntilCleared) {
    OutputRouter router;
    router.write("one\n");
    router.write("two\n");
    EXPECT_EQ(router.buffer(OutputTarget::PRIMARY), "one\ntwo\n");
    EXPECT_EQ(router.size(OutputTarget::PRIMARY), 8u);

    router.clear(OutputTarget::PRIMARY);
    EXPECT_EQ(router.buffer(OutputTarget::PRIMARY), "");

    router.set_target(OutputTarget::SECONDARY);
    router.write("x");
    router.clear_all();
    EXPECT_EQ(router.size(OutputTarget::SECONDARY), 0u);
}

TEST(OutputRouterTest, TargetNames) {
    EXPECT_STREQ(output_target_name(OutputTarget::PRIMARY), "primary");
    EXPECT_STREQ(output_target_name(OutputTarget::SECONDARY), "secondary");
}
