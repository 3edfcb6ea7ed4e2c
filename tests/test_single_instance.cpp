#include <gtest/gtest.h>
#include <instance/single_instance.hpp>
#include <core/errors.hpp>
#include "test_support.hpp"

class SingleInstanceTest : public ::testing::Test {
protected:
    Config config = Config::defaults();
    LockRegistry registry;
    LockRegistry other_registry;

    void SetUp() override {
        config.set_lock_file(unique_temp_path("single"));
        fs::remove(config.lock_file());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(config.lock_file(), ec);
    }
};

TEST_F(SingleInstanceTest, FirstReceivesFromFollower) {
    SingleInstance first(registry, config);
    ASSERT_TRUE(first.is_first());

    MessageCollector messages;
    first.on_message(messages.handler());
    ASSERT_TRUE(first.server_port().has_value());

    bool first_action_called = false;
    first.on_already_running([&](DistantInstance&) { first_action_called = true; });
    EXPECT_FALSE(first_action_called);

    SingleInstance follower(other_registry, config);
    EXPECT_FALSE(follower.is_first());

    int calls = 0;
    follower.on_already_running([&](DistantInstance& distant) {
        ++calls;
        EXPECT_EQ(distant.pid(), platform::current_pid());
        EXPECT_EQ(distant.port(), *first.server_port());
        distant.send("open", std::string("a.txt"));
    });
    follower.on_already_running([&](DistantInstance& distant) {
        ++calls;
        distant.send("open", std::string("b.txt"));
    });
    EXPECT_EQ(calls, 2);

    ASSERT_TRUE(messages.wait_for(2));
    EXPECT_EQ(messages.at(0), Message("open", std::string("a.txt")));
    EXPECT_EQ(messages.at(1), Message("open", std::string("b.txt")));
}

TEST_F(SingleInstanceTest, OnMessageTwiceThrows) {
    SingleInstance first(registry, config);
    first.on_message([](const Message&) {});
    EXPECT_THROW(first.on_message([](const Message&) {}), IllegalStateError);
}

TEST_F(SingleInstanceTest, FollowerDoesNotServe) {
    SingleInstance first(registry, config);
    first.on_message([](const Message&) {});

    SingleInstance follower(other_registry, config);
    follower.on_message([](const Message&) {});
    EXPECT_FALSE(follower.server_port().has_value());
    EXPECT_FALSE(follower.is_first());
}

TEST_F(SingleInstanceTest, CloseHandsOverLock) {
    SingleInstance first(registry, config);
    first.on_message([](const Message&) {});

    SingleInstance follower(other_registry, config);
    EXPECT_FALSE(follower.is_first());

    first.close();
    EXPECT_FALSE(first.server_port().has_value());
    EXPECT_FALSE(fs::exists(config.lock_file()));

    EXPECT_TRUE(follower.is_first());
    MessageCollector messages;
    follower.on_message(messages.handler());
    ASSERT_TRUE(follower.server_port().has_value());

    // Idempotent
    first.close();
}

TEST_F(SingleInstanceTest, DestructorReleases) {
    {
        SingleInstance first(registry, config);
        first.on_message([](const Message&) {});
        EXPECT_EQ(registry.size(), 1u);
    }
    EXPECT_EQ(registry.size(), 0u);

    SingleInstance next(other_registry, config);
    EXPECT_TRUE(next.is_first());
}
