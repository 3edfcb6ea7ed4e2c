#include <gtest/gtest.h>
#include <ipc/message_transformer.hpp>
#include <cctype>
#include <vector>

class MessageTransformerTest : public ::testing::Test {
protected:
    std::vector<Message> received;
    MessageTransformer transformer{[this](const Message& m) { received.push_back(m); }};
};

TEST_F(MessageTransformerTest, UnregisteredNamePassesThrough) {
    transformer(Message("plain", std::string("x")));
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], Message("plain", std::string("x")));
}

TEST_F(MessageTransformerTest, RegisteredTransformIsApplied) {
    transformer.add("upper", [](const Message& m) {
        std::string text = m.data_string();
        for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return std::optional<Message>(Message(m.name, text));
    });

    transformer(Message("upper", std::string("abc")));
    transformer(Message("other", std::string("abc")));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], Message("upper", std::string("ABC")));
    EXPECT_EQ(received[1], Message("other", std::string("abc")));
}

TEST_F(MessageTransformerTest, NulloptDropsMessage) {
    transformer.add("ping", [](const Message&) { return std::optional<Message>(); });
    transformer(Message("ping"));
    EXPECT_TRUE(received.empty());
    EXPECT_TRUE(transformer.has("ping"));
}

TEST_F(MessageTransformerTest, LaterRegistrationReplacesEarlier) {
    transformer
        .add("x", [](const Message&) { return std::optional<Message>(Message("first")); })
        .add("x", [](const Message&) { return std::optional<Message>(Message("second")); });

    transformer(Message("x"));
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], Message("second"));
}

TEST_F(MessageTransformerTest, CanRenameMessages) {
    transformer.add("legacy", [](const Message& m) {
        return std::optional<Message>(Message("current", m.data));
    });
    transformer(Message("legacy", std::string("payload")));
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], Message("current", std::string("payload")));
}
