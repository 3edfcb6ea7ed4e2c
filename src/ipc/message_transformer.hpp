#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include "message.hpp"

// MessageHandler decorator: rewrites messages by name before passing them on.
//
//   MessageTransformer handler(print_message);
//   handler.add("open", [](const Message& m) { return Message("open", resolve(m.data_string())); })
//          .add("ping", [](const Message&) { return std::nullopt; });   // swallow pings
//   server.consume(std::ref(handler));
class MessageTransformer {
public:
    using Transform = std::function<std::optional<Message>(const Message&)>;

    explicit MessageTransformer(MessageHandler next) : next_(std::move(next)) {}

    // Register the transform for `name`, replacing any previous one.
    MessageTransformer& add(const std::string& name, Transform transform);

    // Apply the transform registered for the message's name, if any, and
    // forward the result. A transform returning nullopt drops the message.
    void operator()(const Message& message) const;

    bool has(const std::string& name) const { return transforms_.count(name) > 0; }

private:
    MessageHandler next_;
    std::map<std::string, Transform> transforms_;
};
