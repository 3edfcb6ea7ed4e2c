#include "message_transformer.hpp"

MessageTransformer& MessageTransformer::add(const std::string& name, Transform transform) {
    transforms_[name] = std::move(transform);
    return *this;
}

void MessageTransformer::operator()(const Message& message) const {
    auto it = transforms_.find(message.name);
    if (it == transforms_.end()) {
        next_(message);
        return;
    }

    std::optional<Message> transformed = it->second(message);
    if (transformed) {
        next_(*transformed);
    }
}
