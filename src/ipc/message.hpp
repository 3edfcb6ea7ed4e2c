#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>

// A named, opaque payload exchanged between instances. Name and data are each
// limited to 65535 bytes on the wire.
struct Message {
    std::string name;
    std::vector<uint8_t> data;

    Message() = default;
    explicit Message(std::string name) : name(std::move(name)) {}
    Message(std::string name, std::vector<uint8_t> data)
        : name(std::move(name)), data(std::move(data)) {}
    Message(std::string name, const std::string& text)
        : name(std::move(name)), data(text.begin(), text.end()) {}

    // Payload reinterpreted as text.
    std::string data_string() const { return std::string(data.begin(), data.end()); }

    // "Message(name: [1, 2, 3])", for logs and test failures.
    std::string to_string() const;

    bool operator==(const Message& other) const {
        return name == other.name && data == other.data;
    }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

// Called once per decoded message.
using MessageHandler = std::function<void(const Message&)>;

// Anything that can deliver a message to the first instance.
class MessageSender {
public:
    virtual ~MessageSender() = default;

    virtual void send(const Message& message) = 0;

    void send(const std::string& name) { send(Message(name)); }
    void send(const std::string& name, const std::vector<uint8_t>& data) { send(Message(name, data)); }
    void send(const std::string& name, const std::string& text) { send(Message(name, text)); }
};
