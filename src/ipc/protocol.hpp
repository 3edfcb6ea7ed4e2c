#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include "message.hpp"

// Wire format, one frame per message:
//
//   nameLen:u16 | dataLen:u16 | name[nameLen] | data[dataLen]
//
// Lengths are big-endian. There is no version byte, checksum or terminator.

// Encode one frame. Throws std::length_error if the name or the payload is
// longer than 65535 bytes.
std::vector<uint8_t> encode_frame(const Message& message);

// Incremental decoder for one connection. Bytes may arrive split anywhere,
// including inside the length prefix; whatever cannot be interpreted yet is
// kept until the next feed(). Every byte sequence is a valid prefix of some
// stream, so decoding never fails.
class FrameDecoder {
public:
    // Consume `size` bytes. Each completed frame is appended to pending().
    void feed(const uint8_t* bytes, std::size_t size);
    void feed(const std::vector<uint8_t>& bytes) { feed(bytes.data(), bytes.size()); }

    // Messages decoded so far and not yet taken, oldest first.
    const std::vector<Message>& pending() const { return pending_; }

    // Move the pending messages out, leaving the queue empty.
    std::vector<Message> take();

    // True while a frame is partially buffered.
    bool in_frame() const { return stage_ != Stage::Header || header_fill_ > 0; }

private:
    enum class Stage { Header, Name, Data };

    void start_body();
    void finish_frame();

    Stage stage_ = Stage::Header;
    std::array<uint8_t, FRAME_HEADER_SIZE> header_{};
    std::size_t header_fill_ = 0;
    std::string name_;
    std::size_t name_fill_ = 0;
    std::vector<uint8_t> data_;
    std::size_t data_fill_ = 0;
    std::vector<Message> pending_;
};

// Feed `size` bytes to `decoder` and return every message it completed.
std::vector<Message> decode_frames(const uint8_t* bytes, std::size_t size, FrameDecoder& decoder);
