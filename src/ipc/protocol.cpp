#include "protocol.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <fmt/format.h>

static void put_u16(std::vector<uint8_t>& out, std::size_t value) {
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>(value & 0xff));
}

std::vector<uint8_t> encode_frame(const Message& message) {
    if (message.name.size() > MAX_FRAME_FIELD_BYTES) {
        throw std::length_error(fmt::format(
            "Message name is {} bytes, limit is {}", message.name.size(), MAX_FRAME_FIELD_BYTES));
    }
    if (message.data.size() > MAX_FRAME_FIELD_BYTES) {
        throw std::length_error(fmt::format(
            "Message payload is {} bytes, limit is {}", message.data.size(), MAX_FRAME_FIELD_BYTES));
    }

    std::vector<uint8_t> out;
    out.reserve(FRAME_HEADER_SIZE + message.name.size() + message.data.size());
    put_u16(out, message.name.size());
    put_u16(out, message.data.size());
    out.insert(out.end(), message.name.begin(), message.name.end());
    out.insert(out.end(), message.data.begin(), message.data.end());
    return out;
}

void FrameDecoder::feed(const uint8_t* bytes, std::size_t size) {
    std::size_t pos = 0;

    // Loop also runs once with nothing left so that empty names/payloads
    // complete as soon as their header is in.
    while (true) {
        if (stage_ == Stage::Header) {
            if (pos == size) return;
            std::size_t n = std::min(FRAME_HEADER_SIZE - header_fill_, size - pos);
            std::memcpy(header_.data() + header_fill_, bytes + pos, n);
            header_fill_ += n;
            pos += n;
            if (header_fill_ < FRAME_HEADER_SIZE) return;
            start_body();
        }

        if (stage_ == Stage::Name) {
            std::size_t n = std::min(name_.size() - name_fill_, size - pos);
            if (n > 0) {
                std::memcpy(&name_[name_fill_], bytes + pos, n);
            }
            name_fill_ += n;
            pos += n;
            if (name_fill_ < name_.size()) return;
            stage_ = Stage::Data;
        }

        if (stage_ == Stage::Data) {
            std::size_t n = std::min(data_.size() - data_fill_, size - pos);
            if (n > 0) {
                std::memcpy(data_.data() + data_fill_, bytes + pos, n);
            }
            data_fill_ += n;
            pos += n;
            if (data_fill_ < data_.size()) return;
            finish_frame();
        }
    }
}

void FrameDecoder::start_body() {
    std::size_t name_len = (static_cast<std::size_t>(header_[0]) << 8) | header_[1];
    std::size_t data_len = (static_cast<std::size_t>(header_[2]) << 8) | header_[3];

    name_.assign(name_len, '\0');
    name_fill_ = 0;
    data_.assign(data_len, 0);
    data_fill_ = 0;
    header_fill_ = 0;
    stage_ = Stage::Name;
}

void FrameDecoder::finish_frame() {
    pending_.emplace_back(std::move(name_), std::move(data_));
    name_.clear();
    name_fill_ = 0;
    data_.clear();
    data_fill_ = 0;
    stage_ = Stage::Header;
}

std::vector<Message> FrameDecoder::take() {
    std::vector<Message> out;
    out.swap(pending_);
    return out;
}

std::vector<Message> decode_frames(const uint8_t* bytes, std::size_t size, FrameDecoder& decoder) {
    decoder.feed(bytes, size);
    return decoder.take();
}
