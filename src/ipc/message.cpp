#include "message.hpp"
#include <fmt/format.h>

std::string Message::to_string() const {
    std::string bytes;
    for (std::size_t i = 0; i < data.size(); ++i) {
        if (i > 0) bytes += ", ";
        bytes += std::to_string(static_cast<int>(data[i]));
    }
    return fmt::format("Message({}: [{}])", name, bytes);
}
