#pragma once

#include <string>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct ServerConfig {
    std::string host = LOOPBACK_HOST;
    int port = 0;                   // 0 = ephemeral
    int backlog = DEFAULT_LISTEN_BACKLOG;
    int read_buffer = DEFAULT_READ_BUF_SIZE;  // scratch buffer shared by all connections
};

struct LogConfig {
    std::string file;               // "" = logging disabled
};
