#pragma once

#include <stdexcept>
#include <string>

// Raised when a file or socket operation fails at the OS level.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when an operation is called in a state that cannot serve it
// (server not open, port not published yet, ...). Callers may retry later.
class IllegalStateError : public std::logic_error {
public:
    explicit IllegalStateError(const std::string& what) : std::logic_error(what) {}
};

// Build an IoError from the current errno: "<context>: <strerror(errno)>".
IoError io_error_from_errno(const std::string& context);
