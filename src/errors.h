#pragma once
#include <stdexcept>
#include <string>

namespace mbk {

// Fatal errors. Corruption findings are not errors, they become markers.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad input detected before any I/O (unresolved range, zero bundle size, bad store URL).
class PreconditionError : public Error {
public:
    explicit PreconditionError(const std::string& msg) : Error(msg) {}
};

// Listing, open or write failure of an object store.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& msg) : Error(msg) {}
};

// A bundle listing yielded a base number below the expected one.
class OrderingError : public Error {
public:
    explicit OrderingError(const std::string& msg) : Error(msg) {}
};

// Bytes that do not decode as a bundle, block, cursor or stream response.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& msg) : Error(msg) {}
};

// A streamed block whose parent is not the previously accepted block. Never retried.
class ContinuityError : public Error {
public:
    explicit ContinuityError(const std::string& msg) : Error(msg) {}
};

// Stream could not be opened or configured.
class StreamError : public Error {
public:
    explicit StreamError(const std::string& msg) : Error(msg) {}
};

class CancelledError : public Error {
public:
    CancelledError() : Error("operation cancelled") {}
};

} // namespace mbk
