#pragma once
// Error taxonomy
//
// Library code throws the typed exceptions below. The host hook boundary
// (hooks.hpp) converts them into Status / Result values and never throws.

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace mm {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed transcript line; carries the 1-indexed line when known
class ParseError : public Error {
public:
    ParseError(const std::string& what, int line = 0)
        : Error(line > 0 ? "line " + std::to_string(line) + ": " + what : what),
          line_(line) {}

    int line() const { return line_; }

private:
    int line_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& what) : Error(what) {}
};

// Embedding or LLM backend failed (transport, timeout, bad output)
class ProviderError : public Error {
public:
    explicit ProviderError(const std::string& what) : Error(what) {}
};

// Worker wire-protocol violation
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& what) : Error(what) {}
};

// Storage-level failure (SQLite)
class StorageError : public Error {
public:
    explicit StorageError(const std::string& what) : Error(what) {}
};

// Outcome of an operation with no payload
class Status {
public:
    static Status ok() { return Status(); }
    static Status failure(std::string message) {
        Status s;
        s.error_ = std::move(message);
        return s;
    }

    bool is_ok() const { return !error_.has_value(); }
    explicit operator bool() const { return is_ok(); }
    const std::string& error() const {
        static const std::string none;
        return error_ ? *error_ : none;
    }

private:
    std::optional<std::string> error_;
};

// Value or error message
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    static Result failure(std::string message) {
        Result r;
        r.error_ = std::move(message);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    T& value() {
        if (!value_) throw Error("Result has no value: " + error_);
        return *value_;
    }
    const T& value() const {
        if (!value_) throw Error("Result has no value: " + error_);
        return *value_;
    }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const std::string& error() const { return error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::string error_;
};

} // namespace mm
