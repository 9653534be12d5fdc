#pragma once

#include <any>
#include <map>
#include <string>
#include <utility>

namespace evidhash {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotFound,
    PermissionDenied,
    IoError,
    Cancelled,
    DetectionFailed,
    InternalError
};

/// Short, user-facing text for an error category
const char* toUserMessage(ErrorCode code);

/// Stable identifier ("not_found", "cancelled", ...) used in logs
const char* toString(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;      // Technical detail for logs
    std::string userMessage;  // Empty means toUserMessage(code)
    std::string path;         // File the error relates to, if any

    std::string displayMessage() const {
        return userMessage.empty() ? std::string(toUserMessage(code)) : userMessage;
    }
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

/**
 * @brief Expected<T> plus an open metadata map
 *
 * Lets an operation attach secondary outputs (metrics, partial results)
 * to both the success and the error path without widening T.
 *
 * Usage:
 *   Result<int> r = Result<int>::ok(42);
 *   r.setMetadata("metrics", metrics);
 *   if (auto* m = r.metadataAs<HashOperationMetrics>("metrics")) { ... }
 */
template <typename T>
class Result {
public:
    using Metadata = std::map<std::string, std::any>;

    static Result ok(T value) { return Result(Expected<T>(std::move(value))); }
    static Result fail(Error err) { return Result(Expected<T>(std::move(err))); }

    bool has_value() const { return inner.has_value(); }
    explicit operator bool() const { return inner.has_value(); }
    const T& value() const { return inner.value(); }
    T& value() { return inner.value(); }
    const Error& error() const { return inner.error(); }

    void setMetadata(const std::string& key, std::any value) { meta[key] = std::move(value); }
    bool hasMetadata(const std::string& key) const { return meta.count(key) != 0; }
    const Metadata& metadata() const { return meta; }

    /// Typed lookup; nullptr when the key is absent or holds another type
    template <typename U>
    const U* metadataAs(const std::string& key) const {
        auto it = meta.find(key);
        if (it == meta.end()) return nullptr;
        return std::any_cast<U>(&it->second);
    }

private:
    explicit Result(Expected<T> e) : inner(std::move(e)) {}
    Expected<T> inner;
    Metadata meta;
};

}
