// =============================================================================
// Rampart - Result Type for Unified Error Handling
// =============================================================================
// Result<T, E> carries either a value or an Error{message, code}.
// Used on every boundary where a failure is expected and recoverable
// (bridge commands, config updates, image decoding, state transitions).
//
// Usage:
//   Result<int> parsePort(const std::string& s) {
//       if (s.empty()) return Err<int>("empty port", ErrorCode::InvalidArgument);
//       return Ok(std::stoi(s));
//   }
//
//   auto port = parsePort("5555");
//   if (port) use(port.value());
//   else RLOG_WARN("net", "%s", port.error().message.c_str());
// =============================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace rampart {

// =============================================================================
// Error taxonomy
// =============================================================================

enum class ErrorCode {
    Other = 0,
    BridgeUnavailable,        // adb executable missing
    BridgeTimeout,            // command exceeded its deadline
    DeviceUnreachable,        // connect refused / device not attached
    PerceptionDecodeError,    // screenshot bytes could not be decoded
    ClassifierUnavailable,    // rank model not loaded
    InvalidConfig,            // rejected configuration update
    StateTransitionRejected,  // control command not valid in current state
    CommandFailed,            // bridge command returned non-zero
    InvalidArgument,
    IoError
};

inline const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::Other:                   return "Other";
        case ErrorCode::BridgeUnavailable:       return "BridgeUnavailable";
        case ErrorCode::BridgeTimeout:           return "BridgeTimeout";
        case ErrorCode::DeviceUnreachable:       return "DeviceUnreachable";
        case ErrorCode::PerceptionDecodeError:   return "PerceptionDecodeError";
        case ErrorCode::ClassifierUnavailable:   return "ClassifierUnavailable";
        case ErrorCode::InvalidConfig:           return "InvalidConfig";
        case ErrorCode::StateTransitionRejected: return "StateTransitionRejected";
        case ErrorCode::CommandFailed:           return "CommandFailed";
        case ErrorCode::InvalidArgument:         return "InvalidArgument";
        case ErrorCode::IoError:                 return "IoError";
    }
    return "Unknown";
}

// Error with message and taxonomy code
struct Error {
    std::string message;
    ErrorCode code = ErrorCode::Other;

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Other) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, ErrorCode c = ErrorCode::Other) : message(msg), code(c) {}

    bool operator==(const Error& o) const { return code == o.code && message == o.message; }
    bool is(ErrorCode c) const { return code == c; }
};

// Thrown when value() is read from a failed Result or error() from a good one
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {

template<typename E>
[[noreturn]] void throwHoldsError(const E& e) {
    throw BadResultAccess("value() on failed Result: " + e.message);
}

[[noreturn]] inline void throwHoldsValue() {
    throw BadResultAccess("error() on successful Result");
}

} // namespace detail

// =============================================================================
// Result<T, E>: value or error
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Anything convertible to E (Error, or an Error built inline) is a failure
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { requireValue(); return std::get<0>(data_); }
    const T& value() const& { requireValue(); return std::get<0>(data_); }
    T&& value() && { requireValue(); return std::get<0>(std::move(data_)); }

    E& error() & { requireError(); return std::get<1>(data_); }
    const E& error() const& { requireError(); return std::get<1>(data_); }

    T value_or(T fallback) const& {
        if (is_ok()) return std::get<0>(data_);
        return fallback;
    }
    T value_or(T fallback) && {
        if (is_ok()) return std::get<0>(std::move(data_));
        return fallback;
    }

private:
    void requireValue() const { if (!is_ok()) detail::throwHoldsError(std::get<1>(data_)); }
    void requireError() const { if (is_ok()) detail::throwHoldsValue(); }

    std::variant<T, E> data_;
};

// Status-only variant used by control operations (start/stop/connect...)
template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : error_(E(std::move(error))), failed_(true) {}

    bool is_ok() const { return !failed_; }
    bool is_err() const { return failed_; }
    explicit operator bool() const { return is_ok(); }

    void value() const { if (failed_) detail::throwHoldsError(error_); }

    E& error() & { if (!failed_) detail::throwHoldsValue(); return error_; }
    const E& error() const& { if (!failed_) detail::throwHoldsValue(); return error_; }

private:
    E error_{};
    bool failed_ = false;
};

// =============================================================================
// Constructors
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorCode code = ErrorCode::Other) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, ErrorCode code = ErrorCode::Other) {
    return Result<T, Error>(Error(message, code));
}

// =============================================================================
// Early return
// =============================================================================

// Unwrap result or return its error (GNU statement expression)
// Usage: auto value = RAMPART_TRY(some_function());
#define RAMPART_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace rampart
