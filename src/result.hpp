// =============================================================================
// PhoneBridge - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every failure that can reach the wire carries an ErrorKind so the listener
// and the forwarder can report it without knowing where it came from.
//
// Usage:
//   Result<int> parse_count(const json& v) {
//       if (!v.is_number_integer()) return Err<int>(validation_error("count must be an integer"));
//       return Ok(v.get<int>());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace phonebridge {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Framing,     // malformed request line
    Validation,  // well-formed request, bad parameter
    Tool,        // external automation tool failed / timed out / bad output
    Transport,   // forwarder could not reach the remote endpoint
    Internal     // anything unanticipated
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Framing:    return "framing";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Tool:       return "tool";
        case ErrorKind::Transport:  return "transport";
        case ErrorKind::Internal:   return "internal";
    }
    return "unknown";
}

struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::Internal;

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Internal)
        : message(std::move(msg)), kind(k) {}
    explicit Error(const char* msg, ErrorKind k = ErrorKind::Internal)
        : message(msg), kind(k) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message;
    }
};

inline Error framing_error(std::string msg)    { return Error(std::move(msg), ErrorKind::Framing); }
inline Error validation_error(std::string msg) { return Error(std::move(msg), ErrorKind::Validation); }
inline Error tool_error(std::string msg)       { return Error(std::move(msg), ErrorKind::Tool); }
inline Error transport_error(std::string msg)  { return Error(std::move(msg), ErrorKind::Transport); }
inline Error internal_error(std::string msg)   { return Error(std::move(msg), ErrorKind::Internal); }

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Result<T, Error>(Error(std::move(message), kind));
}

template<typename T>
Result<T, Error> Err(const char* message, ErrorKind kind = ErrorKind::Internal) {
    return Result<T, Error>(Error(message, kind));
}

} // namespace phonebridge
