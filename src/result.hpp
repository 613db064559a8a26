// =============================================================================
// SnapADB - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every ADB operation reports failure through Result<T, AdbError>; the error
// kind tells callers whether to ask the user for the adb binary, retry, or
// report a protocol problem.
//
// Usage:
//   Result<std::string, AdbError> out = client.shell(serial, "getprop");
//   if (out.is_ok()) {
//       use(out.value());
//   } else if (out.error().kind == AdbError::Kind::AdbNotFound) {
//       askForAdbLocation();
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace snapadb {

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// ADB client error. `code` holds the exit status for NonZeroExit.
struct AdbError : Error {
    enum class Kind {
        AdbNotFound,        // adb binary missing: ask the user, never retried
        ServerUnavailable,  // OS-level socket failure: retried with a restart
        ProtocolFailure,    // framing / handshake violation: not retried
        ParseFailure,       // output could not be decoded
        NonZeroExit,        // a process exited with an unexpected status
        LocalIo,            // local file could not be written
        Cancelled           // caller cancelled the operation
    };
    Kind kind = Kind::ProtocolFailure;
    std::string stderr_text;

    AdbError() = default;
    AdbError(Kind k, std::string msg, int c = 0)
        : Error(std::move(msg), c), kind(k) {}

    static AdbError adbNotFound(std::string msg = "adb binary not found") {
        return AdbError(Kind::AdbNotFound, std::move(msg));
    }
    static AdbError serverUnavailable(std::string msg) {
        return AdbError(Kind::ServerUnavailable, std::move(msg));
    }
    static AdbError protocolFailure(std::string msg) {
        return AdbError(Kind::ProtocolFailure, std::move(msg));
    }
    static AdbError parseFailure(std::string msg) {
        return AdbError(Kind::ParseFailure, std::move(msg));
    }
    static AdbError nonZeroExit(int status, std::string stderr_out = {}) {
        AdbError e(Kind::NonZeroExit, "process exited with status " + std::to_string(status), status);
        e.stderr_text = std::move(stderr_out);
        return e;
    }
    static AdbError localIo(std::string msg) {
        return AdbError(Kind::LocalIo, std::move(msg));
    }
    static AdbError cancelled() {
        return AdbError(Kind::Cancelled, "operation cancelled");
    }

    bool isRetryable() const { return kind == Kind::ServerUnavailable; }
    bool is(Kind k) const { return kind == k; }
};

inline const char* kindName(AdbError::Kind k) {
    switch (k) {
        case AdbError::Kind::AdbNotFound:       return "AdbNotFound";
        case AdbError::Kind::ServerUnavailable: return "ServerUnavailable";
        case AdbError::Kind::ProtocolFailure:   return "ProtocolFailure";
        case AdbError::Kind::ParseFailure:      return "ParseFailure";
        case AdbError::Kind::NonZeroExit:       return "NonZeroExit";
        case AdbError::Kind::LocalIo:           return "LocalIo";
        case AdbError::Kind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

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

    // Check status
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

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    // Success constructor
    Result() : data_(std::monostate{}) {}

    // Error constructor
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

private:
    std::variant<std::monostate, E> data_;
};

// Shorthand used throughout the ADB layer
template<typename T>
using AdbResult = Result<T, AdbError>;

// =============================================================================
// Macros for Early Return
// =============================================================================

// TRY macro: unwrap result or return error
// Usage: auto value = SNAPADB_TRY(some_function());
#define SNAPADB_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

// Same for Result<void, E>
#define SNAPADB_TRY_VOID(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
    } while (0)

} // namespace snapadb
