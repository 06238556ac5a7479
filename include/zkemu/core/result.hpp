#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace zkemu {

/**
 * Failure categories surfaced by the protocol engine.
 */
enum class ErrorCode {
    Checksum,          // frame dropped, checksum mismatch
    MalformedFrame,    // truncated or inconsistent frame
    MalformedRecord,   // record slot narrower than its layout
    Timeout,           // no matching reply in time
    Authentication,    // device refused the commkey
    ConnectionLost,    // transport closed or peer silent
    Transfer,          // chunked transfer aborted
    NotConnected,      // operation needs a live session
    DeviceError,       // device answered with an error code
    Io                 // socket level failure
};

const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    std::string describe() const {
        return std::string(errorCodeName(code)) + ": " + message;
    }
};

inline Error makeError(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

/**
 * Value or Error.
 */
template<typename T>
class Result {
public:
    Result(T value) : m_value(std::move(value)) {}
    Result(Error error) : m_value(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(m_value); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(m_value); }
    const T& value() const { return std::get<T>(m_value); }
    T&& take() { return std::get<T>(std::move(m_value)); }

    const Error& error() const { return std::get<Error>(m_value); }
    ErrorCode code() const { return error().code; }

private:
    std::variant<T, Error> m_value;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : m_error(std::move(error)) {}

    static Result success() { return Result(); }

    bool ok() const { return !m_error.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *m_error; }
    ErrorCode code() const { return m_error->code; }

private:
    std::optional<Error> m_error;
};

using Status = Result<void>;

} // namespace zkemu
