#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace lanbeam {

/**
 * @brief Failure classes used across the protocol stack
 *
 * TransportFatal      -> close the direct transport, never retry
 * SessionRecoverable  -> one file failed, the session continues
 * RelayRecoverable    -> relay connection dropped, reconnect loop takes over
 * UserDeclined        -> PIN prompt cancelled or pairing refused, clean stop
 * InvalidArgument     -> caller handed us something unusable
 * Busy                -> another transfer session is already active
 */
enum class ErrorKind {
    TransportFatal,
    SessionRecoverable,
    RelayRecoverable,
    UserDeclined,
    InvalidArgument,
    Busy
};

const char* to_string(ErrorKind kind) noexcept;

struct Error {
    ErrorKind kind = ErrorKind::TransportFatal;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] bool is_fatal() const noexcept { return kind == ErrorKind::TransportFatal; }
    [[nodiscard]] std::string describe() const { return std::string(to_string(kind)) + ": " + message; }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(Error error) { return Result<T>(ErrValue<Error>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

// Re-wrap the error of one result into another result type
template<typename T, typename U>
Result<T> forward_error(const Result<U>& other) {
    return Result<T>(ErrValue<Error>(other.error()));
}

} // namespace lanbeam
