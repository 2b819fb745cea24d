#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace rup {

/**
 * @brief Failure categories shared by every module
 *
 * Transient and Timeout are the only retryable codes. Everything else
 * escalates to the caller on first occurrence.
 */
enum class ErrorCode {
    Transient,       ///< Connection reset, 5xx, throttling
    Timeout,         ///< Request did not finish before its deadline
    Authentication,  ///< 401/403, expired credentials
    Validation,      ///< Protocol or state desync (bad size, unknown id, 4xx)
    NotFound,
    Storage,         ///< Durable store write failed (quota, disk)
    InvalidState,    ///< Illegal session transition requested
    Cancelled,       ///< Aborted by pause/cancel
    Io,              ///< Local file could not be read
    Scan             ///< Directory entry could not be enumerated
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Transient: return "transient";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Authentication: return "authentication";
        case ErrorCode::Validation: return "validation";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Io: return "io";
        case ErrorCode::Scan: return "scan";
    }
    return "unknown";
}

inline bool is_retryable(ErrorCode code) noexcept {
    return code == ErrorCode::Transient || code == ErrorCode::Timeout;
}

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

// Wrappers keep the constructors unambiguous when T == E
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

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace rup
