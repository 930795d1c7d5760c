#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace directup {

/**
 * @brief Error categories shared by the client pipeline and the upload authority
 *
 * The first group mirrors the pipeline's failure taxonomy; the second covers
 * plumbing (files, JSON, lookups).
 */
enum class ErrorKind {
    Validation,         ///< Oversized or unsupported file, never queued
    Credential,         ///< Broker refused or failed to issue write credentials
    Transfer,           ///< Transient storage write failure
    CredentialExpired,  ///< Storage rejected a stale write credential
    Cancelled,          ///< Batch cancellation signal observed
    Confirmation,       ///< Confirmation call failed or returned inconsistent counts
    Security,           ///< Server rejected a claimed-successful upload
    Io,
    Parse,
    NotFound,
    Internal
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Credential: return "credential";
        case ErrorKind::Transfer: return "transfer";
        case ErrorKind::CredentialExpired: return "credential_expired";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Confirmation: return "confirmation";
        case ErrorKind::Security: return "security";
        case ErrorKind::Io: return "io";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
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

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

/// Shorthand for the common `Err<T>(Error{kind, message})` spelling.
template<typename T>
Result<T> Fail(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace directup
