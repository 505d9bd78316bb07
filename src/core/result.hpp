#pragma once

#include <QMetaType>
#include <QString>

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace lanlink {

/**
 * Failure categories shared by every subsystem.
 */
enum class ErrorKind {
    Unknown,
    NetworkBindFailure,
    PeerUnreachable,
    ConnectionRefused,
    ProtocolParseError,
    CancelledByLocal,
    CancelledByRemote,
    StorageWriteFailure,
    StorageReadFailure,
    Timeout,
    NotConnected,
    InvalidArgument
};

[[nodiscard]] inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unknown: return "unknown";
        case ErrorKind::NetworkBindFailure: return "network_bind_failure";
        case ErrorKind::PeerUnreachable: return "peer_unreachable";
        case ErrorKind::ConnectionRefused: return "connection_refused";
        case ErrorKind::ProtocolParseError: return "protocol_parse_error";
        case ErrorKind::CancelledByLocal: return "cancelled_by_local";
        case ErrorKind::CancelledByRemote: return "cancelled_by_remote";
        case ErrorKind::StorageWriteFailure: return "storage_write_failure";
        case ErrorKind::StorageReadFailure: return "storage_read_failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::NotConnected: return "not_connected";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure category, a message and an optional code
 * (for example a WebSocket close code).
 */
struct Error {
    ErrorKind kind{ErrorKind::Unknown};
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}
    Error(ErrorKind k, const char* msg, int c = 0)
        : kind(k), message(msg), code(c) {}
    Error(ErrorKind k, const QString& msg, int c = 0)
        : kind(k), message(msg.toStdString()), code(c) {}

    [[nodiscard]] QString qmessage() const { return QString::fromStdString(message); }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<quint16> listen(quint16 port) {
 *       if (!server.listen(QHostAddress::Any, port))
 *           return Result<quint16>::err(Error{ErrorKind::NetworkBindFailure, "busy"});
 *       return Result<quint16>::ok(server.serverPort());
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     * Use sparingly - prefer map/and_then for safe access.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    std::variant<T, E> data_;
};

/**
 * Specialization for operations that either succeed with no value or fail.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

} // namespace lanlink

Q_DECLARE_METATYPE(lanlink::Error)
Q_DECLARE_METATYPE(lanlink::ErrorKind)
