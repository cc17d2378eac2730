#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace booksum {

/**
 * What went wrong. Only MalformedPath is recoverable (the entry is skipped);
 * every other kind stops the run before anything is written.
 */
enum class ErrorKind {
    MalformedPath,
    UnknownFormat,
    Config,
    Io,
    Usage
};

[[nodiscard]] constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedPath: return "malformed path";
        case ErrorKind::UnknownFormat: return "unknown format";
        case ErrorKind::Config: return "config error";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::Usage: return "usage error";
    }
    return "error";
}

struct Error {
    ErrorKind kind{ErrorKind::Usage};
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool operator==(const Error& other) const = default;
};

/**
 * Result<T> - either a value (ok) or an Error (err).
 *
 * Usage:
 *   Result<Format> f = parse_format("git");
 *   if (f.is_err()) { report(f.unwrap_err()); }
 */
template<typename T>
class Result {
public:
    using value_type = T;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Get the value, throwing std::runtime_error if this holds an error.
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

    [[nodiscard]] const Error& unwrap_err() const {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        }
    }

    std::variant<T, Error> data_;
};

/**
 * Result<void> - success without a value, or an Error.
 */
template<>
class Result<void> {
public:
    using value_type = void;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(Error error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return !failed_; }
    [[nodiscard]] bool is_err() const noexcept { return failed_; }

    void unwrap() const {
        if (failed_) {
            throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
        }
    }

    [[nodiscard]] const Error& unwrap_err() const {
        if (!failed_) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : failed_(true), error_(std::move(error)) {}

    bool failed_{false};
    Error error_{};
};

} // namespace booksum
