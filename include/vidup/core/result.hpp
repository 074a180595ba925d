#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace vidup {

// Wrappers keep Ok and Err distinguishable when T and E are the same type
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

/**
 * @brief Value-or-error return type used across the project
 *
 * Two error types are in use:
 * - std::string for transport, storage and configuration code
 * - upload::UploadError once a failure is attributed to an upload phase
 *
 * map_error() is the bridge between the two.
 *
 * EXAMPLE:
 * @code
 * Result<int> parse(const std::string& text);
 *
 * auto port = parse("8080");
 * if (port.is_error()) {
 *     spdlog::error("{}", port.error());
 * }
 * @endcode
 */
template<typename T, typename E = std::string>
class Result {
public:
    // Ok(v) converts into any Result whose value type is T
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    /// Move the value out; the Result is left holding a moved-from T
    T take_value() { return std::move(std::get<0>(data_)); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    /**
     * @brief Convert the error type, keeping a success value as is
     *
     * @param fn Called with the current error when is_error()
     */
    template<typename F>
    auto map_error(F&& fn) && -> Result<T, std::decay_t<decltype(fn(std::declval<const E&>()))>> {
        using Mapped = std::decay_t<decltype(fn(std::declval<const E&>()))>;
        if (is_ok()) {
            return Result<T, Mapped>(OkValue<T>(take_value()));
        }
        return Result<T, Mapped>(ErrValue<Mapped>(fn(error())));
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

    template<typename F>
    auto map_error(F&& fn) const -> Result<void, std::decay_t<decltype(fn(std::declval<const E&>()))>> {
        using Mapped = std::decay_t<decltype(fn(std::declval<const E&>()))>;
        if (is_ok()) {
            return Result<void, Mapped>();
        }
        return Result<void, Mapped>(ErrValue<Mapped>(fn(*error_)));
    }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<T> Ok(T value) { return OkValue<T>(std::move(value)); }

template<typename E = std::string>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

} // namespace vidup
