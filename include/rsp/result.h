#ifndef RSP_RESULT_H
#define RSP_RESULT_H

#include <rsp/config.h>
#include <rsp/error.h>
#include <variant>
#include <functional>
#include <type_traits>

namespace rsp {

template<typename T>
class Result;

/**
 * Result type for operations that can fail.
 *
 * Holds either a success value of type T or an RSPError. Protocol
 * operations return Result instead of throwing so that verification
 * failures always reach the caller as a distinct error kind.
 *
 * @tparam T The type of the success value
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}

    Result(RSPError error) : data_(error) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const noexcept {
        return std::holds_alternative<RSPError>(data_);
    }

    // Value access (throws if error)
    const T& value() const & {
        if (is_error()) {
            throw RSPException(std::get<RSPError>(data_));
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (is_error()) {
            throw RSPException(std::get<RSPError>(data_));
        }
        return std::get<T>(data_);
    }

    T value() && {
        if (is_error()) {
            throw RSPException(std::get<RSPError>(data_));
        }
        return std::move(std::get<T>(data_));
    }

    template<typename U>
    T value_or(U&& default_value) const & {
        if (is_success()) {
            return std::get<T>(data_);
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    RSPError error() const {
        if (is_success()) {
            return RSPError::SUCCESS;
        }
        return std::get<RSPError>(data_);
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    const T& operator*() const & {
        return value();
    }

    T& operator*() & {
        return value();
    }

    const T* operator->() const {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    T* operator->() {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    // Monadic operations
    template<typename F>
    auto map(F&& func) const & -> Result<decltype(func(value()))> {
        using ReturnType = decltype(func(value()));
        if (is_error()) {
            return Result<ReturnType>(error());
        }
        return Result<ReturnType>(func(value()));
    }

    template<typename F>
    auto and_then(F&& func) const & -> decltype(func(value())) {
        if (is_error()) {
            using ReturnType = decltype(func(value()));
            return ReturnType(error());
        }
        return func(value());
    }

    template<typename F>
    auto and_then(F&& func) && -> decltype(func(std::move(*this).value())) {
        if (is_error()) {
            using ReturnType = decltype(func(std::move(*this).value()));
            return ReturnType(error());
        }
        return func(std::move(*this).value());
    }

    template<typename F>
    Result<T> map_error(F&& func) const & {
        if (is_success()) {
            return *this;
        }
        return Result<T>(func(error()));
    }

private:
    std::variant<T, RSPError> data_;
};

// Specialization for void type
template<>
class Result<void> {
public:
    Result() : error_(RSPError::SUCCESS) {}
    Result(RSPError error) : error_(error) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return error_ == RSPError::SUCCESS;
    }

    bool is_error() const noexcept {
        return error_ != RSPError::SUCCESS;
    }

    RSPError error() const noexcept {
        return error_;
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    template<typename F>
    auto and_then(F&& func) const -> decltype(func()) {
        if (is_error()) {
            using ReturnType = decltype(func());
            return ReturnType(error_);
        }
        return func();
    }

    template<typename F>
    Result<void> map_error(F&& func) const {
        if (is_success()) {
            return *this;
        }
        return Result<void>(func(error_));
    }

private:
    RSPError error_;
};

// Helper functions for creating Results
template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(RSPError error) {
    return Result<T>(error);
}

} // namespace rsp

#endif // RSP_RESULT_H
