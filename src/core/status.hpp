#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace crossbook {

/// Value-or-error return type used across parsers, config and the ledger
/// Index 0 holds the value, index 1 the error, so T and E may be the same type
template <typename T, typename E = std::string>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T& value() & {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] E error() && {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Transform the error if Err, preserve value if Ok
    template <typename F>
    [[nodiscard]] auto map_error(F&& func) && -> Result<T, std::invoke_result_t<F, E&&>> {
        using NewE = std::invoke_result_t<F, E&&>;
        if (is_err()) {
            return Result<T, NewE>::Err(func(std::get<1>(std::move(data_))));
        }
        return Result<T, NewE>::Ok(std::get<0>(std::move(data_)));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace crossbook
