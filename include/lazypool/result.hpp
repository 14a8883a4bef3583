#pragma once

#include <string>
#include <utility>
#include <variant>

namespace lazypool {

/**
 * @brief Ok tag - wraps a successful value
 */
template <typename T> struct Ok {
    T value;

    explicit Ok(T v) : value(std::move(v)) {}
};

/**
 * @brief Err tag - wraps an error value
 */
template <typename E> struct Err {
    E value;

    explicit Err(E v) : value(std::move(v)) {}
};

/**
 * @brief Result<T, E> - outcome of a pool operation that can fail
 *
 * Pool construction (make_pool, PoolFactory::create) and cancellable
 * checkout (checkout(stop_token), with_item(stop_token, f)) report failure
 * through this type. T may be move-only (BorrowedItem is); take it out with
 * std::move(result).value(). map/and_then/match chain pool creation into
 * use without unpacking the shared_ptr by hand.
 *
 * Usage:
 *   make_pool<Parser>(build_parser, 4).match(
 *       [](auto p) { run(*p); },
 *       [](const std::string& e) { report(e); }
 *   );
 */
template <typename T, typename E = std::string> class Result {
  public:
    static auto ok(T value) -> Result { return Result{Ok<T>{std::move(value)}}; }
    static auto err(E error) -> Result { return Result{Err<E>{std::move(error)}}; }

    Result(Ok<T> ok) : data_(std::move(ok)) {}
    Result(Err<E> err) : data_(std::move(err)) {}

    [[nodiscard]] auto is_ok() const -> bool { return std::holds_alternative<Ok<T>>(data_); }
    [[nodiscard]] auto is_err() const -> bool { return !is_ok(); }

    [[nodiscard]] auto value() & -> T& { return std::get<Ok<T>>(data_).value; }
    [[nodiscard]] auto value() const& -> const T& { return std::get<Ok<T>>(data_).value; }
    [[nodiscard]] auto value() && -> T { return std::move(std::get<Ok<T>>(data_).value); }

    [[nodiscard]] auto error() const& -> const E& { return std::get<Err<E>>(data_).value; }
    [[nodiscard]] auto error() && -> E { return std::move(std::get<Err<E>>(data_).value); }

    /**
     * @brief Transform the value if Ok, propagate the error if Err
     */
    template <typename F> auto map(F&& f) && -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) {
            return Result<U, E>::ok(f(std::move(*this).value()));
        }
        return Result<U, E>::err(std::move(*this).error());
    }

    /**
     * @brief Chain an operation that itself returns a Result
     */
    template <typename F> auto and_then(F&& f) && -> decltype(f(std::declval<T>())) {
        using R = decltype(f(std::declval<T>()));
        if (is_ok()) {
            return f(std::move(*this).value());
        }
        return R::err(std::move(*this).error());
    }

    [[nodiscard]] auto value_or(T fallback) && -> T {
        if (is_ok()) {
            return std::move(*this).value();
        }
        return fallback;
    }

    template <typename OnOk, typename OnErr>
    auto match(OnOk&& on_ok, OnErr&& on_err) && -> decltype(on_ok(std::declval<T>())) {
        if (is_ok()) {
            return on_ok(std::move(*this).value());
        }
        return on_err(std::move(*this).error());
    }

  private:
    std::variant<Ok<T>, Err<E>> data_;
};

} // namespace lazypool
