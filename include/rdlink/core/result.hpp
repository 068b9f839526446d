#pragma once
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace rdlink::protocol {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};

inline constexpr Unit unit{};

/// Value-or-failure return type used across the library. Nothing in rdlink
/// throws except Unwrap()/UnwrapErr() on the wrong alternative.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(value_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(value_);
    }

    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(value_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(value_));
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> idx, V&& v) : value_(idx, std::forward<V>(v)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() on a failed Result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() on a successful Result");
        }
    }

    std::variant<T, E> value_;
};

// Early return for Result<Unit, E> steps inside a function returning the same type.
#define RDL_TRY(result_expr) \
    do { \
        auto&& rdl_try_result_ = (result_expr); \
        if (rdl_try_result_.IsErr()) { \
            return std::decay_t<decltype(rdl_try_result_)>::Err( \
                std::move(rdl_try_result_).UnwrapErr()); \
        } \
    } while (0)

}
