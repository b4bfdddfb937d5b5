#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
namespace lxid {

/// Value type of operations that succeed without producing anything.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/**
 * @brief Either a value or a typed failure
 *
 * Every fallible lxid operation returns one of these instead of throwing.
 * Unwrap()/UnwrapErr() on the wrong alternative throws std::runtime_error;
 * that is a programming error, callers check IsOk()/IsErr() first.
 *
 * @code
 * auto derived = AddressDeriver::Derive(bytes);
 * if (derived.IsErr()) {
 *     return Result<Report, IdentityFailure>::Err(std::move(derived).UnwrapErr());
 * }
 * @endcode
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kValue>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<kError>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kError; }

    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<kError>(storage_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kValue>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kValue>(storage_);
    }
    /// Moves the value out; the returned object does not alias this Result.
    [[nodiscard]] T Unwrap() && {
        RequireOk();
        return std::get<kValue>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kError>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kError>(storage_);
    }
    [[nodiscard]] E UnwrapErr() && {
        RequireErr();
        return std::get<kError>(std::move(storage_));
    }

    /// Converts the failure type, e.g. a SodiumFailure into an IdentityFailure.
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kValue>(std::move(storage_)));
        }
        return Mapped::Err(std::invoke(std::forward<F>(func), std::get<kError>(std::move(storage_))));
    }

    /// Runs the next step only on success. The step must fail with the same E.
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind step must fail with the same error type");
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(storage_)));
        }
        return std::invoke(std::forward<F>(func), std::get<kValue>(std::move(storage_)));
    }

    /// Drops the failure, keeping only whether a value was produced.
    [[nodiscard]] std::optional<T> ToOption() && {
        if (IsErr()) {
            return std::nullopt;
        }
        return std::get<kValue>(std::move(storage_));
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::runtime_error("Result::Unwrap on a failed result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::runtime_error("Result::UnwrapErr on a successful result");
        }
    }

    std::variant<T, E> storage_;
};
}
