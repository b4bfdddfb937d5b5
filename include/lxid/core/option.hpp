#pragma once
#include <optional>
#include <utility>
namespace lxid {

/// Optional value. Used for things that may legitimately be absent:
/// a companion text file, a reference address, an attempt limit.
template<typename T>
using Option = std::optional<T>;

template<typename T>
[[nodiscard]] constexpr Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

template<typename T>
[[nodiscard]] constexpr Option<T> None() noexcept {
    return std::nullopt;
}
}
