#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace gossamer::detail {

// Traits for dispatching on the container types that appear in protocol
// messages.

template <class>
struct is_variant_oracle : std::false_type {};

template <class... Ts>
struct is_variant_oracle<std::variant<Ts...>> : std::true_type {};

template <class T>
inline constexpr bool is_variant = is_variant_oracle<T>::value;

template <class>
struct is_optional_oracle : std::false_type {};

template <class T>
struct is_optional_oracle<std::optional<T>> : std::true_type {};

template <class T>
inline constexpr bool is_optional = is_optional_oracle<T>::value;

/// Fixed-size sequences, encoded without a size prefix.
template <class>
struct is_array_oracle : std::false_type {};

template <class T, size_t N>
struct is_array_oracle<std::array<T, N>> : std::true_type {};

template <class T>
inline constexpr bool is_array = is_array_oracle<T>::value;

/// Variable-size sequences, encoded with a size prefix.
template <class>
struct is_list_oracle : std::false_type {};

template <class T, class Allocator>
struct is_list_oracle<std::vector<T, Allocator>> : std::true_type {};

template <class T>
inline constexpr bool is_list = is_list_oracle<T>::value;

} // namespace gossamer::detail
