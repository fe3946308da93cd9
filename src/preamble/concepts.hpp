/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <type_traits>
#include <string_view>
#include <concepts>
#include "preamble/utility.hpp"

namespace bulwark {

using std::same_as;
using std::convertible_to;

template<class T, class Variant>
inline constexpr auto is_variant_alternative_v = false;

template<class T, class... Ts>
inline constexpr auto is_variant_alternative_v<T, variant<Ts...>> =
	(... || std::is_same_v<T, Ts>);

// Constrain type T to one of a std::variant's available alternatives
template<class T, class Variant>
concept variant_alternative = is_variant_alternative_v<T, Variant>;

template<typename T>
inline constexpr auto is_optional_v = false;

template<typename T>
inline constexpr auto is_optional_v<optional<T>> = true;

// Any std::optional specialization
template<typename T>
concept optional_like = is_optional_v<remove_cvref_t<T>>;

// A type with a "no value" state that can be tested against nullptr:
// raw and smart pointers, std::function, and similar handles.
// Strings compare against nullptr through their char const* overload, and optionals compare
// their contained value, so both are excluded.
template<typename T>
concept nullable = std::is_pointer_v<T> || std::is_null_pointer_v<T> ||
	(!optional_like<T> && !std::is_convertible_v<T const&, std::string_view> && requires(T const& v) {
		{ v == nullptr } -> convertible_to<bool>;
	});

// A type whose absence is tested either against nullptr or through std::optional.
template<typename T>
concept maybe_absent = nullable<T> || optional_like<T>;

// Test whether a nullable or optional value holds nothing.
template<maybe_absent T>
[[nodiscard]] constexpr auto is_absent(T const& v) -> bool
{
	if constexpr (optional_like<T>)
		return !v.has_value();
	else
		return v == nullptr;
}

}
