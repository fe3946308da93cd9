/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "contracts/format.hpp"

// Checks of conditions that only the calling library itself is responsible for. A failure
// means a bug in that library, never bad input from its caller.
// Failures throw an internal error type that can't be named outside of this module. It isn't
// meant to be caught; let it reach a top-level handler, which can recognize it with
// is_internal_error().
namespace bulwark::assume {

// Check whether an exception was thrown by a failed assumption.
[[nodiscard]] auto is_internal_error(exception const&) noexcept -> bool;

// Always throws the internal error. An absent message is replaced with the default one.
[[noreturn]] void fail(OptionalText message = nullopt);

// Always throws the internal error, with another exception attached as its nested cause.
[[noreturn]] void fail(OptionalText message, exception_ptr cause);

// Always throws the internal error with a formatted message.
template<typename Arg, typename... Args>
[[noreturn]] void fail(OptionalText tmpl, Arg const& arg, Args const&... args)
{
	auto const text = format_message(tmpl, arg, args...);
	fail(OptionalText{text});
}

// Mark code that can't be reached. Always throws the internal error.
[[noreturn]] void not_reachable();

// Throws the internal error if the condition is false.
inline void is_true(bool condition, OptionalText message = nullopt)
{
	if (!condition) fail(message);
}

template<typename Arg, typename... Args>
void is_true(bool condition, OptionalText tmpl, Arg const& arg, Args const&... args)
{
	if (!condition) fail(tmpl, arg, args...);
}

// Throws the internal error if the condition is true.
inline void is_false(bool condition, OptionalText message = nullopt)
{
	if (condition) fail(message);
}

template<typename Arg, typename... Args>
void is_false(bool condition, OptionalText tmpl, Arg const& arg, Args const&... args)
{
	if (condition) fail(tmpl, arg, args...);
}

// Throws the internal error if the value is absent. Returns the value unchanged.
template<typename T>
requires maybe_absent<remove_cvref_t<T>>
auto not_null(T&& value) -> T&&
{
	if (is_absent(value)) fail();
	return forward<T>(value);
}

// Throws the internal error if the value is present.
template<maybe_absent T>
void null(T const& value)
{
	if (!is_absent(value)) fail();
}

// Throws the internal error if the text is null or empty.
inline auto not_null_or_empty(char const* value) -> char const*
{
	if (!value || value[0] == '\0') fail();
	return value;
}

inline auto not_null_or_empty(string_view value) -> string_view
{
	if (is_empty_text(value)) fail();
	return value;
}

// Throws the internal error if the range has no elements.
template<std::ranges::input_range R>
requires (!std::is_convertible_v<remove_cvref_t<R> const&, string_view>)
auto not_null_or_empty(R&& values) -> R&&
{
	if (std::ranges::begin(values) == std::ranges::end(values)) fail();
	return forward<R>(values);
}

// Throws the internal error if the optional is empty. Returns the contained value.
template<typename T>
auto present(optional<T>& value) -> T&
{
	if (!value) fail();
	return *value;
}

template<typename T>
auto present(optional<T> const& value) -> T const&
{
	if (!value) fail();
	return *value;
}

// Route failures of ASSERT(), ASSUME() and PANIC() to the internal error.
void install_assert_handler();

}
