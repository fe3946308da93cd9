/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <future>
#include <boost/uuid/uuid.hpp>
#include "preamble.hpp"
#include "contracts/messages.hpp"
#include "contracts/errors.hpp"
#include "contracts/format.hpp"

// Checks of caller-supplied arguments. Each check either returns its input unchanged,
// or throws an ArgumentError subclass that names the parameter:
//     auto& widget = require::not_null(widget_ptr, "widget_ptr");
// Checks stop at the first failed condition, so the most specific error kind is reported.
namespace bulwark::require {

// Text that is never null itself: std::string, std::string_view and similar.
template<typename T>
concept text_like = std::is_convertible_v<T const&, string_view> &&
	!std::is_array_v<T> && !std::is_pointer_v<T> && !optional_like<T>;

// A range that's not text. Character arrays count as text.
template<typename R>
concept sequence = std::ranges::input_range<R> &&
	!std::is_convertible_v<remove_cvref_t<R> const&, string_view>;

// A range that's not text, and whose elements can be absent.
template<typename R>
concept sequence_of_nullables = sequence<R> && maybe_absent<std::ranges::range_value_t<R>>;

namespace detail {

[[noreturn]] void raise_null(ParamName);
[[noreturn]] void raise_empty_string(ParamName);
[[noreturn]] void raise_whitespace(ParamName);
[[noreturn]] void raise_empty_sequence(ParamName);
[[noreturn]] void raise_null_element(ParamName);
[[noreturn]] void raise_empty_identifier(ParamName);
[[noreturn]] void raise_invalid(ParamName, string_view message, exception_ptr cause = nullptr);

template<typename R>
void check_has_elements(R&& values, ParamName name)
{
	if (std::ranges::begin(values) == std::ranges::end(values))
		raise_empty_sequence(name);
}

template<typename R>
void check_no_null_elements(R&& values, ParamName name)
{
	for (auto&& value: values) {
		if (is_absent(value))
			raise_null_element(name);
	}
}

template<typename R>
void check_has_no_null_elements(R&& values, ParamName name)
{
	auto has_elements = false;
	for (auto&& value: values) {
		has_elements = true;
		if (is_absent(value))
			raise_null_element(name);
	}
	if (!has_elements)
		raise_empty_sequence(name);
}

}

// Throws NullArgumentError if the value is null. Accepts raw pointers (including opaque
// void* handles), smart pointers, std::function, and anything else comparable with nullptr.
template<typename T>
requires nullable<remove_cvref_t<T>>
auto not_null(T&& value, ParamName name) -> T&&
{
	if (value == nullptr)
		detail::raise_null(name);
	return forward<T>(value);
}

// Throws NullArgumentError if the future has no shared state.
template<typename T>
void not_null(std::future<T> const& value, ParamName name)
{
	if (!value.valid())
		detail::raise_null(name);
}

// Throws NullArgumentError if the future has no shared state.
template<typename T>
void not_null(std::shared_future<T> const& value, ParamName name)
{
	if (!value.valid())
		detail::raise_null(name);
}

// Throws NullArgumentError if the value is absent. Unlike not_null(), accepts any type:
// std::optional and nullable types are checked, and other values always pass.
template<typename T>
auto not_null_allow_structs(T&& value, ParamName name) -> T&&
{
	if constexpr (maybe_absent<remove_cvref_t<T>>) {
		if (is_absent(value))
			detail::raise_null(name);
	}
	return forward<T>(value);
}

// Throws NullArgumentError if the text is null, or EmptyArgumentError if it's empty.
inline auto not_null_or_empty(char const* value, ParamName name) -> char const*
{
	if (!value)
		detail::raise_null(name);
	if (value[0] == '\0')
		detail::raise_empty_string(name);
	return value;
}

template<text_like T>
auto not_null_or_empty(T const& value, ParamName name) -> T const&
{
	if (is_empty_text(value))
		detail::raise_empty_string(name);
	return value;
}

template<optional_like T>
requires convertible_to<typename T::value_type const&, string_view>
auto not_null_or_empty(T const& value, ParamName name) -> T const&
{
	if (!value)
		detail::raise_null(name);
	if (is_empty_text(*value))
		detail::raise_empty_string(name);
	return value;
}

// Throws NullArgumentError if the text is null, EmptyArgumentError if it's empty,
// or WhitespaceArgumentError if it consists only of whitespace.
inline auto not_null_or_whitespace(char const* value, ParamName name) -> char const*
{
	if (!value)
		detail::raise_null(name);
	if (value[0] == '\0')
		detail::raise_empty_string(name);
	if (is_all_whitespace(value))
		detail::raise_whitespace(name);
	return value;
}

template<text_like T>
auto not_null_or_whitespace(T const& value, ParamName name) -> T const&
{
	if (is_empty_text(value))
		detail::raise_empty_string(name);
	if (is_all_whitespace(value))
		detail::raise_whitespace(name);
	return value;
}

template<optional_like T>
requires convertible_to<typename T::value_type const&, string_view>
auto not_null_or_whitespace(T const& value, ParamName name) -> T const&
{
	if (!value)
		detail::raise_null(name);
	if (is_empty_text(*value))
		detail::raise_empty_string(name);
	if (is_all_whitespace(*value))
		detail::raise_whitespace(name);
	return value;
}

// Throws NullArgumentError if the sequence is null, or EmptyArgumentError if it has no elements.
// At most one element is read.
template<sequence R>
auto not_null_or_empty(R* values, ParamName name) -> R*
{
	if (!values)
		detail::raise_null(name);
	detail::check_has_elements(*values, name);
	return values;
}

template<sequence R>
auto not_null_or_empty(R&& values, ParamName name) -> R&&
{
	detail::check_has_elements(values, name);
	return forward<R>(values);
}

// Throws NullArgumentError if the sequence is null, NullElementArgumentError if any of its
// elements is absent, or EmptyArgumentError if it has no elements.
// The sequence is enumerated once; the range type decides whether it can be enumerated again.
template<sequence_of_nullables R>
auto not_null_empty_or_null_elements(R* values, ParamName name) -> R*
{
	if (!values)
		detail::raise_null(name);
	detail::check_has_no_null_elements(*values, name);
	return values;
}

template<sequence_of_nullables R>
auto not_null_empty_or_null_elements(R&& values, ParamName name) -> R&&
{
	detail::check_has_no_null_elements(values, name);
	return forward<R>(values);
}

// Throws NullElementArgumentError if the sequence is present and any of its elements is absent.
// A null sequence passes.
template<sequence_of_nullables R>
auto null_or_not_null_elements(R* values, ParamName name) -> R*
{
	if (values) detail::check_no_null_elements(*values, name);
	return values;
}

template<sequence_of_nullables R>
auto null_or_not_null_elements(R&& values, ParamName name) -> R&&
{
	detail::check_no_null_elements(values, name);
	return forward<R>(values);
}

// Throws EmptyArgumentError if the identifier is the nil UUID.
inline auto not_empty(boost::uuids::uuid const& value, ParamName name) -> boost::uuids::uuid const&
{
	if (value.is_nil())
		detail::raise_empty_identifier(name);
	return value;
}

// Always throws OutOfRangeArgumentError. An absent or empty message is replaced
// with the default one.
[[noreturn]] void fail_range(ParamName name, OptionalText message = nullopt);

// Throws OutOfRangeArgumentError if the condition is false.
inline void range(bool condition, ParamName name, OptionalText message = nullopt)
{
	if (!condition)
		fail_range(name, message);
}

// Throws InvalidArgumentError if the condition is false. An absent message is replaced
// with the default one.
inline void argument(bool condition, ParamName name, OptionalText message)
{
	if (!condition)
		detail::raise_invalid(name, message.value_or(bulwark::message(MessageKey::InvalidArgument)));
}

// Throws InvalidArgumentError with a formatted message if the condition is false.
// The message is only formatted on failure.
template<typename Arg, typename... Args>
void argument(bool condition, ParamName name, OptionalText tmpl, Arg const& arg, Args const&... args)
{
	if (!condition)
		detail::raise_invalid(name, format_message(tmpl, arg, args...));
}

// Always throws InvalidArgumentError with the given message. An absent message is replaced
// with the default one.
[[noreturn]] void fail(OptionalText message);

// Always throws InvalidArgumentError with a formatted message.
template<typename Arg, typename... Args>
[[noreturn]] void fail(OptionalText tmpl, Arg const& arg, Args const&... args)
{
	detail::raise_invalid(nullopt, format_message(tmpl, arg, args...));
}

// Always throws InvalidArgumentError with a formatted message. The cause is attached
// as a nested exception, retrievable with std::rethrow_if_nested.
template<typename... Args>
[[noreturn]] void fail(exception_ptr cause, OptionalText tmpl, Args const&... args)
{
	detail::raise_invalid(nullopt, format_message(tmpl, args...), cause);
}

}
