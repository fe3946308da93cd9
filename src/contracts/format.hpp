/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "quill/bundled/fmt/format.h"
#include "preamble.hpp"

namespace bulwark {

// Rendering of an absent argument.
inline constexpr auto NullText = "null"sv;
// Rendering of an absent template.
inline constexpr auto NullTemplateText = "(null)"sv;
// Rendering of an argument with no known text representation.
inline constexpr auto UnformattableText = "<unformattable>"sv;
// Rendering of a message when nothing else can be produced. Short enough to fit
// in the small string buffer, so creating it doesn't allocate.
// Only failures derived from std::exception reach this tier; a user formatter that throws
// any other type terminates the program, as format_message() is noexcept.
inline constexpr auto FallbackText = "<no message>"sv;

namespace detail {

// Convert a single message argument to text. Absent values render as NullText.
template<typename T>
auto stringify_arg(T const& arg) -> string
{
	if constexpr (optional_like<T>) {
		if (!arg) return string{NullText};
		return stringify_arg(*arg);
	} else if constexpr (std::is_null_pointer_v<T>) {
		return string{NullText};
	} else if constexpr (same_as<T, char const*> || same_as<T, char*>) {
		if (!arg) return string{NullText};
		return string{arg};
	} else if constexpr (std::is_convertible_v<T const&, string_view>) {
		return string{string_view{arg}};
	} else if constexpr (std::is_enum_v<T>) {
		auto const name = enum_name(arg);
		if (!name.empty()) return string{name};
		return format("{}", static_cast<std::underlying_type_t<T>>(arg));
	} else if constexpr (std::is_pointer_v<T> && !std::is_function_v<std::remove_pointer_t<T>>) {
		if (!arg) return string{NullText};
		return format("{}", static_cast<void const*>(arg));
	} else if constexpr (nullable<T>) {
		if (arg == nullptr) return string{NullText};
		if constexpr (requires { static_cast<void const*>(arg.get()); })
			return format("{}", static_cast<void const*>(arg.get()));
		else
			return string{UnformattableText};
	} else if constexpr (fmtquill::is_formattable<T>::value) {
		return format("{}", arg);
	} else {
		return string{UnformattableText};
	}
}

// The raw template, followed by the bracketed argument list if there are any arguments.
[[nodiscard]] auto raw_message(OptionalText tmpl, span<string const> args) noexcept -> string;

// FallbackText as a string.
[[nodiscard]] auto fallback_message() noexcept -> string;

}

// Render a message template with positional arguments ("{0}", "{1}", or "{}").
// Never throws. If the template is absent or malformed, or refers to a missing argument,
// the raw template is returned with the arguments appended in brackets:
//     format_message("{0} {1}", 1) == "{0} {1} [1]"
//     format_message(nullopt, 1, 2) == "(null) [1, 2]"
// If even that fails, FallbackText is returned.
// Arguments are converted to text before formatting, so format specs apply to their text form.
template<typename... Args>
[[nodiscard]] auto format_message(OptionalText tmpl, Args const&... args) noexcept -> string
{
	auto rendered = array<string, sizeof...(Args)>{};
	try {
		rendered = {detail::stringify_arg(args)...};
	} catch (exception const&) {
		return detail::fallback_message();
	}

	if (tmpl) {
		try {
			return std::apply([&](auto const&... text) {
				return fmtquill::vformat(*tmpl, fmtquill::make_format_args(text...));
			}, rendered);
		} catch (fmtquill::format_error const&) {
			// Malformed template; handled below
		} catch (exception const&) {
			return detail::fallback_message();
		}
	}
	return detail::raw_message(tmpl, rendered);
}

}
