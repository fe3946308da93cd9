/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <string_view> // IWYU pragma: export
#include <filesystem>
#include <string> // IWYU pragma: export
#include <locale>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include "quill/bundled/fmt/format.h"
#include "preamble/algorithm.hpp"
#include "preamble/concepts.hpp"
#include "preamble/types.hpp"

namespace bulwark {

using std::string;
using std::string_view;
using std::literals::operator""s;
using std::literals::operator""sv;
using fmtquill::format_string;
using fmtquill::format;

// Text that may be absent. A null C string converts to an absent value instead of
// being measured.
class OptionalText: public optional<string_view> {
public:
	using optional<string_view>::optional;
	OptionalText(optional<string_view> text): optional<string_view>{text} {}
	OptionalText(char const* text): optional<string_view>{text? optional<string_view>{text} : nullopt} {}
};

// Check whether a string is empty, or starts with a NUL character.
[[nodiscard]] constexpr auto is_empty_text(string_view text) -> bool
{
	return text.empty() || text.front() == '\0';
}

// Check whether a string consists only of C locale whitespace characters.
// An empty string satisfies this vacuously.
[[nodiscard]] inline auto is_all_whitespace(string_view text) -> bool
{
	return boost::algorithm::all(text, boost::algorithm::is_space(std::locale::classic()));
}

namespace fs {
	using std::filesystem::path;
	using std::filesystem::exists;
}

}

template<>
struct fmtquill::formatter<bulwark::fs::path>: formatter<std::string_view> {
	auto format(bulwark::fs::path const& c, format_context& ctx) const -> format_context::iterator
	{
		return formatter<std::string_view>::format(c.string(), ctx);
	}
};
