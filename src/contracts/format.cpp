/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "contracts/format.hpp"

#include "preamble.hpp"

namespace bulwark::detail {

auto raw_message(OptionalText tmpl, span<string const> args) noexcept -> string
try {
	auto result = string{tmpl.value_or(NullTemplateText)};
	if (!args.empty()) {
		result.append(" [");
		for (auto const& [idx, arg]: views::enumerate(args)) {
			if (idx != 0) result.append(", ");
			result.append(arg);
		}
		result.append("]");
	}
	return result;
} catch (exception const&) {
	return fallback_message();
}

auto fallback_message() noexcept -> string
{
	return string{FallbackText};
}

}
