/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "contracts/messages.hpp"

#include "preamble.hpp"
#include "contracts/format.hpp"
#include "utils/config.hpp"

namespace bulwark {

MessageTable::MessageTable()
{
	for (auto const key: enum_values<MessageKey>())
		templates[+key] = string{default_template(key)};
}

MessageTable::MessageTable(Config const& config)
{
	for (auto const key: enum_values<MessageKey>())
		templates[+key] = config.get_entry<string>("messages", enum_name(key));
}

void MessageTable::set(MessageKey key, string text)
{
	templates[+key] = move(text);
}

auto MessageTable::default_template(MessageKey key) noexcept -> string_view
{
	switch (key) {
	case MessageKey::ValueNull: return "Value cannot be null.";
	case MessageKey::EmptyString: return R"('{0}' cannot be an empty string ("") or start with the null character.)";
	case MessageKey::Whitespace: return R"(The parameter "{0}" cannot consist entirely of white space characters.)";
	case MessageKey::EmptyArray: return "'{0}' must contain at least one element.";
	case MessageKey::NullElement: return "'{0}' cannot contain a null element.";
	case MessageKey::EmptyIdentifier: return "'{0}' cannot be an empty identifier.";
	case MessageKey::OutOfRange: return "Specified argument was out of the range of valid values.";
	case MessageKey::InvalidArgument: return "Value does not fall within the expected range.";
	case MessageKey::InternalError: return "An internal error occurred. Please contact the library maintainers.";
	case MessageKey::Unreachable: return "Code that was expected to be unreachable was executed.";
	}
	return FallbackText;
}

auto message(MessageKey key) noexcept -> string_view
{
	if (auto const* table = globals::messages.get_if()) return table->get(key);
	return MessageTable::default_template(key);
}

}
