/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/service.hpp"

namespace bulwark {

class Config;

// Identifier of a message template. Templates with a {0} placeholder receive the parameter name.
enum class MessageKey {
	ValueNull,
	EmptyString, // {0}
	Whitespace, // {0}
	EmptyArray, // {0}
	NullElement, // {0}
	EmptyIdentifier, // {0}
	OutOfRange,
	InvalidArgument,
	InternalError,
	Unreachable,
};

// Lookup table of message templates, one per MessageKey.
class MessageTable {
public:
	// Create the table with every template at its built-in default.
	MessageTable();

	// Create the table from the [messages] category of a config.
	explicit MessageTable(Config const&);

	[[nodiscard]] auto get(MessageKey key) const noexcept -> string_view { return templates[+key]; }

	// Replace a single template.
	void set(MessageKey, string);

	// The built-in template of a key.
	[[nodiscard]] static auto default_template(MessageKey) noexcept -> string_view;

private:
	array<string, enum_count<MessageKey>()> templates;
};

namespace globals {
inline auto messages = Service<MessageTable>{};
}

// Get the template of a key from the provided message table, or the built-in default
// if no table is provided.
[[nodiscard]] auto message(MessageKey) noexcept -> string_view;

}
