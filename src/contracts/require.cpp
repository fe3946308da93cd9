/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "contracts/require.hpp"

#include "preamble.hpp"
#include "contracts/messages.hpp"
#include "contracts/errors.hpp"
#include "contracts/format.hpp"
#include "utils/logger.hpp"

namespace bulwark::require {

// Report the violation to the contracts log category if one exists, then throw.
template<typename Err>
[[noreturn]] static void report_and_throw(Err&& err, exception_ptr cause = nullptr)
{
	if (auto* logger = globals::logger.get_if(); logger && logger->contracts) {
		BULWARK_LOG_DEBUG(logger->contracts, "{} (parameter: \"{}\"): {}",
			enum_name(err.kind()), err.param_name().value_or(""), err.message());
	}
	throw_with_cause(forward<Err>(err), cause);
}

// Render a template that takes the parameter name as its only argument.
static auto with_name(MessageKey key, ParamName name) -> string
{
	return format_message(message(key), name.value_or(""));
}

namespace detail {

void raise_null(ParamName name)
{
	report_and_throw(NullArgumentError{message(MessageKey::ValueNull), name});
}

void raise_empty_string(ParamName name)
{
	report_and_throw(EmptyArgumentError{with_name(MessageKey::EmptyString, name), name});
}

void raise_whitespace(ParamName name)
{
	report_and_throw(WhitespaceArgumentError{with_name(MessageKey::Whitespace, name), name});
}

void raise_empty_sequence(ParamName name)
{
	report_and_throw(EmptyArgumentError{with_name(MessageKey::EmptyArray, name), name});
}

void raise_null_element(ParamName name)
{
	report_and_throw(NullElementArgumentError{with_name(MessageKey::NullElement, name), name});
}

void raise_empty_identifier(ParamName name)
{
	report_and_throw(EmptyArgumentError{with_name(MessageKey::EmptyIdentifier, name), name});
}

void raise_invalid(ParamName name, string_view msg, exception_ptr cause)
{
	report_and_throw(InvalidArgumentError{msg, name}, cause);
}

}

void fail_range(ParamName name, OptionalText msg)
{
	auto const text = msg && !msg->empty()? *msg : message(MessageKey::OutOfRange);
	report_and_throw(OutOfRangeArgumentError{text, name});
}

void fail(OptionalText msg)
{
	detail::raise_invalid(nullopt, msg.value_or(message(MessageKey::InvalidArgument)));
}

}
