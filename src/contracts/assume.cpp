/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "contracts/assume.hpp"

#include "preamble.hpp"
#include "contracts/messages.hpp"
#include "utils/logger.hpp"
#include "utils/assert.hpp"

namespace bulwark::assume {

namespace {

// Thrown on a failed assumption. Only visible in this file.
class InternalError: public exception {
public:
	explicit InternalError(string message):
		text{make_shared<string const>(move(message))} {}

	[[nodiscard]] auto what() const noexcept -> char const* override { return text->c_str(); }

private:
	shared_ptr<string const> text;
};

[[noreturn]] void report_and_throw(string message, exception_ptr cause)
{
	if (auto* logger = globals::logger.get_if(); logger && logger->contracts)
		BULWARK_LOG_CRIT(logger->contracts, "Internal error: {}", message);
	throw_with_cause(InternalError{move(message)}, cause);
}

}

auto is_internal_error(exception const& e) noexcept -> bool
{
	return dynamic_cast<InternalError const*>(&e) != nullptr;
}

void fail(OptionalText msg)
{
	report_and_throw(string{msg.value_or(message(MessageKey::InternalError))}, nullptr);
}

void fail(OptionalText msg, exception_ptr cause)
{
	report_and_throw(string{msg.value_or(message(MessageKey::InternalError))}, cause);
}

void not_reachable()
{
	report_and_throw(string{message(MessageKey::Unreachable)}, nullptr);
}

void install_assert_handler()
{
	libassert::set_failure_handler([](libassert::assertion_info const& info) {
		report_and_throw(info.to_string(), nullptr);
	});
	libassert::set_color_scheme(libassert::color_scheme::blank);
}

}
