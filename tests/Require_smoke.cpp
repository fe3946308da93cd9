/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <functional>
#include <future>
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include "preamble.hpp"
#include "contracts/require.hpp"
#include "contracts/errors.hpp"
#include "SmokeHelpers.hpp"

namespace {

// A value whose formatter always fails.
struct BrokenValue {};

// Whether require::not_null() accepts the type at all.
template<typename T>
concept null_checkable = requires(T&& value) { bulwark::require::not_null(std::forward<T>(value), "value"); };

}

template<>
struct fmtquill::formatter<BrokenValue>: fmtquill::formatter<std::string_view> {
	auto format(BrokenValue const&, format_context&) const -> format_context::iterator
	{
		throw std::runtime_error{"formatter failure"};
	}
};

int RunRequireSmoke()
{
	using namespace bulwark;
	using smoke::expect_throw;

	// not_null
	auto value = 5;
	auto* ptr = &value;
	if (&require::not_null(ptr, "ptr") != &ptr) return 1;
	auto const null_error = expect_throw<NullArgumentError>([] {
		auto* missing = static_cast<int*>(nullptr);
		require::not_null(missing, "missing");
	});
	if (!null_error) return 2;
	if (null_error->kind() != ErrorKind::NullArgument) return 3;
	if (null_error->param_name() != "missing"sv) return 4;
	if (null_error->message() != "Value cannot be null.") return 5;
	if (string_view{null_error->what()} != "Value cannot be null. (Parameter 'missing')") return 6;

	auto const unnamed = expect_throw<NullArgumentError>([] {
		auto* missing = static_cast<void*>(nullptr);
		require::not_null(missing, nullopt);
	});
	if (!unnamed) return 7;
	if (unnamed->param_name()) return 8;
	if (string_view{unnamed->what()} != "Value cannot be null.") return 9;

	auto owned = make_unique<int>(3);
	if (&require::not_null(owned, "owned") != &owned) return 10;
	if (!expect_throw<NullArgumentError>([] { require::not_null(shared_ptr<int>{}, "shared"); })) return 11;
	if (!expect_throw<NullArgumentError>([] { require::not_null(function<void()>{}, "callback"); })) return 12;

	auto promise = std::promise<int>{};
	auto future = promise.get_future();
	require::not_null(future, "future");
	if (!expect_throw<NullArgumentError>([] { require::not_null(std::future<int>{}, "future"); })) return 13;

	// All errors share a catchable base
	if (!expect_throw<ArgumentError>([] { require::not_null(static_cast<int*>(nullptr), "p"); })) return 14;
	if (!expect_throw<std::invalid_argument>([] { require::not_null(static_cast<int*>(nullptr), "p"); })) return 15;

	// not_null_allow_structs
	if (!expect_throw<NullArgumentError>([] { require::not_null_allow_structs(optional<int>{}, "opt"); })) return 16;
	auto present = optional<int>{4};
	if (&require::not_null_allow_structs(present, "opt") != &present) return 17;
	auto zero = 0;
	if (require::not_null_allow_structs(zero, "zero") != 0) return 18;

	// not_null_or_empty on text
	if (!expect_throw<NullArgumentError>([] { require::not_null_or_empty(static_cast<char const*>(nullptr), "text"); }))
		return 19;
	auto const empty_error = expect_throw<EmptyArgumentError>([] { require::not_null_or_empty("", "name"); });
	if (!empty_error) return 20;
	if (string_view{empty_error->what()} !=
		R"('name' cannot be an empty string ("") or start with the null character. (Parameter 'name'))")
		return 21;
	if (!expect_throw<EmptyArgumentError>([] { require::not_null_or_empty(string{"\0abc", 4}, "text"); })) return 22;
	auto const* literal = "abc";
	if (require::not_null_or_empty(literal, "text") != literal) return 23;
	auto const text = "abc"s;
	if (&require::not_null_or_empty(text, "text") != &text) return 24;
	if (!expect_throw<NullArgumentError>([] { require::not_null_or_empty(optional<string>{}, "text"); })) return 25;
	if (!expect_throw<EmptyArgumentError>([] { require::not_null_or_empty(optional<string>{""}, "text"); })) return 26;
	require::not_null_or_empty("  "sv, "text");

	// not_null_or_whitespace
	auto const ws_error = expect_throw<WhitespaceArgumentError>([] { require::not_null_or_whitespace(" \t\n", "text"); });
	if (!ws_error) return 27;
	if (ws_error->kind() != ErrorKind::WhitespaceArgument) return 28;
	if (string_view{ws_error->what()} !=
		R"(The parameter "text" cannot consist entirely of white space characters. (Parameter 'text'))")
		return 29;
	if (!expect_throw<EmptyArgumentError>([] { require::not_null_or_whitespace(""s, "text"); })) return 30;
	if (!expect_throw<EmptyArgumentError>([] { require::not_null_or_whitespace(string{"\0  ", 3}, "text"); })) return 31;
	if (!expect_throw<NullArgumentError>([] { require::not_null_or_whitespace(static_cast<char const*>(nullptr), "text"); }))
		return 32;
	if (!expect_throw<WhitespaceArgumentError>([] { require::not_null_or_whitespace(optional<string>{"   "}, "text"); }))
		return 33;
	require::not_null_or_whitespace(" x ", "text");

	// not_empty on identifiers
	auto const nil_error = expect_throw<EmptyArgumentError>([] { require::not_empty(boost::uuids::nil_uuid(), "id"); });
	if (!nil_error) return 34;
	if (string_view{nil_error->what()} != "'id' cannot be an empty identifier. (Parameter 'id')") return 35;
	auto const id = boost::uuids::string_generator{}("01234567-89ab-cdef-0123-456789abcdef");
	if (&require::not_empty(id, "id") != &id) return 36;

	// range
	require::range(true, "count");
	auto const range_error = expect_throw<OutOfRangeArgumentError>([] {
		require::range(false, "count", "must be below 10");
	});
	if (!range_error) return 37;
	if (range_error->message() != "must be below 10") return 38;
	if (string_view{range_error->what()} != "must be below 10 (Parameter 'count')") return 39;
	auto const default_range = expect_throw<OutOfRangeArgumentError>([] { require::range(false, "count"); });
	if (!default_range || default_range->message() != "Specified argument was out of the range of valid values.") return 40;
	auto const blank_range = expect_throw<OutOfRangeArgumentError>([] { require::range(false, "count", ""); });
	if (!blank_range || blank_range->message() != default_range->message()) return 41;
	if (!expect_throw<OutOfRangeArgumentError>([] { require::fail_range("index"); })) return 42;

	// argument
	require::argument(true, "x", "never shown");
	auto const arg_error = expect_throw<InvalidArgumentError>([] {
		require::argument(false, "x", "x must be positive");
	});
	if (!arg_error || arg_error->message() != "x must be positive") return 43;
	auto const default_arg = expect_throw<InvalidArgumentError>([] { require::argument(false, "x", nullopt); });
	if (!default_arg || default_arg->message() != "Value does not fall within the expected range.") return 44;
	auto const formatted = expect_throw<InvalidArgumentError>([] {
		require::argument(false, "size", "Expected {0} elements, got {1}", 3, 5);
	});
	if (!formatted || formatted->message() != "Expected 3 elements, got 5") return 45;
	if (formatted->param_name() != "size"sv) return 46;
	auto const malformed = expect_throw<InvalidArgumentError>([] {
		require::argument(false, "size", "Expected {0} and {2}", 3);
	});
	if (!malformed || malformed->message() != "Expected {0} and {2} [3]") return 47;

	// fail
	auto const failed = expect_throw<InvalidArgumentError>([] { require::fail("boom"); });
	if (!failed || string_view{failed->what()} != "boom" || failed->param_name()) return 48;
	auto const failed_default = expect_throw<InvalidArgumentError>([] { require::fail(nullopt); });
	if (!failed_default || failed_default->message() != "Value does not fall within the expected range.") return 49;
	auto const failed_empty = expect_throw<InvalidArgumentError>([] { require::fail(""); });
	if (!failed_empty || string_view{failed_empty->what()} != "") return 50;
	auto const failed_fmt = expect_throw<InvalidArgumentError>([] { require::fail("Bad {0}", 7); });
	if (!failed_fmt || failed_fmt->message() != "Bad 7") return 51;

	// fail with a nested cause
	auto const cause = make_exception_ptr(runtime_error{"disk full"});
	auto const wrapped = smoke::capture([&] { require::fail(cause, "Could not save {0}", "file.txt"); });
	if (!wrapped) return 56;
	try {
		rethrow_exception(wrapped);
	} catch (InvalidArgumentError const& e) {
		if (string_view{e.what()} != "Could not save file.txt") return 52;
		try {
			rethrow_if_nested(e);
			return 53;
		} catch (runtime_error const& inner) {
			if (string_view{inner.what()} != "disk full") return 54;
		}
	} catch (exception const&) {
		return 55;
	}

	// A null C string name or message counts as absent
	auto const* null_text = static_cast<char const*>(nullptr);
	auto const null_name = expect_throw<NullArgumentError>([&] {
		require::not_null(static_cast<int*>(nullptr), null_text);
	});
	if (!null_name || null_name->param_name()) return 57;
	if (string_view{null_name->what()} != "Value cannot be null.") return 58;
	auto const null_message = expect_throw<InvalidArgumentError>([&] { require::fail(null_text); });
	if (!null_message || null_message->message() != "Value does not fall within the expected range.") return 59;
	auto const null_range = expect_throw<OutOfRangeArgumentError>([&] { require::range(false, "count", null_text); });
	if (!null_range || null_range->message() != "Specified argument was out of the range of valid values.") return 60;
	auto const null_argument = expect_throw<InvalidArgumentError>([&] { require::argument(false, null_text, null_text); });
	if (!null_argument || null_argument->param_name()) return 61;
	if (null_argument->message() != "Value does not fall within the expected range.") return 62;

	// A message without format arguments is kept verbatim
	auto const verbatim = expect_throw<InvalidArgumentError>([] { require::argument(false, "x", "literal {0}"); });
	if (!verbatim || verbatim->message() != "literal {0}") return 63;

	// A failing argument formatter still produces an error, with the last-resort message
	auto const broken = expect_throw<InvalidArgumentError>([] {
		require::argument(false, "x", "{0}", BrokenValue{});
	});
	if (!broken || broken->message() != FallbackText) return 64;
	if (broken->param_name() != "x"sv) return 65;

	// Optionals are checked by not_null_allow_structs, never by not_null
	static_assert(null_checkable<int*>);
	static_assert(null_checkable<shared_ptr<int>&>);
	static_assert(!null_checkable<optional<int*>>);
	static_assert(!null_checkable<optional<int>>);
	if (!expect_throw<NullArgumentError>([] { require::not_null_allow_structs(optional<int*>{}, "opt"); })) return 66;

	return 0;
}
