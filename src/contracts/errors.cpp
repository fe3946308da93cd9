/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "contracts/errors.hpp"

#include "preamble.hpp"

namespace bulwark {

static constexpr auto ParamPrefix = " (Parameter '"sv;
static constexpr auto ParamSuffix = "')"sv;

ArgumentError::ArgumentError(ErrorKind kind, string_view message, ParamName name):
	ArgumentError{kind, message, name, render(message, name)}
{}

ArgumentError::ArgumentError(ErrorKind kind, string_view message, ParamName name, string&& rendered):
	std::invalid_argument{rendered},
	error_kind{kind},
	message_size{message.size()},
	param_offset{message.size() + ParamPrefix.size()},
	param_size{name? name->size() : 0},
	has_param{name.has_value()}
{}

auto ArgumentError::message() const noexcept -> string_view
{
	return string_view{what(), message_size};
}

auto ArgumentError::param_name() const noexcept -> ParamName
{
	if (!has_param) return nullopt;
	return string_view{what() + param_offset, param_size};
}

auto ArgumentError::render(string_view message, ParamName name) -> string
{
	if (!name) return string{message};
	auto result = string{};
	result.reserve(message.size() + ParamPrefix.size() + name->size() + ParamSuffix.size());
	result.append(message);
	result.append(ParamPrefix);
	result.append(*name);
	result.append(ParamSuffix);
	return result;
}

}
