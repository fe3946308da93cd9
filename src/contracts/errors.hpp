/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

namespace bulwark {

// Optional label of the parameter that failed a check.
using ParamName = OptionalText;

// Reason a caller-supplied argument was rejected.
enum class ErrorKind {
	NullArgument, // Required value is absent
	EmptyArgument, // Zero-length text or sequence, or a nil identifier
	WhitespaceArgument, // Text consists only of whitespace
	NullElementArgument, // A sequence holds an absent element
	OutOfRangeArgument, // Value fails a bounds predicate
	InvalidArgument, // Any other failed precondition
};

// Base of all errors caused by the caller passing an invalid argument.
// what() renders the message, followed by the parameter name if one was given.
class ArgumentError: public std::invalid_argument {
public:
	ArgumentError(ErrorKind, string_view message, ParamName = nullopt);

	[[nodiscard]] auto kind() const noexcept -> ErrorKind { return error_kind; }

	// The message without the parameter name suffix.
	[[nodiscard]] auto message() const noexcept -> string_view;

	// Name of the violating parameter, if known.
	[[nodiscard]] auto param_name() const noexcept -> ParamName;

private:
	ErrorKind error_kind;
	// Both are slices of what(), so copying stays non-throwing
	usize message_size;
	usize param_offset;
	usize param_size;
	bool has_param;

	ArgumentError(ErrorKind, string_view message, ParamName, string&& rendered);
	[[nodiscard]] static auto render(string_view message, ParamName) -> string;
};

class NullArgumentError: public ArgumentError {
public:
	explicit NullArgumentError(string_view message, ParamName name = nullopt):
		ArgumentError{ErrorKind::NullArgument, message, name} {}
};

class EmptyArgumentError: public ArgumentError {
public:
	explicit EmptyArgumentError(string_view message, ParamName name = nullopt):
		ArgumentError{ErrorKind::EmptyArgument, message, name} {}
};

class WhitespaceArgumentError: public ArgumentError {
public:
	explicit WhitespaceArgumentError(string_view message, ParamName name = nullopt):
		ArgumentError{ErrorKind::WhitespaceArgument, message, name} {}
};

class NullElementArgumentError: public ArgumentError {
public:
	explicit NullElementArgumentError(string_view message, ParamName name = nullopt):
		ArgumentError{ErrorKind::NullElementArgument, message, name} {}
};

class OutOfRangeArgumentError: public ArgumentError {
public:
	explicit OutOfRangeArgumentError(string_view message, ParamName name = nullopt):
		ArgumentError{ErrorKind::OutOfRangeArgument, message, name} {}
};

class InvalidArgumentError: public ArgumentError {
public:
	explicit InvalidArgumentError(string_view message, ParamName name = nullopt):
		ArgumentError{ErrorKind::InvalidArgument, message, name} {}
};

}
