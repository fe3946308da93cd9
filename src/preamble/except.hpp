/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <exception>
#include <stdexcept>
#include "quill/bundled/fmt/base.h"
#include "preamble/utility.hpp"
#include "preamble/string.hpp"

namespace bulwark {

using std::exception;
using std::exception_ptr;
using std::logic_error;
using std::runtime_error;
using std::current_exception;
using std::make_exception_ptr;
using std::rethrow_exception;
using std::rethrow_if_nested;

// An arbitrary exception type with a formatted message
template<typename Err, typename... Args>
auto typed_error_fmt(fmtquill::format_string<Args...> fmt, Args&&... args) -> Err
{
	return Err{format(fmt, forward<Args>(args)...)};
}

// A std::runtime_error with a formatted message
template<typename... Args>
auto runtime_error_fmt(fmtquill::format_string<Args...> fmt, Args&&... args)
{
	return typed_error_fmt<std::runtime_error>(fmt, forward<Args>(args)...);
};

// Throw an exception, with another exception attached as its nested cause.
// If the cause is empty, the exception is thrown as-is.
// The nested cause can be retrieved with std::rethrow_if_nested.
template<typename Err>
[[noreturn]] void throw_with_cause(Err&& err, exception_ptr cause)
{
	if (!cause) throw forward<Err>(err);
	try {
		rethrow_exception(cause);
	} catch (...) {
		std::throw_with_nested(forward<Err>(err));
	}
}

}
