/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <type_traits>
#include <functional>
#include <optional>
#include <variant>
#include <utility>
#include <memory>
#include <tuple>
#define MAGIC_ENUM_RANGE_MIN -1
#define MAGIC_ENUM_RANGE_MAX 64
#include <magic_enum/magic_enum.hpp>
#include "preamble/types.hpp"

namespace bulwark {

using std::optional;
using std::nullopt;
using std::variant;
using std::get;
using std::visit;
using std::move;
using std::forward;
using std::make_unique;
using std::shared_ptr;
using std::make_shared;
using std::static_pointer_cast;
using std::function;
using std::remove_cvref_t;
using magic_enum::enum_name;
using magic_enum::enum_cast;
using magic_enum::enum_count;
using magic_enum::enum_values;

template<typename T>
concept scoped_enum = std::is_scoped_enum_v<T>;

// Convenient shorthand for getting the value of an enum class
constexpr auto operator+(scoped_enum auto val) noexcept { return std::to_underlying(val); }

}
