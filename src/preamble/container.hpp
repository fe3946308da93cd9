/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <string>
#include <array>
#include <span>
#include <boost/container/vector.hpp>
#include "preamble/types.hpp"

namespace bulwark {

using boost::container::vector;
using std::array;
using std::to_array;
using std::span;

}
