/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <atomic>
#include <thread>
#include "preamble.hpp"
#include "contracts/require.hpp"
#include "contracts/errors.hpp"

namespace {

// Run a deterministic batch of checks and record each outcome as text.
auto run_batch(int seed) -> std::string
{
	using namespace bulwark;
	auto result = string{};
	for (auto const i: views::iota(0, 200)) {
		auto const n = seed * 1000 + i;
		auto const text = (n % 3 == 0)? string{} : (n % 3 == 1)? string{"   "} : format("v{}", n);
		try {
			require::not_null_or_whitespace(text, "text");
			require::range(n % 7 != 0, "n", format_message("{0} is divisible by 7", n));
			result += "ok;";
		} catch (ArgumentError const& e) {
			result += e.what();
			result += ';';
		}
	}
	return result;
}

}

int RunConcurrencySmoke()
{
	using namespace bulwark;
	constexpr auto ThreadCount = 8;

	auto expected = std::vector<string>{};
	for (auto const seed: views::iota(0, ThreadCount))
		expected.emplace_back(run_batch(seed));

	auto mismatches = std::atomic<int>{0};
	{
		auto threads = std::vector<std::jthread>{};
		for (auto const seed: views::iota(0, ThreadCount)) {
			threads.emplace_back([&, seed] {
				for (auto const repeat: views::iota(0, 20)) {
					(void)repeat;
					if (run_batch(seed) != expected[seed]) mismatches += 1;
				}
			});
		}
	}
	if (mismatches != 0) return 1;

	return 0;
}
