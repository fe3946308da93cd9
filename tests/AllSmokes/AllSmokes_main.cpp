/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include <cstdio>
#include <cstdlib>
#include "preamble.hpp"

int RunFormatterSmoke();
int RunRequireSmoke();
int RunRequireSequenceSmoke();
int RunAssumeSmoke();
int RunMessagesSmoke();
int RunLoggerSmoke();
int RunConcurrencySmoke();

namespace {

struct Smoke {
	char const* name;
	int (*run)();
};

}

// Runs every smoke, or only the one named by the first argument.
int main(int argc, char** argv)
{
	using namespace bulwark;

	auto const smokes = to_array<Smoke>({
		{"Formatter", &RunFormatterSmoke},
		{"Require", &RunRequireSmoke},
		{"RequireSequence", &RunRequireSequenceSmoke},
		{"Assume", &RunAssumeSmoke},
		{"Messages", &RunMessagesSmoke},
		{"Logger", &RunLoggerSmoke},
		{"Concurrency", &RunConcurrencySmoke},
	});
	auto const filter = argc > 1? optional<string_view>{argv[1]} : nullopt;

	auto ran = 0;
	auto failures = 0;
	for (auto const& smoke: smokes) {
		if (filter && *filter != smoke.name) continue;
		ran += 1;
		try {
			auto const code = smoke.run();
			if (code != 0) {
				fmtquill::print(stderr, "{} smoke failed with code {}\n", smoke.name, code);
				failures += 1;
			}
		} catch (exception const& e) {
			fmtquill::print(stderr, "{} smoke threw: {}\n", smoke.name, e.what());
			failures += 1;
		}
	}
	if (ran == 0) {
		fmtquill::print(stderr, "Unknown smoke: {}\n", *filter);
		return EXIT_FAILURE;
	}
	return failures == 0? EXIT_SUCCESS : EXIT_FAILURE;
}
