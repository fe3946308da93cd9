/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "utils/logger.hpp"

#include <chrono>
#include "quill/Backend.h"
#include "preamble.hpp"
#include "utils/config.hpp"

namespace bulwark {

static constexpr auto CaptureName = "ContractsCapture"sv;

static auto const CapturePattern = quill::PatternFormatterOptions{
	"[%(log_level_short_code)] %(message)"
};

static auto const CategoryPattern = quill::PatternFormatterOptions{
	"%(time) [%(log_level_short_code)] [%(logger)] %(message)",
	"%H:%M:%S.%Qms"
};

static auto const ShortCodes = to_array<std::string>({
	"TR3", "TR2", "TRA", "DBG", "INF", "NTC",
	"WRN", "ERR", "CRT", "BCT", "___"
});

auto Logger::Options::from_config(Config const& config) -> Options
{
	auto options = Options{};
	options.global_level = parse_log_level(config.get_entry<string>("logging", "global"));
	options.contracts_level = parse_log_level(config.get_entry<string>("logging", "contracts"));
	if (auto const& file = config.get_entry<string>("logging", "file"); !file.empty())
		options.log_file = fs::path{file};
	return options;
}

Logger::Capture::Capture(Logger& logger, Level level):
	logger{logger},
	sink{static_pointer_cast<MemorySink>(quill::Frontend::create_or_get_sink<MemorySink>(string{CaptureName}))},
	category{quill::Frontend::create_or_get_logger(string{CaptureName}, {sink}, CapturePattern)},
	redirected{logger.contracts}
{
	category->set_log_level(level);
	logger.contracts = category;
}

Logger::Capture::~Capture()
{
	logger.contracts = redirected;
	quill::Frontend::remove_logger(category);
}

auto Logger::Capture::take() -> string
{
	category->flush_log();
	return sink->take();
}

auto Logger::Capture::MemorySink::take() -> string
{
	auto out_buffer = move(buffer);
	buffer = string{};
	return out_buffer;
}

Logger::Logger(Options const& options)
{
	quill::Backend::start<quill::FrontendOptions>({
		.thread_name = "bulwark-log",
		.enable_yield_when_idle = true,
		.sleep_duration = std::chrono::nanoseconds{0},
		.check_printable_char = {}, // Allow UTF-8
		.log_level_short_codes = ShortCodes,
	}, quill::SignalHandlerOptions{});

	if (options.log_to_console) {
		console_sink = static_pointer_cast<quill::ConsoleSink>(
			quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
	}
	if (options.log_file) {
		auto file_cfg = quill::FileSinkConfig{};
		file_cfg.set_open_mode('w');
		file_sink = static_pointer_cast<quill::FileSink>(
			quill::Frontend::create_or_get_sink<quill::FileSink>(options.log_file->string(), file_cfg));
	}

	global = create_category("Global", options.global_level);
	contracts = create_category("Contracts", options.contracts_level);
}

auto Logger::capture_contracts(Level level) -> Capture
{
	return Capture{*this, level};
}

auto Logger::create_category(string_view name, Level level) -> Category
{
	auto sinks = std::vector<shared_ptr<quill::Sink>>{};
	if (console_sink) sinks.emplace_back(console_sink);
	if (file_sink) sinks.emplace_back(file_sink);
	auto* category = quill::Frontend::create_or_get_logger(string{name}, sinks, CategoryPattern);
	category->set_log_level(level);
	return category;
}

auto parse_log_level(string_view name) -> Logger::Level
{
	auto const level = enum_cast<Logger::Level>(name);
	if (!level) throw runtime_error_fmt("Invalid log level: {}", name);
	return *level;
}

}
