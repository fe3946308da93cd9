/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "quill/sinks/ConsoleSink.h"
#include "quill/sinks/FileSink.h"
#include "quill/LogMacros.h"
#include "quill/Frontend.h"
#include "quill/Logger.h"
#include "preamble.hpp"
#include "utils/service.hpp"

// Log to a category of the provided logger. The category must not be null.
#define BULWARK_LOG_DEBUG(category, ...) LOG_DEBUG(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define BULWARK_LOG_WARN(category, ...) LOG_WARNING(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)
#define BULWARK_LOG_CRIT(category, ...) LOG_CRITICAL(static_cast<quill::Frontend::logger_t*>(category), __VA_ARGS__)

namespace bulwark {

class Config;

// Diagnostics of contract violations. The library never starts logging by itself;
// it only logs if the consuming program provides an instance through globals::logger.
class Logger {
public:
	// A named tag for log messages. Its destinations and level can be customized independently.
	using Category = quill::Frontend::logger_t*;
	// Log importance level.
	using Level = quill::LogLevel;

	struct Options {
		// Messages are also written here if present. The file is truncated on open.
		optional<fs::path> log_file;
		Level global_level = Level::Info;
		Level contracts_level = Level::Info;
		bool log_to_console = true;

		// Read the levels and log file from the [logging] category of a config.
		// Throws runtime_error if a level name is invalid.
		[[nodiscard]] static auto from_config(Config const&) -> Options;
	};

	// Redirects the contracts category into a string buffer for as long as it exists.
	// Use capture_contracts() to get an instance.
	class Capture {
	public:
		~Capture();

		// Retrieve all messages logged so far. The buffer starts empty again afterwards.
		[[nodiscard]] auto take() -> string;

		Capture(Capture const&) = delete;
		auto operator=(Capture const&) -> Capture& = delete;

	private:
		class MemorySink: public quill::Sink {
		public:
			MemorySink() = default;

			void write_log(quill::MacroMetadata const*, uint64_t /** log_timestamp **/,
				std::string_view /** thread_id **/, std::string_view /** thread_name **/,
				std::string const& /** process_id **/, std::string_view /** logger_name **/,
				quill::LogLevel, std::string_view /** log_level_description **/,
				std::string_view /** log_level_short_code **/,
				std::vector<std::pair<std::string, std::string>> const* /** named_args **/,
				std::string_view /** log_message **/, std::string_view log_statement) override
			{
				buffer.append(log_statement);
			}

			auto take() -> string;

			void flush_sink() noexcept override {}
			void run_periodic_tasks() noexcept override {}

		private:
			string buffer;
		};

		friend class Logger;

		Logger& logger;
		shared_ptr<MemorySink> sink;
		Category category;
		Category redirected;

		Capture(Logger&, Level);
	};

	// Messages not tied to a specific check.
	Category global = nullptr;

	// Contract violations: argument errors at Debug level, internal errors at Critical level.
	Category contracts = nullptr;

	// Start the logging backend and create the categories.
	explicit Logger(Options const&);
	explicit Logger(Config const& config): Logger{Options::from_config(config)} {}

	// Send contract violations to a string buffer instead of the regular sinks, until the
	// returned object is destroyed. Only one capture can be active at a time.
	[[nodiscard]] auto capture_contracts(Level = Level::TraceL1) -> Capture;

	Logger(Logger const&) = delete;
	auto operator=(Logger const&) -> Logger& = delete;

private:
	shared_ptr<quill::ConsoleSink> console_sink;
	shared_ptr<quill::FileSink> file_sink;

	auto create_category(string_view name, Level) -> Category;
};

// Convert a level name such as "Info" or "Critical" to a log level.
// Throws runtime_error if the name is not a valid level.
[[nodiscard]] auto parse_log_level(string_view) -> Logger::Level;

}

namespace bulwark::globals {
inline auto logger = Service<Logger>{};
}
