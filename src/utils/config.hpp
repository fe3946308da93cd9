/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <toml++/toml.hpp>
#include "preamble.hpp"

namespace bulwark {

// Default config file location
inline constexpr auto ConfigPath = "bulwark.toml"sv;

// Runtime configuration of the library: log levels and message templates.
// Every entry has a built-in default; values can be overridden from TOML.
class Config {
public:
	using Value = variant<int, double, bool, string>;
	struct Entry {
		string category;
		string name;
		Value value;
	};

	// Create the config object, with entries at their default values.
	Config() { create_defaults(); }

	// Update entries from a config file. A missing file leaves the defaults in place.
	// Throws runtime_error if the file can't be read or parsed, with the toml::parse_error nested.
	void load_from_file(fs::path const& = ConfigPath);

	// Update entries from TOML text, and return how many were updated.
	// Unknown keys and values of the wrong type are skipped, with a warning if a logger
	// is provided. Throws runtime_error if the text can't be parsed.
	auto load_from_string(string_view toml_text) -> usize;

	// Write all entries to a config file, overwriting it.
	void save_to_file(fs::path const& = ConfigPath) const;

	// Render all entries as TOML text.
	[[nodiscard]] auto to_string() const -> string;

	// Get the value of an entry.
	template <variant_alternative<Value> T>
	[[nodiscard]] auto get_entry(string_view category, string_view name) const -> T const&
	{ return get<T>(find_entry(category, name).value); }

	// Set an entry to a new value. The entry must exist.
	void set_entry(Entry&&);

	Config(Config const&) = delete;
	auto operator=(Config const&) -> Config& = delete;
	Config(Config&&) = delete;
	auto operator=(Config&&) -> Config& = delete;

private:
	vector<Entry> entries;

	auto update_entries(toml::table const&, string_view source) -> usize;
	[[nodiscard]] auto find_entry_if(string_view category, string_view name) -> Entry*;
	[[nodiscard]] auto find_entry(string_view category, string_view name) -> Entry&;
	[[nodiscard]] auto find_entry(string_view category, string_view name) const -> Entry const&;
	void create_defaults();
};

}
