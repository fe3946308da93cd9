/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "utils/config.hpp"

#include <fstream>
#include <sstream>
#include "preamble.hpp"
#include "contracts/messages.hpp"
#include "utils/logger.hpp"
#include "utils/assert.hpp"

namespace bulwark {

// Run a toml++ parser, reporting its errors as runtime_error with the parse_error nested.
template<typename Func>
static auto parse_toml(string_view source, Func&& parse) -> toml::table
{
	try {
		return parse();
	} catch (toml::parse_error const&) {
		throw_with_cause(runtime_error_fmt("Failed to parse config from {}", source), current_exception());
	}
}

static void warn_skipped(string_view source, string_view category, string_view name, string_view reason)
{
	if (auto* logger = globals::logger.get_if(); logger && logger->global)
		BULWARK_LOG_WARN(logger->global, "Config {}: skipping {}.{} ({})", source, category, name, reason);
}

void Config::load_from_file(fs::path const& path)
{
	if (!fs::exists(path)) return;
	auto const source = path.string();
	update_entries(parse_toml(source, [&] { return toml::parse_file(source); }), source);
}

auto Config::load_from_string(string_view toml_text) -> usize
{
	return update_entries(parse_toml("string", [&] { return toml::parse(toml_text, "string"); }), "string");
}

auto Config::update_entries(toml::table const& toml_data, string_view source) -> usize
{
	auto updated = 0uz;
	for (auto&& [category_key, category_node]: toml_data) {
		auto const* category_table = category_node.as_table();
		if (!category_table) {
			warn_skipped(source, category_key.str(), "", "not a table");
			continue;
		}
		for (auto&& [name_key, node]: *category_table) {
			auto* entry = find_entry_if(category_key.str(), name_key.str());
			if (!entry) {
				warn_skipped(source, category_key.str(), name_key.str(), "unknown key");
				continue;
			}
			auto const& value_node = node;
			auto const accepted = visit([&](auto& v) {
				auto const value = value_node.value<remove_cvref_t<decltype(v)>>();
				if (!value) return false;
				v = *value;
				return true;
			}, entry->value);
			if (accepted)
				updated += 1;
			else
				warn_skipped(source, category_key.str(), name_key.str(), "wrong type");
		}
	}
	return updated;
}

auto Config::to_string() const -> string
{
	auto toml_data = toml::table{};
	for (auto const& entry: entries) {
		if (!toml_data.contains(entry.category))
			toml_data.insert(entry.category, toml::table{});
		auto& category_table = *toml_data[entry.category].as_table();
		visit([&](auto const& v) { category_table.insert_or_assign(entry.name, v); }, entry.value);
	}
	auto text = std::ostringstream{};
	text << toml_data;
	return move(text).str();
}

void Config::save_to_file(fs::path const& path) const
{
	auto const text = to_string();
	auto file = std::ofstream{path, std::ios::trunc};
	if (!file) throw runtime_error_fmt("Failed to open config file {} for writing", path);
	file << text << '\n';
	if (!file) throw runtime_error_fmt("Failed to write config file {}", path);
}

void Config::set_entry(Entry&& entry)
{
	find_entry(entry.category, entry.name).value = move(entry.value);
}

auto Config::find_entry_if(string_view category, string_view name) -> Entry*
{
	auto iter = find_if(entries, [&](auto const& e) { return e.category == category && e.name == name; });
	return iter != entries.end()? &*iter : nullptr;
}

auto Config::find_entry(string_view category, string_view name) -> Entry&
{
	auto* entry = find_entry_if(category, name);
	ASSERT(entry, "Unknown config entry", category, name);
	return *entry;
}

auto Config::find_entry(string_view category, string_view name) const -> Entry const&
{
	auto iter = find_if(entries, [&](auto const& e) { return e.category == category && e.name == name; });
	ASSERT(iter != entries.end(), "Unknown config entry", category, name);
	return *iter;
}

// Consult this function for the list of registered config entries.
void Config::create_defaults()
{
	// Level names as accepted by parse_log_level()
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "global",
		.value = "Info"s,
	});
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "contracts",
		.value = "Info"s,
	});
	// Empty for no log file
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "file",
		.value = ""s,
	});

	for (auto const key: enum_values<MessageKey>()) {
		entries.emplace_back(Entry{
			.category = "messages",
			.name = string{enum_name(key)},
			.value = string{MessageTable::default_template(key)},
		});
	}
}

}
