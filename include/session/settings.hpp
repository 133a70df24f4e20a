// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skiff {
namespace session {

using SettingsMap = std::map<std::string, std::string>;

// Settings - immutable key/value view produced by SettingsBuilder
class Settings {
public:
  Settings() = default;
  explicit Settings(SettingsMap values) : values_(std::move(values)) {}

  std::optional<std::string> get(const std::string& key) const;
  std::string get_or(const std::string& key, const std::string& fallback) const;

  // Throws ConfigurationError if the value is not a decimal int.
  std::optional<int> get_int(const std::string& key) const;

  // Accepts true/false, yes/no, on/off, 1/0. Throws ConfigurationError otherwise.
  std::optional<bool> get_bool(const std::string& key) const;

  bool contains(const std::string& key) const { return values_.count(key) != 0; }
  std::vector<std::string> keys() const;
  size_t size() const { return values_.size(); }
  const SettingsMap& values() const { return values_; }

private:
  SettingsMap values_;
};

// Parses key=value / key: value lines. '#' and '!' start comments; a trailing
// backslash continues the value on the next line. A line with no separator
// yields the key with an empty value.
SettingsMap parse_properties(const std::string& text);

// Parses a JSON object, flattening nested objects with '.'. Strings are taken
// verbatim; other scalars and arrays use their JSON text; nulls are skipped.
// Throws SettingsLoadError on malformed input or a non-object document.
SettingsMap parse_json_settings(const std::string& text);

// Parses --name value, --name=value and bare --flag (meaning "true").
// Throws ConfigurationError on a token not attached to a --name.
SettingsMap parse_command_line(const std::vector<std::string>& args);

// Directories searched for <base>.properties, in ascending precedence:
// /etc, /opt/local/etc, $HOME, the working directory.
std::vector<std::filesystem::path> default_settings_directories();

// SettingsBuilder - layers settings sources
//
// Sources are applied in the order added; a later source overrides earlier
// ones key by key. Command-line arguments are always applied last. Nothing
// is read until build().
class SettingsBuilder {
public:
  explicit SettingsBuilder(std::string base_name);

  const std::string& base_name() const { return base_name_; }

  SettingsBuilder& add(const std::string& key, std::string value);
  SettingsBuilder& add(const SettingsMap& values);

  // <base>.properties in each directory, skipped when absent.
  SettingsBuilder& add_default_locations();
  SettingsBuilder& add_default_locations(std::vector<std::filesystem::path> directories);

  // An explicit file: JSON if it ends in .json, properties otherwise.
  // build() throws SettingsLoadError if it cannot be read or parsed.
  SettingsBuilder& add_file(const std::filesystem::path& path);

  SettingsBuilder& add_command_line(std::vector<std::string> args);

  Settings build() const;

private:
  struct FileSource {
    std::filesystem::path path;
    bool required;
  };
  using Source = std::variant<SettingsMap, FileSource>;

  std::string base_name_;
  std::vector<Source> sources_;
  std::vector<std::string> command_line_;
};

}  // namespace session
}  // namespace skiff
