// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/settings.hpp"

#include "errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

#include <nlohmann/json.hpp>

namespace skiff {
namespace session {

namespace {

std::string trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void flatten(const nlohmann::json& node, const std::string& prefix, SettingsMap& out) {
  if (node.is_object()) {
    for (auto it = node.begin(); it != node.end(); ++it) {
      flatten(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key(), out);
    }
    return;
  }
  if (node.is_null()) {
    return;
  }
  out[prefix] = node.is_string() ? node.get<std::string>() : node.dump();
}

void merge(SettingsMap& into, const SettingsMap& from) {
  for (const auto& [key, value] : from) {
    into[key] = value;
  }
}

}  // namespace

// ============================================================================
// Settings
// ============================================================================

std::optional<std::string> Settings::get(const std::string& key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string Settings::get_or(const std::string& key, const std::string& fallback) const {
  auto it = values_.find(key);
  return it == values_.end() ? fallback : it->second;
}

std::optional<int> Settings::get_int(const std::string& key) const {
  auto value = get(key);
  if (!value) {
    return std::nullopt;
  }
  int result = 0;
  const char* first = value->data();
  const char* last = first + value->size();
  auto [ptr, ec] = std::from_chars(first, last, result);
  if (ec != std::errc{} || ptr != last || value->empty()) {
    throw ConfigurationError("setting '" + key + "' is not an integer: '" + *value + "'");
  }
  return result;
}

std::optional<bool> Settings::get_bool(const std::string& key) const {
  auto value = get(key);
  if (!value) {
    return std::nullopt;
  }
  std::string v = to_lower(*value);
  if (v == "true" || v == "yes" || v == "on" || v == "1") {
    return true;
  }
  if (v == "false" || v == "no" || v == "off" || v == "0") {
    return false;
  }
  throw ConfigurationError("setting '" + key + "' is not a boolean: '" + *value + "'");
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(values_.size());
  for (const auto& [key, value] : values_) {
    result.push_back(key);
  }
  return result;
}

// ============================================================================
// Parsers
// ============================================================================

SettingsMap parse_properties(const std::string& text) {
  SettingsMap result;
  std::istringstream in(text);
  std::string line;
  std::string pending;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    std::string current = pending.empty() ? trim(line) : pending + trim(line);
    pending.clear();

    if (current.empty() || current[0] == '#' || current[0] == '!') {
      continue;
    }
    if (current.back() == '\\') {
      current.pop_back();
      pending = current;
      continue;
    }

    size_t sep = current.find_first_of("=:");
    if (sep == std::string::npos) {
      result[current] = "";
      continue;
    }
    std::string key = trim(current.substr(0, sep));
    if (key.empty()) {
      continue;
    }
    result[key] = trim(current.substr(sep + 1));
  }

  // Continuation on the last line
  if (!pending.empty()) {
    size_t sep = pending.find_first_of("=:");
    if (sep == std::string::npos) {
      result[pending] = "";
    } else if (std::string key = trim(pending.substr(0, sep)); !key.empty()) {
      result[key] = trim(pending.substr(sep + 1));
    }
  }
  return result;
}

SettingsMap parse_json_settings(const std::string& text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw SettingsLoadError(std::string("malformed JSON settings: ") + e.what());
  }
  if (!document.is_object()) {
    throw SettingsLoadError("JSON settings must be an object");
  }
  SettingsMap result;
  flatten(document, "", result);
  return result;
}

SettingsMap parse_command_line(const std::vector<std::string>& args) {
  SettingsMap result;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
      throw ConfigurationError("unexpected command-line argument '" + arg + "'");
    }

    std::string name = arg.substr(2);
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      std::string key = name.substr(0, eq);
      if (key.empty()) {
        throw ConfigurationError("unexpected command-line argument '" + arg + "'");
      }
      result[key] = name.substr(eq + 1);
      continue;
    }

    if (i + 1 < args.size() && args[i + 1].compare(0, 2, "--") != 0) {
      result[name] = args[++i];
    } else {
      result[name] = "true";
    }
  }
  return result;
}

std::vector<std::filesystem::path> default_settings_directories() {
  std::vector<std::filesystem::path> dirs{"/etc", "/opt/local/etc"};
  std::filesystem::path home = util::get_home_directory();
  if (!home.empty()) {
    dirs.push_back(home);
  }
  dirs.push_back(".");
  return dirs;
}

// ============================================================================
// SettingsBuilder
// ============================================================================

SettingsBuilder::SettingsBuilder(std::string base_name) : base_name_(std::move(base_name)) {}

SettingsBuilder& SettingsBuilder::add(const std::string& key, std::string value) {
  sources_.emplace_back(SettingsMap{{key, std::move(value)}});
  return *this;
}

SettingsBuilder& SettingsBuilder::add(const SettingsMap& values) {
  sources_.emplace_back(values);
  return *this;
}

SettingsBuilder& SettingsBuilder::add_default_locations() {
  return add_default_locations(default_settings_directories());
}

SettingsBuilder& SettingsBuilder::add_default_locations(std::vector<std::filesystem::path> directories) {
  for (const auto& dir : directories) {
    sources_.emplace_back(FileSource{dir / (base_name_ + ".properties"), false});
  }
  return *this;
}

SettingsBuilder& SettingsBuilder::add_file(const std::filesystem::path& path) {
  sources_.emplace_back(FileSource{path, true});
  return *this;
}

SettingsBuilder& SettingsBuilder::add_command_line(std::vector<std::string> args) {
  command_line_.insert(command_line_.end(), std::make_move_iterator(args.begin()),
                       std::make_move_iterator(args.end()));
  return *this;
}

Settings SettingsBuilder::build() const {
  SettingsMap values;

  for (const auto& source : sources_) {
    if (const auto* map = std::get_if<SettingsMap>(&source)) {
      merge(values, *map);
      continue;
    }

    const auto& file = std::get<FileSource>(source);
    std::error_code ec;
    if (!file.required && !std::filesystem::exists(file.path, ec)) {
      continue;
    }

    std::optional<std::string> text = util::read_text_file(file.path);
    if (!text) {
      if (file.required) {
        throw SettingsLoadError("cannot read settings file " + file.path.string());
      }
      LOG_SESSION_WARN("skipping unreadable settings file {}", file.path.string());
      continue;
    }

    SettingsMap parsed;
    if (file.path.extension() == ".json") {
      try {
        parsed = parse_json_settings(*text);
      } catch (const SettingsLoadError& e) {
        throw SettingsLoadError(file.path.string() + ": " + e.what());
      }
    } else {
      parsed = parse_properties(*text);
    }
    LOG_SESSION_DEBUG("loaded {} setting(s) from {}", parsed.size(), file.path.string());
    merge(values, parsed);
  }

  merge(values, parse_command_line(command_line_));
  return Settings(std::move(values));
}

}  // namespace session
}  // namespace skiff
