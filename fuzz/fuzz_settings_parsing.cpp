// Fuzz target for settings parsers
// Runs properties, JSON and command-line parsing on arbitrary input
//
// Settings files and arguments come from outside the process. Bugs can cause:
// - Out-of-bounds access on continuation lines and separators
// - Unbounded recursion flattening deeply nested JSON
// - Crashes on typed lookups of malformed values
//
// Target code:
// - src/session/settings.cpp (parse_properties, parse_json_settings,
//   parse_command_line, Settings::get_int, Settings::get_bool)

#include "errors.hpp"
#include "session/settings.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace skiff;
using namespace skiff::session;

namespace {

void exercise_typed_lookups(const SettingsMap& values) {
    Settings settings(values);
    for (const auto& key : settings.keys()) {
        try {
            (void)settings.get_int(key);
        } catch (const ConfigurationError&) {
        }
        try {
            (void)settings.get_bool(key);
        } catch (const ConfigurationError&) {
        }
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string text(reinterpret_cast<const char*>(data), size);

    exercise_typed_lookups(parse_properties(text));

    try {
        exercise_typed_lookups(parse_json_settings(text));
    } catch (const SettingsLoadError&) {
        // Malformed JSON is expected
    }

    // Split on NUL into argv-style tokens
    std::vector<std::string> args;
    std::string current;
    for (char c : text) {
        if (c == '\0') {
            args.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    args.push_back(current);

    try {
        SettingsMap values = parse_command_line(args);
        for (const auto& [key, value] : values) {
            if (key.empty()) {
                __builtin_trap();
            }
        }
    } catch (const ConfigurationError&) {
        // Stray tokens are expected
    }
    return 0;
}
