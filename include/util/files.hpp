// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace skiff {
namespace util {

// Files larger than this are refused by read_text_file.
constexpr std::uintmax_t MAX_SETTINGS_FILE_SIZE = 4 * 1024 * 1024;

// Read a whole file as text. Returns std::nullopt (and logs why) if the file
// cannot be opened, is not a regular file, or exceeds MAX_SETTINGS_FILE_SIZE.
std::optional<std::string> read_text_file(const std::filesystem::path& path);

// $HOME, or an empty path if HOME is unset.
std::filesystem::path get_home_directory();

}  // namespace util
}  // namespace skiff
