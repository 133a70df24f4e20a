// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace skiff {
namespace util {

std::optional<std::string> read_text_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    LOG_DEBUG("read_text_file: {} is not a regular file{}", path.string(), ec ? ": " + ec.message() : "");
    return std::nullopt;
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_ERROR("read_text_file: Failed to get file size for {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > MAX_SETTINGS_FILE_SIZE) {
    LOG_ERROR("read_text_file: File {} exceeds max size limit ({} > {} bytes)", path.string(), size,
              MAX_SETTINGS_FILE_SIZE);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    LOG_ERROR("read_text_file: Failed to open file {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    LOG_ERROR("read_text_file: Failed to read {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }
  return contents.str();
}

std::filesystem::path get_home_directory() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return {};
  }
  return std::filesystem::path(home);
}

}  // namespace util
}  // namespace skiff
