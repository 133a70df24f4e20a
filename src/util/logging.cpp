// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace skiff {
namespace util {

namespace {

constexpr std::array<const char*, 4> kComponents = {"default", "network", "session", "app"};

std::once_flag g_init_flag;
std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_initialized{false};

spdlog::level::level_enum ParseLevel(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"; only accept that for "off" itself
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

// Caller holds g_mutex.
void CreateLoggers(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  std::string file_error;
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  const auto level = ParseLevel(log_level);
  for (const char* component : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[component] = logger;
  }
  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers["default"]->error("cannot open log file {}: {}", log_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::call_once(g_init_flag, [&]() {
    std::lock_guard<std::mutex> lock(g_mutex);
    CreateLoggers(log_level, log_to_file, log_file_path);
  });
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    CreateLoggers("info", false, "");
  }
  auto it = g_loggers.find(name);
  if (it == g_loggers.end()) {
    it = g_loggers.find("default");
  }
  return it->second;
}

void LogManager::SetLogLevel(const std::string& level) {
  const auto parsed = ParseLevel(level);
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(parsed);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(ParseLevel(level));
  }
}

}  // namespace util
}  // namespace skiff
