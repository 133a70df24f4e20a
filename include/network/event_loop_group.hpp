// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

namespace skiff {
namespace network {

// Worker-thread count that means "pick for me".
constexpr int USE_PLATFORM_DEFAULT_THREADS = -1;

// 2 x hardware concurrency, at least 1.
size_t platform_default_threads();

// EventLoopGroup - one io_context served by a fixed number of threads
//
// start() spawns the threads; a work guard keeps them alive while idle.
// stop() is idempotent and joins every thread before returning, so it must
// not be called from one of the group's own threads. Before stopping the
// io_context it waits up to drain_timeout for outstanding work to finish, so
// closes already posted to a connection's strand still run.
class EventLoopGroup {
public:
  static constexpr std::chrono::milliseconds DEFAULT_DRAIN_TIMEOUT{2000};
  static constexpr std::chrono::milliseconds DRAIN_POLL_INTERVAL{5};

  EventLoopGroup(std::string name, size_t threads, std::chrono::milliseconds drain_timeout = DEFAULT_DRAIN_TIMEOUT);
  ~EventLoopGroup();

  EventLoopGroup(const EventLoopGroup&) = delete;
  EventLoopGroup& operator=(const EventLoopGroup&) = delete;

  void start();
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  asio::io_context& io_context() { return io_context_; }
  const std::string& name() const { return name_; }
  size_t thread_count() const { return thread_count_; }

private:
  std::string name_;
  size_t thread_count_;
  std::chrono::milliseconds drain_timeout_;
  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
};

}  // namespace network
}  // namespace skiff
