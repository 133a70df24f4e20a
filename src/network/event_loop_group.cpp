// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/event_loop_group.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

namespace skiff {
namespace network {

size_t platform_default_threads() {
  return std::max<size_t>(1, 2 * static_cast<size_t>(std::thread::hardware_concurrency()));
}

EventLoopGroup::EventLoopGroup(std::string name, size_t threads, std::chrono::milliseconds drain_timeout)
    : name_(std::move(name)), thread_count_(std::max<size_t>(1, threads)), drain_timeout_(drain_timeout) {}

EventLoopGroup::~EventLoopGroup() {
  stop();
}

void EventLoopGroup::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return;
  }

  io_context_.restart();
  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));

  try {
    for (size_t i = 0; i < thread_count_; ++i) {
      threads_.emplace_back([this]() { io_context_.run(); });
    }
  } catch (const std::system_error& e) {
    // Thread creation failed: unwind the threads that did start
    LOG_NET_ERROR("{}: failed to start event loop thread: {}", name_, e.what());
    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    threads_.clear();
    throw;
  }

  running_.store(true, std::memory_order_release);
  LOG_NET_DEBUG("{}: started {} event loop thread(s)", name_, thread_count_);
}

void EventLoopGroup::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  running_.store(false, std::memory_order_release);

  if (work_guard_) {
    work_guard_.reset();
  }

  // Let queued handlers (closes posted to connection strands, their disconnect
  // notifications) run before the loop is forced down. run() returns by itself
  // once nothing is outstanding.
  const auto deadline = std::chrono::steady_clock::now() + drain_timeout_;
  while (!io_context_.stopped() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(DRAIN_POLL_INTERVAL);
  }
  if (!io_context_.stopped()) {
    LOG_NET_DEBUG("{}: work still pending after {} ms, stopping anyway", name_,
                  std::chrono::duration_cast<std::chrono::milliseconds>(drain_timeout_).count());
  }
  io_context_.stop();

  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  LOG_NET_DEBUG("{}: stopped", name_);
}

}  // namespace network
}  // namespace skiff
