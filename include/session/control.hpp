// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "errors.hpp"
#include "network/event_loop_group.hpp"
#include "network/message_dispatcher.hpp"
#include "network/transport.hpp"
#include "session/session_config.hpp"
#include "util/logging.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace skiff {
namespace session {

// ResourceGraph - what a built endpoint runs on
//
// Event-loop groups, the transport and the dispatcher. release() stops the
// transport, then stops and joins the groups in reverse start order; each
// group first lets the closes already queued by the endpoint run. It is
// idempotent and must not be called from one of the groups' own threads.
class ResourceGraph {
public:
  ResourceGraph() = default;
  ~ResourceGraph();

  ResourceGraph(const ResourceGraph&) = delete;
  ResourceGraph& operator=(const ResourceGraph&) = delete;

  network::EventLoopGroup& add_group(std::string name, size_t threads);

  // Start every group. Throws IOError (after releasing) if a thread cannot
  // be created.
  void start();

  void release();

  void set_transport(std::shared_ptr<network::Transport> transport) { transport_ = std::move(transport); }
  void set_dispatcher(std::shared_ptr<network::MessageDispatcher> dispatcher) { dispatcher_ = std::move(dispatcher); }

  const std::vector<std::unique_ptr<network::EventLoopGroup>>& groups() const { return groups_; }
  const std::shared_ptr<network::Transport>& transport() const { return transport_; }
  const std::shared_ptr<network::MessageDispatcher>& dispatcher() const { return dispatcher_; }

  bool is_released() const { return released_; }

private:
  std::vector<std::unique_ptr<network::EventLoopGroup>> groups_;
  std::shared_ptr<network::Transport> transport_;
  std::shared_ptr<network::MessageDispatcher> dispatcher_;
  bool released_{false};
};

/**
 * Control - lifecycle handle for a built endpoint
 *
 * Owns the role object T (Server, Client or Sender) and the resource graph
 * that runs it. shutdown() stops the endpoint and releases the graph exactly
 * once, however many threads call it; the destructor calls it too.
 *
 * get() returns the same object on every call until shutdown, then throws
 * SessionShutdownError. The object itself stays alive until the Control is
 * destroyed, so references taken earlier do not dangle. Connections handed
 * out by the endpoint must not outlive the Control.
 */
template <typename T>
class Control {
public:
  Control(std::shared_ptr<T> endpoint, std::shared_ptr<const SessionConfig> config,
          std::unique_ptr<ResourceGraph> resources)
      : resources_(std::move(resources)), config_(std::move(config)), endpoint_(std::move(endpoint)) {}

  ~Control() { shutdown(); }

  Control(const Control&) = delete;
  Control& operator=(const Control&) = delete;

  T& get() {
    if (shutdown_.load(std::memory_order_acquire)) {
      throw SessionShutdownError("session has been shut down");
    }
    return *endpoint_;
  }

  const SessionConfig& config() const { return *config_; }
  std::shared_ptr<const SessionConfig> shared_config() const { return config_; }

  void shutdown() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    LOG_SESSION_DEBUG("shutting down {} session", network::role_name(config_->role));
    if (endpoint_) {
      endpoint_->stop();
    }
    if (resources_) {
      resources_->release();
    }
    LOG_SESSION_INFO("{} session shut down", network::role_name(config_->role));
  }

  bool is_shutdown() const { return shutdown_.load(std::memory_order_acquire); }

private:
  // Declared first so the event loops outlive the endpoint's sockets
  std::unique_ptr<ResourceGraph> resources_;
  std::shared_ptr<const SessionConfig> config_;
  std::shared_ptr<T> endpoint_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace session
}  // namespace skiff
