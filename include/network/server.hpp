// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/channel_bootstrap.hpp"
#include "network/connection.hpp"
#include "network/message_dispatcher.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>

namespace skiff {
namespace network {

// Server - listening endpoint
//
// Every accepted association becomes a Connection dispatching into the
// session's handlers. stop() closes the listener and every live connection;
// it does not stop the event loops, which belong to the session.
class Server : public std::enable_shared_from_this<Server> {
public:
  Server(std::shared_ptr<Transport> transport, std::shared_ptr<MessageDispatcher> dispatcher,
         ChannelBootstrap bootstrap, std::string host, uint16_t port);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Bind and listen. Returns the transport's error on failure.
  std::error_code start();
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

  // Bound port, which differs from port() when port 0 was requested.
  uint16_t local_port() const;

  size_t connection_count() const;

  const ChannelBootstrap& bootstrap() const { return bootstrap_; }
  const MessageDispatcher& dispatcher() const { return *dispatcher_; }

private:
  void on_accept(TransportConnectionPtr transport_connection);
  void on_connection_closed(uint64_t id);

  std::shared_ptr<Transport> transport_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  ChannelBootstrap bootstrap_;
  std::string host_;
  uint16_t port_;

  std::atomic<bool> running_{false};
  mutable std::mutex connections_mutex_;
  std::unordered_map<uint64_t, ConnectionPtr> connections_;
};

}  // namespace network
}  // namespace skiff
