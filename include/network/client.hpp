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
#include <unordered_map>

namespace skiff {
namespace network {

// Client - connecting endpoint
//
// Each connect() opens a new association with the client bootstrap. Messages
// arriving on it are dispatched to the session's handlers like on a server.
class Client : public std::enable_shared_from_this<Client> {
public:
  Client(std::shared_ptr<Transport> transport, std::shared_ptr<MessageDispatcher> dispatcher,
         ChannelBootstrap bootstrap, std::string host, uint16_t port);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Connect to the configured host and port.
  ConnectionPtr connect();

  // Throws IOError if the association cannot be established, and
  // SessionShutdownError after stop().
  ConnectionPtr connect(const std::string& host, uint16_t port);

  // Close every connection opened by this client. Further connects fail.
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  size_t connection_count() const;

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  const ChannelBootstrap& bootstrap() const { return bootstrap_; }

private:
  void on_connection_closed(uint64_t id);

  std::shared_ptr<Transport> transport_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  ChannelBootstrap bootstrap_;
  std::string host_;
  uint16_t port_;

  std::atomic<bool> running_{true};
  mutable std::mutex connections_mutex_;
  std::unordered_map<uint64_t, ConnectionPtr> connections_;
};

}  // namespace network
}  // namespace skiff
