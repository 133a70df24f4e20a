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

#include <nlohmann/json.hpp>

namespace skiff {
namespace network {

// Sender - fire-and-forget endpoint
//
// The first send() opens one association to the configured host and port
// using the client bootstrap; later sends reuse it, reopening it if the peer
// closed it. Replies are dispatched to the session's handlers.
class Sender {
public:
  Sender(std::shared_ptr<Transport> transport, std::shared_ptr<MessageDispatcher> dispatcher,
         ChannelBootstrap bootstrap, std::string host, uint16_t port);
  ~Sender();

  Sender(const Sender&) = delete;
  Sender& operator=(const Sender&) = delete;

  // Queue one message. Returns false once stopped or if the association
  // closed underneath; throws IOError if it cannot be opened and CodecError
  // if the body cannot be encoded.
  bool send(const MessageType& type, const nlohmann::json& body);

  void stop();

  bool is_connected() const;
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  const ChannelBootstrap& bootstrap() const { return bootstrap_; }

private:
  ConnectionPtr ensure_connection();

  std::shared_ptr<Transport> transport_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  ChannelBootstrap bootstrap_;
  std::string host_;
  uint16_t port_;

  std::atomic<bool> running_{true};
  mutable std::mutex mutex_;
  ConnectionPtr connection_;
};

}  // namespace network
}  // namespace skiff
