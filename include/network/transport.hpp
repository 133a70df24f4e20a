// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/channel_bootstrap.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <asio/io_context.hpp>

namespace skiff {
namespace network {

// TransportConnection - one established association
//
// Callbacks run on the connection's strand; receive callbacks for one
// connection never run concurrently.
class TransportConnection {
public:
  using ReceiveCallback = std::function<void(const std::vector<uint8_t>&)>;
  using DisconnectCallback = std::function<void()>;

  virtual ~TransportConnection() = default;

  // Begin reading. Callbacks should be installed first.
  virtual void start() = 0;

  // Queue bytes for writing. Returns false if the connection is closed.
  virtual bool send(const std::vector<uint8_t>& data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Transport - opens listening and connecting endpoints
//
// Errors are reported as error codes; the session layer turns them into
// IOError at the API boundary.
class Transport {
public:
  using AcceptCallback = std::function<void(TransportConnectionPtr)>;

  virtual ~Transport() = default;

  // Bind host:port with the bootstrap's options and start accepting.
  virtual std::error_code listen(const std::string& host, uint16_t port, const ChannelBootstrap& bootstrap,
                                 AcceptCallback on_accept) = 0;

  // Blocking connect bounded by bootstrap.connect_timeout(). Must not be called
  // from one of the transport's event loop threads. Returns nullptr and sets
  // ec on failure.
  virtual TransportConnectionPtr connect(const std::string& host, uint16_t port, const ChannelBootstrap& bootstrap,
                                         std::error_code& ec) = 0;

  // Stop accepting. Idempotent; established connections are left alone.
  virtual void stop() = 0;

  // Bound port while listening (resolves port 0), otherwise 0.
  virtual uint16_t listening_port() const = 0;
};

// Creates the transport for a session. acceptor_context runs the listening
// socket, io_context runs established connections (the same context for
// clients and senders).
using TransportFactory =
    std::function<std::shared_ptr<Transport>(asio::io_context& acceptor_context, asio::io_context& io_context)>;

// Factory for SctpTransport.
TransportFactory sctp_transport_factory();

}  // namespace network
}  // namespace skiff
