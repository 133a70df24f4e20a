// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/sctp_protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <queue>

#include <asio.hpp>
#include <asio/any_io_executor.hpp>
#include <asio/strand.hpp>

namespace skiff {
namespace network {

// Bytes a connection may have queued for writing before the peer is treated
// as a slow reader and disconnected. Large enough for several maximum frames.
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 64 * 1024 * 1024;

// SctpConnection - one-to-one SCTP association behind TransportConnection
class SctpConnection : public TransportConnection, public std::enable_shared_from_this<SctpConnection> {
public:
  // Wrap an already connected socket.
  static std::shared_ptr<SctpConnection> create(asio::io_context& io_context, sctp::socket socket, bool is_inbound);

  ~SctpConnection() override = default;

  SctpConnection(const SctpConnection&) = delete;
  SctpConnection& operator=(const SctpConnection&) = delete;

  void start() override;
  bool send(const std::vector<uint8_t>& data) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  bool is_inbound() const override { return is_inbound_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

  // Test-only override for the send queue limit (0 = default)
  static void set_send_queue_limit_for_test(size_t bytes);

private:
  SctpConnection(asio::io_context& io_context, sctp::socket socket, bool is_inbound);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void deliver_disconnect_once();

  asio::io_context& io_context_;
  sctp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  bool is_inbound_;

  // Accessed only on strand_
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  std::atomic<bool> writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 256 * 1024;
  static std::atomic<size_t> send_queue_limit_override_bytes_;

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

// SctpTransport - asio implementation of Transport over SCTP
//
// The listening socket runs on acceptor_context; accepted and outbound
// associations run on io_context. Both contexts are driven by the caller and
// must outlive the transport.
class SctpTransport : public Transport {
public:
  SctpTransport(asio::io_context& acceptor_context, asio::io_context& io_context);
  ~SctpTransport() override;

  std::error_code listen(const std::string& host, uint16_t port, const ChannelBootstrap& bootstrap,
                         AcceptCallback on_accept) override;

  TransportConnectionPtr connect(const std::string& host, uint16_t port, const ChannelBootstrap& bootstrap,
                                 std::error_code& ec) override;

  void stop() override;

  uint16_t listening_port() const override { return listen_port_.load(std::memory_order_acquire); }

private:
  // Literal addresses map directly; names go through the resolver.
  std::vector<sctp::endpoint> resolve(const std::string& host, uint16_t port, std::error_code& ec);

  std::shared_ptr<SctpConnection> connect_endpoint(const sctp::endpoint& endpoint, const ChannelBootstrap& bootstrap,
                                                   std::error_code& ec);

  void start_accept();
  void handle_accept(const asio::error_code& ec, const std::shared_ptr<sctp::socket>& socket);

  asio::io_context& acceptor_context_;
  asio::io_context& io_context_;

  std::mutex acceptor_mutex_;
  std::unique_ptr<sctp::acceptor> acceptor_;
  std::shared_ptr<ChannelBootstrap> accept_bootstrap_;
  AcceptCallback accept_callback_;
  std::atomic<uint16_t> listen_port_{0};
};

}  // namespace network
}  // namespace skiff
