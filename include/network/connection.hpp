// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace skiff {
namespace network {

class Connection;
using ConnectionPtr = std::shared_ptr<Connection>;

// Connection - message-level view of one association
//
// Reassembles frames from the transport's byte stream, hands them to the
// session's dispatcher and writes handler replies back on the same
// association. A frame that cannot be decoded closes the connection.
//
// Threading Model:
// - Receive processing runs on the transport connection's strand, so the
//   frame decoder is never touched concurrently
// - send() and close() may be called from any thread
//
// Connection is single-use: start() runs at most once, and a closed
// connection is never reopened.
class Connection : public std::enable_shared_from_this<Connection> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  using ClosedHandler = std::function<void(uint64_t id)>;

  static ConnectionPtr create(TransportConnectionPtr transport, std::shared_ptr<MessageDispatcher> dispatcher);

  Connection(PrivateTag, uint64_t id, TransportConnectionPtr transport, std::shared_ptr<MessageDispatcher> dispatcher);

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Install callbacks and begin reading. on_closed runs once when the
  // association goes away, whichever side closed it.
  void start(ClosedHandler on_closed = nullptr);

  // Encode and queue a message. Returns false if the connection is closed;
  // throws CodecError if the body cannot be encoded.
  bool send(const Message& message);

  // Queue a frame already produced by encode_message() for this connection's
  // encoding. type is only used for logging.
  bool send_encoded(const MessageType& type, const std::vector<uint8_t>& frame);

  void close();

  bool is_open() const;

  uint64_t id() const { return id_; }
  const MessageContext& context() const { return context_; }
  Encoding encoding() const { return dispatcher_->encoding(); }

  uint64_t messages_received() const { return messages_received_.load(std::memory_order_relaxed); }
  uint64_t messages_sent() const { return messages_sent_.load(std::memory_order_relaxed); }

private:
  void on_transport_receive(const std::vector<uint8_t>& data);
  void on_transport_disconnect();

  const uint64_t id_;
  TransportConnectionPtr transport_;
  std::shared_ptr<MessageDispatcher> dispatcher_;
  MessageContext context_;

  FrameDecoder decoder_;
  ClosedHandler on_closed_;
  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};

  std::atomic<uint64_t> messages_received_{0};
  std::atomic<uint64_t> messages_sent_{0};

  static std::atomic<uint64_t> next_id_;
};

}  // namespace network
}  // namespace skiff
