// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection.hpp"

#include "errors.hpp"
#include "util/logging.hpp"

namespace skiff {
namespace network {

std::atomic<uint64_t> Connection::next_id_{1};

ConnectionPtr Connection::create(TransportConnectionPtr transport, std::shared_ptr<MessageDispatcher> dispatcher) {
  return std::make_shared<Connection>(PrivateTag{}, next_id_++, std::move(transport), std::move(dispatcher));
}

Connection::Connection(PrivateTag, uint64_t id, TransportConnectionPtr transport,
                       std::shared_ptr<MessageDispatcher> dispatcher)
    : id_(id), transport_(std::move(transport)), dispatcher_(std::move(dispatcher)) {
  context_.remote_address = transport_->remote_address();
  context_.remote_port = transport_->remote_port();
  context_.inbound = transport_->is_inbound();
}

void Connection::start(ClosedHandler on_closed) {
  if (started_.exchange(true)) {
    LOG_NET_WARN("connection {} already started", id_);
    return;
  }
  on_closed_ = std::move(on_closed);

  // Callbacks hold the connection alive until the transport drops them on close
  auto self = shared_from_this();
  transport_->set_receive_callback([self](const std::vector<uint8_t>& data) { self->on_transport_receive(data); });
  transport_->set_disconnect_callback([self]() { self->on_transport_disconnect(); });
  transport_->start();

  LOG_NET_DEBUG("connection {} {} {}:{} started", id_, context_.inbound ? "from" : "to", context_.remote_address,
                context_.remote_port);
}

bool Connection::send(const Message& message) {
  if (!is_open()) {
    return false;
  }
  return send_encoded(message.type, encode_message(message, dispatcher_->encoding()));
}

bool Connection::send_encoded(const MessageType& type, const std::vector<uint8_t>& frame) {
  if (!is_open() || !transport_->send(frame)) {
    return false;
  }
  messages_sent_.fetch_add(1, std::memory_order_relaxed);
  LOG_NET_TRACE("sent {} ({} bytes) on connection {}", type.to_string(), frame.size(), id_);
  return true;
}

void Connection::close() {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }
  LOG_NET_DEBUG("closing connection {} ({}:{})", id_, context_.remote_address, context_.remote_port);
  transport_->close();
}

bool Connection::is_open() const {
  return !closed_.load(std::memory_order_acquire) && transport_->is_open();
}

void Connection::on_transport_receive(const std::vector<uint8_t>& data) {
  std::vector<Frame> frames;
  try {
    frames = decoder_.feed(data.data(), data.size());
  } catch (const CodecError& e) {
    LOG_NET_WARN_RL("bad frame from {}:{}, closing: {}", context_.remote_address, context_.remote_port, e.what());
    close();
    return;
  }

  for (const auto& frame : frames) {
    messages_received_.fetch_add(1, std::memory_order_relaxed);

    DispatchResult result;
    try {
      result = dispatcher_->dispatch(frame, context_);
    } catch (const CodecError& e) {
      LOG_NET_WARN_RL("undecodable payload from {}:{}, closing: {}", context_.remote_address, context_.remote_port,
                      e.what());
      close();
      return;
    }

    if (result.reply) {
      try {
        send(*result.reply);
      } catch (const CodecError& e) {
        LOG_NET_ERROR("cannot encode reply {} for {}:{}: {}", result.reply->type.to_string(), context_.remote_address,
                      context_.remote_port, e.what());
      }
    }

    if (!result.keep_open) {
      close();
      return;
    }
  }
}

void Connection::on_transport_disconnect() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  LOG_NET_DEBUG("connection {} ({}:{}) closed", id_, context_.remote_address, context_.remote_port);

  ClosedHandler on_closed = std::move(on_closed_);
  on_closed_ = nullptr;
  if (on_closed) {
    on_closed(id_);
  }
}

}  // namespace network
}  // namespace skiff
