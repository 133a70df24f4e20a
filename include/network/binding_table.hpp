// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "errors.hpp"
#include "network/message.hpp"
#include "network/message_type.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace skiff {
namespace network {

// Where a message came from.
struct MessageContext {
  std::string remote_address;
  uint16_t remote_port{0};
  bool inbound{false};
};

// MessageHandler - receives every message of the type it is bound to
//
// One instance per session serves all connections, so implementations must
// be thread-safe. A returned message is sent back on the same connection.
class MessageHandler {
public:
  virtual ~MessageHandler() = default;

  virtual std::optional<Message> handle(const Message& message, const MessageContext& context) = 0;
};

using HandlerFactory = std::function<std::unique_ptr<MessageHandler>()>;

// Enough to produce a handler later; nothing is constructed at bind time.
struct HandlerDescriptor {
  std::string name;
  HandlerFactory factory;
};

// Descriptor that default-constructs H.
template <typename H>
HandlerDescriptor handler_descriptor() {
  static_assert(std::is_base_of_v<MessageHandler, H>, "handler must derive from MessageHandler");
  static_assert(std::is_default_constructible_v<H>, "handler must be default-constructible");
  return HandlerDescriptor{typeid(H).name(), []() -> std::unique_ptr<MessageHandler> { return std::make_unique<H>(); }};
}

struct BindingEntry {
  MessageType type;
  HandlerDescriptor handler;
};

// Immutable view of a frozen BindingTable, handed to the dispatcher.
class BindingSnapshot {
public:
  explicit BindingSnapshot(std::vector<BindingEntry> entries);

  const HandlerDescriptor* find(const MessageType& type) const;

  // Lookup by wire id.
  const BindingEntry* find(uint16_t type_id) const;

  bool contains(const MessageType& type) const { return find(type) != nullptr; }

  // In bind order.
  const std::vector<BindingEntry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  std::vector<BindingEntry> entries_;
  std::unordered_map<uint16_t, size_t> by_id_;
};

// BindingTable - MessageType -> handler descriptor, one entry per type
//
// bind() throws DuplicateBindingError for a type (or wire id) that is already
// bound, and BuilderAlreadyBuiltError once the table has been frozen.
class BindingTable {
public:
  void bind(const MessageType& type, HandlerDescriptor handler);

  template <typename H>
  void bind(const MessageType& type) {
    bind(type, handler_descriptor<H>());
  }

  bool contains(const MessageType& type) const;
  size_t size() const { return entries_.size(); }
  bool frozen() const { return frozen_; }

  // Ends the table's mutable life. Repeated calls return equal snapshots.
  std::shared_ptr<const BindingSnapshot> freeze();

private:
  std::vector<BindingEntry> entries_;
  bool frozen_{false};
};

}  // namespace network
}  // namespace skiff
