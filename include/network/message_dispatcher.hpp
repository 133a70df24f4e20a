// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef SKIFF_NETWORK_MESSAGE_DISPATCHER_HPP
#define SKIFF_NETWORK_MESSAGE_DISPATCHER_HPP

#include "network/binding_table.hpp"
#include "network/message.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace skiff {
namespace network {

// Receives exceptions thrown by handlers. Returns true to keep the connection
// open, false to close it.
using ErrorHandler = std::function<bool(const Message&, const MessageContext&, const std::exception&)>;

// Logs the failure and closes the connection.
ErrorHandler default_error_handler();

enum class DispatchStatus {
  Handled,        // handler ran (reply may or may not be set)
  Unbound,        // no binding for the wire id; message dropped
  HandlerFailed,  // handler could not be produced or threw
};

struct DispatchResult {
  DispatchStatus status{DispatchStatus::Unbound};
  std::optional<Message> reply;
  bool keep_open{true};
};

/**
 * MessageDispatcher - routes decoded frames to bound handlers
 *
 * Design:
 * - Built from a frozen BindingSnapshot; bindings never change afterwards
 * - Each descriptor is resolved on the first message of its type and the
 *   handler instance is reused for the rest of the session
 * - Thread-safe: connections on different worker threads dispatch concurrently
 *
 * Ownership Model:
 * - Resolved handlers are owned by the dispatcher and released with it
 */
class MessageDispatcher {
public:
  MessageDispatcher(std::shared_ptr<const BindingSnapshot> bindings, Encoding encoding,
                    ErrorHandler error_handler = nullptr);

  MessageDispatcher(const MessageDispatcher&) = delete;
  MessageDispatcher& operator=(const MessageDispatcher&) = delete;

  // Decodes the payload and dispatches it. Throws CodecError if the payload
  // cannot be decoded; the caller should drop the connection.
  DispatchResult dispatch(const Frame& frame, const MessageContext& context);

  DispatchResult dispatch(const Message& message, const MessageContext& context);

  bool has_handler(const MessageType& type) const { return bindings_->contains(type); }

  // Bound types, in bind order.
  std::vector<MessageType> registered_types() const;

  // Number of descriptors resolved to live handlers so far.
  size_t resolved_count() const;

  Encoding encoding() const { return encoding_; }
  const BindingSnapshot& bindings() const { return *bindings_; }

private:
  std::shared_ptr<MessageHandler> resolve(const BindingEntry& entry);

  std::shared_ptr<const BindingSnapshot> bindings_;
  Encoding encoding_;
  ErrorHandler error_handler_;

  mutable std::mutex mutex_;
  std::unordered_map<uint16_t, std::shared_ptr<MessageHandler>> handlers_;
};

}  // namespace network
}  // namespace skiff

#endif  // SKIFF_NETWORK_MESSAGE_DISPATCHER_HPP
