// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"

#include "util/logging.hpp"

namespace skiff {
namespace network {

ErrorHandler default_error_handler() {
  return [](const Message& message, const MessageContext& context, const std::exception& error) {
    LOG_NET_ERROR("handler for {} from {}:{} failed: {}", message.type.to_string(), context.remote_address,
                  context.remote_port, error.what());
    return false;
  };
}

MessageDispatcher::MessageDispatcher(std::shared_ptr<const BindingSnapshot> bindings, Encoding encoding,
                                     ErrorHandler error_handler)
    : bindings_(std::move(bindings)),
      encoding_(encoding),
      error_handler_(error_handler ? std::move(error_handler) : default_error_handler()) {
  if (!bindings_) {
    bindings_ = std::make_shared<const BindingSnapshot>(std::vector<BindingEntry>{});
  }
}

DispatchResult MessageDispatcher::dispatch(const Frame& frame, const MessageContext& context) {
  const BindingEntry* entry = bindings_->find(frame.type_id);
  if (entry == nullptr) {
    LOG_NET_WARN_RL("dropping message with unbound type id {} from {}:{}", frame.type_id, context.remote_address,
                    context.remote_port);
    return DispatchResult{DispatchStatus::Unbound, std::nullopt, true};
  }

  Message message(entry->type, decode_body(frame.payload.data(), frame.payload.size(), encoding_));
  return dispatch(message, context);
}

DispatchResult MessageDispatcher::dispatch(const Message& message, const MessageContext& context) {
  const BindingEntry* entry = bindings_->find(message.type.id());
  if (entry == nullptr || entry->type != message.type) {
    LOG_NET_WARN_RL("no handler bound for {} from {}:{}", message.type.to_string(), context.remote_address,
                    context.remote_port);
    return DispatchResult{DispatchStatus::Unbound, std::nullopt, true};
  }

  try {
    std::shared_ptr<MessageHandler> handler = resolve(*entry);
    LOG_NET_TRACE("dispatching {} to {}", message.type.to_string(), entry->handler.name);
    return DispatchResult{DispatchStatus::Handled, handler->handle(message, context), true};
  } catch (const std::exception& e) {
    bool keep_open = false;
    try {
      keep_open = error_handler_(message, context, e);
    } catch (const std::exception& nested) {
      LOG_NET_ERROR("error handler threw while handling {}: {}", message.type.to_string(), nested.what());
    }
    return DispatchResult{DispatchStatus::HandlerFailed, std::nullopt, keep_open};
  }
}

std::shared_ptr<MessageHandler> MessageDispatcher::resolve(const BindingEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handlers_.find(entry.type.id());
  if (it != handlers_.end()) {
    return it->second;
  }

  std::shared_ptr<MessageHandler> handler = entry.handler.factory();
  if (!handler) {
    throw ConfigurationError("factory for " + entry.handler.name + " produced no handler");
  }
  LOG_NET_DEBUG("resolved {} for {}", entry.handler.name, entry.type.to_string());
  handlers_.emplace(entry.type.id(), handler);
  return handler;
}

std::vector<MessageType> MessageDispatcher::registered_types() const {
  std::vector<MessageType> types;
  types.reserve(bindings_->size());
  for (const auto& entry : bindings_->entries()) {
    types.push_back(entry.type);
  }
  return types;
}

size_t MessageDispatcher::resolved_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

}  // namespace network
}  // namespace skiff
