// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/binding_table.hpp"

#include <algorithm>

namespace skiff {
namespace network {

BindingSnapshot::BindingSnapshot(std::vector<BindingEntry> entries) : entries_(std::move(entries)) {
  for (size_t i = 0; i < entries_.size(); ++i) {
    by_id_.emplace(entries_[i].type.id(), i);
  }
}

const HandlerDescriptor* BindingSnapshot::find(const MessageType& type) const {
  const BindingEntry* entry = find(type.id());
  if (entry == nullptr || entry->type != type) {
    return nullptr;
  }
  return &entry->handler;
}

const BindingEntry* BindingSnapshot::find(uint16_t type_id) const {
  auto it = by_id_.find(type_id);
  return it == by_id_.end() ? nullptr : &entries_[it->second];
}

void BindingTable::bind(const MessageType& type, HandlerDescriptor handler) {
  if (frozen_) {
    throw BuilderAlreadyBuiltError();
  }
  if (!handler.factory) {
    throw ConfigurationError("empty handler factory for " + type.to_string());
  }

  for (const auto& entry : entries_) {
    if (entry.type == type) {
      throw DuplicateBindingError(type.to_string() + " was already registered for " + entry.handler.name);
    }
    // The id is what the dispatcher sees on the wire
    if (entry.type.id() == type.id()) {
      throw DuplicateBindingError(type.to_string() + " reuses the wire id of " + entry.type.to_string());
    }
  }
  entries_.push_back(BindingEntry{type, std::move(handler)});
}

bool BindingTable::contains(const MessageType& type) const {
  return std::any_of(entries_.begin(), entries_.end(), [&type](const BindingEntry& e) { return e.type == type; });
}

std::shared_ptr<const BindingSnapshot> BindingTable::freeze() {
  frozen_ = true;
  return std::make_shared<const BindingSnapshot>(entries_);
}

}  // namespace network
}  // namespace skiff
