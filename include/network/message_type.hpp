// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace skiff {
namespace network {

// MessageType - dispatch key for a category of messages
//
// The id travels on the wire; the name only shows up in logs. Values are
// defined by the application, typically as constants next to the handlers:
//
//   inline const MessageType HELLO{1, "hello"};
class MessageType {
public:
  MessageType(uint16_t id, std::string name) : id_(id), name_(std::move(name)) {}

  uint16_t id() const { return id_; }
  const std::string& name() const { return name_; }

  std::string to_string() const { return name_ + "(" + std::to_string(id_) + ")"; }

  friend bool operator==(const MessageType& a, const MessageType& b) { return a.id_ == b.id_ && a.name_ == b.name_; }
  friend bool operator!=(const MessageType& a, const MessageType& b) { return !(a == b); }

private:
  uint16_t id_;
  std::string name_;
};

}  // namespace network
}  // namespace skiff

template <>
struct std::hash<skiff::network::MessageType> {
  std::size_t operator()(const skiff::network::MessageType& type) const noexcept {
    return std::hash<uint16_t>{}(type.id());
  }
};
