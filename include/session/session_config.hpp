// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/binding_table.hpp"
#include "network/channel_option.hpp"
#include "network/message.hpp"
#include "session/settings.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace skiff {
namespace session {

// Everything a build resolved, frozen. Shared read-only by the role object,
// the Control handle and anyone who asks for it.
struct SessionConfig {
  std::string settings_name;
  Settings settings;
  network::ScopedOptions options;
  std::shared_ptr<const network::BindingSnapshot> bindings;

  std::string host;
  uint16_t port{0};
  int acceptor_threads{1};
  int worker_threads{-1};  // -1 = platform default
  network::Encoding encoding{network::Encoding::Binary};
  network::Role role{network::Role::Server};

  // worker_threads with the platform default resolved.
  size_t effective_worker_threads() const;
};

}  // namespace session
}  // namespace skiff
