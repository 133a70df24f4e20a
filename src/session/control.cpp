// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/control.hpp"

#include <system_error>

namespace skiff {
namespace session {

ResourceGraph::~ResourceGraph() {
  release();
}

network::EventLoopGroup& ResourceGraph::add_group(std::string name, size_t threads) {
  groups_.push_back(std::make_unique<network::EventLoopGroup>(std::move(name), threads));
  return *groups_.back();
}

void ResourceGraph::start() {
  try {
    for (auto& group : groups_) {
      group->start();
    }
  } catch (const std::system_error& e) {
    release();
    throw IOError("cannot start event loop threads", e.code());
  }
}

void ResourceGraph::release() {
  if (released_) {
    return;
  }
  released_ = true;

  if (transport_) {
    transport_->stop();
  }
  for (auto it = groups_.rbegin(); it != groups_.rend(); ++it) {
    (*it)->stop();
  }
  // Connections still referenced by queued handlers go with the contexts
  transport_.reset();
  dispatcher_.reset();
}

}  // namespace session
}  // namespace skiff
