// Copyright (c) 2025 <Your Name>
/**
 * @file client_registry_test_peer.hpp
 * @brief Test access to ClientRegistry internals.
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <shared_mutex>

#include "ysfreflector/client_registry.hpp"

namespace ysfreflector {

class ClientRegistryTestPeer {
 public:
  /** Points key's index entry at pos; returns false if key is absent. */
  static bool RedirectIndex(ClientRegistry* registry, const ClientKey& key,
                            size_t pos) {
    std::unique_lock<std::shared_mutex> lock(registry->mtx_);
    auto it = registry->index_.find(key);
    if (it == registry->index_.end()) return false;
    it->second = pos;
    return true;
  }

  /** Record stored at sequence position pos, bypassing health checks. */
  static ClientRecordPtr RecordAt(ClientRegistry* registry, size_t pos) {
    std::shared_lock<std::shared_mutex> lock(registry->mtx_);
    if (pos >= registry->clients_.size()) return nullptr;
    return registry->clients_[pos];
  }
};

}  // namespace ysfreflector
