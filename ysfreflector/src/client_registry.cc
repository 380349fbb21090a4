// Copyright (c) 2025 <Your Name>
/**
 * @file client_registry.cc
 * @brief ClientRegistry implementation (vector + hash index, swap-remove).
 */
#include "ysfreflector/client_registry.hpp"

#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ysfreflector {

ClientRegistry::ClientRegistry(LogCallback log_sink)
    : log_sink_(std::move(log_sink)) {}

ClientRegistry::AddResult ClientRegistry::Add(ClientRecordPtr record) {
  if (!record || !record->Key().IsValid()) return AddResult::kRejected;
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return AddResult::kRejected;
  return InsertLocked(std::move(record));
}

ClientRecordPtr ClientRegistry::FindOrAdd(ClientRecordPtr record,
                                          bool* inserted) {
  if (inserted) *inserted = false;
  if (!record || !record->Key().IsValid()) return nullptr;
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return nullptr;

  auto it = index_.find(record->Key());
  if (it != index_.end()) {
    if (it->second >= clients_.size() ||
        clients_[it->second]->Key() != record->Key()) {
      MarkCorrupted("stale index for " + record->Key().ToString());
      return nullptr;
    }
    return clients_[it->second];
  }
  if (InsertLocked(record) == AddResult::kRejected) return nullptr;
  if (inserted) *inserted = true;
  return record;
}

bool ClientRegistry::Remove(const ClientRecord& record) {
  return Remove(record.Key());
}

bool ClientRegistry::Remove(const ClientKey& key) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return false;
  auto it = index_.find(key);
  if (it == index_.end()) return false;
  return EraseLocked(it);
}

bool ClientRegistry::RemoveIfCurrent(const ClientRecordPtr& record) {
  if (!record) return false;
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return false;
  auto it = index_.find(record->Key());
  if (it == index_.end()) return false;
  if (it->second < clients_.size() && clients_[it->second] != record) {
    return false;
  }
  return EraseLocked(it);
}

ClientRecordPtr ClientRegistry::Find(const std::string& address,
                                     int port) const {
  ClientKey key;
  if (!ClientKey::FromParts(address, port, &key)) return nullptr;
  return Find(key);
}

ClientRecordPtr ClientRegistry::Find(const ClientKey& key) const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return nullptr;
  auto it = index_.find(key);
  if (it == index_.end()) return nullptr;
  if (it->second >= clients_.size() || clients_[it->second]->Key() != key) {
    MarkCorrupted("stale index for " + key.ToString());
    return nullptr;
  }
  return clients_[it->second];
}

std::vector<ClientRecordPtr> ClientRegistry::List() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return {};
  return clients_;
}

size_t ClientRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  if (!healthy_.load()) return 0;
  return clients_.size();
}

bool ClientRegistry::Healthy() const { return healthy_.load(); }

bool ClientRegistry::CheckIntegrity(std::string* error) const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  auto fail = [error](const std::string& text) {
    if (error) *error = text;
    return false;
  };

  if (index_.size() != clients_.size()) {
    std::ostringstream oss;
    oss << "index size " << index_.size() << " != client count "
        << clients_.size();
    return fail(oss.str());
  }
  for (const auto& entry : index_) {
    if (entry.second >= clients_.size()) {
      std::ostringstream oss;
      oss << "stale index for " << entry.first.ToString() << ": "
          << entry.second;
      return fail(oss.str());
    }
    if (!clients_[entry.second] ||
        clients_[entry.second]->Key() != entry.first) {
      return fail("index for " + entry.first.ToString() +
                  " points at another record");
    }
  }
  std::unordered_set<ClientKey, ClientKeyHash> seen;
  for (const auto& c : clients_) {
    if (!seen.insert(c->Key()).second) {
      return fail("duplicate identity " + c->Key().ToString());
    }
    if (index_.find(c->Key()) == index_.end()) {
      return fail("orphaned record " + c->Key().ToString());
    }
  }
  return true;
}

ClientRegistry::AddResult ClientRegistry::InsertLocked(
    ClientRecordPtr record) {
  auto it = index_.find(record->Key());
  if (it != index_.end()) {
    if (it->second >= clients_.size() ||
        clients_[it->second]->Key() != record->Key()) {
      MarkCorrupted("stale index for " + record->Key().ToString());
      return AddResult::kRejected;
    }
    clients_[it->second] = std::move(record);
    return AddResult::kReplaced;
  }
  index_.emplace(record->Key(), clients_.size());
  clients_.push_back(std::move(record));
  return AddResult::kAdded;
}

bool ClientRegistry::EraseLocked(Index::iterator it) {
  const size_t pos = it->second;
  if (pos >= clients_.size() || clients_[pos]->Key() != it->first) {
    MarkCorrupted("stale index for " + it->first.ToString());
    return false;
  }

  const size_t last = clients_.size() - 1;
  if (pos != last) {
    auto moved = index_.find(clients_[last]->Key());
    if (moved == index_.end() || moved->second != last) {
      MarkCorrupted("orphaned record " + clients_[last]->Key().ToString());
      return false;
    }
    clients_[pos] = std::move(clients_[last]);
    moved->second = pos;
  }
  clients_.pop_back();
  index_.erase(it);
  return true;
}

void ClientRegistry::MarkCorrupted(const std::string& what) const {
  if (!healthy_.exchange(false)) return;
  if (log_sink_) {
    log_sink_("[ERROR Registry] integrity violation: " + what +
              "; registry disabled");
  }
}

}  // namespace ysfreflector
