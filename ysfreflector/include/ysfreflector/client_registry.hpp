// Copyright (c) 2025 <Your Name>
/**
 * @file client_registry.hpp
 * @brief Concurrent registry of linked peers.
 *
 * The registry keeps a dense sequence of shared client records and an
 * index from identity key to sequence position. Both containers are
 * guarded by one reader/writer lock and are only ever updated together,
 * so a lookup never observes an index entry that points past the end of
 * the sequence or at another peer's record.
 *
 * Removal compacts the sequence by moving the last record into the freed
 * slot; the moved record's index entry is rewritten under the same
 * exclusive lock. Sequence order is therefore not stable across removals.
 *
 * The registry covers structural consistency only. Payloads attached to
 * records (ClientRecord::Extra) are shared with callers and are not
 * synchronized here.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ysfreflector/client_key.hpp"
#include "ysfreflector/client_record.hpp"
#include "ysfreflector/export.hpp"
#include "ysfreflector/log_sink.hpp"

namespace ysfreflector {

/**
 * @brief Thread-safe registry of ClientRecord instances.
 *
 * Thread-safe: every public method may be called concurrently from any
 * number of threads. Add/Remove/FindOrAdd are exclusive; Find/List/Size
 * share the lock.
 */
class YSF_REFLECTOR_API ClientRegistry {
 public:
  /** Outcome of Add(). */
  enum class AddResult {
    kAdded,     ///< New identity appended.
    kReplaced,  ///< Identity existed; the new record took its slot.
    kRejected,  ///< Null record, invalid key or unhealthy registry.
  };

  explicit ClientRegistry(LogCallback log_sink = nullptr);

  ClientRegistry(const ClientRegistry&) = delete;
  ClientRegistry& operator=(const ClientRegistry&) = delete;

  /**
   * @brief Inserts a record, replacing any record with the same key.
   *
   * A replaced record keeps no registration; callers still holding it see
   * a detached record.
   */
  AddResult Add(ClientRecordPtr record);

  /**
   * @brief Returns the registered record for record's key, inserting
   *        record first if the key is absent.
   * @param inserted Optional flag set to true when record was inserted.
   * @return The registered record, or nullptr if rejected.
   */
  ClientRecordPtr FindOrAdd(ClientRecordPtr record, bool* inserted = nullptr);

  /**
   * @brief Removes the record registered under record's key.
   * @return true if an entry was removed; false if the key was absent.
   */
  bool Remove(const ClientRecord& record);

  /** Removes by identity. Absent keys are a no-op returning false. */
  bool Remove(const ClientKey& key);

  /**
   * @brief Removes record only if it is still the one registered under
   *        its key.
   *
   * The comparison and the removal happen under one exclusive lock, so a
   * record that replaced record in the meantime is left alone.
   * @return true if record was removed.
   */
  bool RemoveIfCurrent(const ClientRecordPtr& record);

  /**
   * @brief Looks up a peer by address and port.
   * @return The shared record, or nullptr if absent or if the identity is
   *         malformed.
   */
  ClientRecordPtr Find(const std::string& address, int port) const;

  /** Looks up a peer by key. */
  ClientRecordPtr Find(const ClientKey& key) const;

  /** Point-in-time copy of all registered records. */
  std::vector<ClientRecordPtr> List() const;

  /** Number of registered records; 0 once the registry is unhealthy. */
  size_t Size() const;

  /**
   * @brief False once an internal inconsistency was detected.
   *
   * An unhealthy registry rejects mutations, reports every lookup as
   * absent and lists nothing.
   */
  bool Healthy() const;

  /**
   * @brief Verifies the index/sequence invariants.
   * @param error Optional description of the first violation.
   * @return true if every index entry maps to a record with the same key,
   *         no key repeats and every record is indexed.
   */
  bool CheckIntegrity(std::string* error = nullptr) const;

 private:
  friend class ClientRegistryTestPeer;

  using Index = std::unordered_map<ClientKey, size_t, ClientKeyHash>;

  /** Appends or replaces; requires the exclusive lock. */
  AddResult InsertLocked(ClientRecordPtr record);

  /** Removes the entry at it; requires the exclusive lock. */
  bool EraseLocked(Index::iterator it);

  /** Disables the registry; only touches the atomic flag. */
  void MarkCorrupted(const std::string& what) const;

  mutable std::shared_mutex mtx_;
  std::vector<ClientRecordPtr> clients_;
  Index index_;
  mutable std::atomic<bool> healthy_{true};
  LogCallback log_sink_;
};

}  // namespace ysfreflector
