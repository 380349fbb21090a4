// Copyright (c) 2025 <Your Name>
/**
 * @file client_record.hpp
 * @brief Shared record describing one linked peer.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "ysfreflector/client_key.hpp"
#include "ysfreflector/export.hpp"

namespace ysfreflector {

/**
 * @brief Base class for collaborator-owned per-client state.
 *
 * The registry stores the payload but never reads, writes or locks it.
 * Collaborators that mutate a payload from several threads synchronize
 * among themselves (see LinkState for the reflector's own payload).
 */
class ClientExtra {
 public:
  virtual ~ClientExtra() = default;
};

/**
 * @brief One linked peer.
 *
 * Identity (address, port) and label are fixed at construction. The record
 * is shared by reference between the registry and its callers; a caller
 * holding a record must not assume it is still registered.
 */
class YSF_REFLECTOR_API ClientRecord {
 public:
  ClientRecord(ClientKey key, std::string label,
               std::shared_ptr<ClientExtra> extra = nullptr)
      : key_(std::move(key)),
        label_(std::move(label)),
        extra_(std::move(extra)) {}

  ClientRecord(const ClientRecord&) = delete;
  ClientRecord& operator=(const ClientRecord&) = delete;

  const ClientKey& Key() const { return key_; }
  const std::string& Address() const { return key_.address; }
  uint16_t Port() const { return key_.port; }
  const std::string& Label() const { return label_; }

  /** Opaque payload slot (may be null). */
  ClientExtra* Extra() const { return extra_.get(); }

  /** Returns the payload as T, or nullptr if absent or of another type. */
  template <typename T>
  T* ExtraAs() const {
    return dynamic_cast<T*>(extra_.get());
  }

 private:
  const ClientKey key_;
  const std::string label_;
  const std::shared_ptr<ClientExtra> extra_;
};

using ClientRecordPtr = std::shared_ptr<ClientRecord>;

}  // namespace ysfreflector
