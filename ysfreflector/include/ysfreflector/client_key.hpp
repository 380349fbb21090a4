// Copyright (c) 2025 <Your Name>
/**
 * @file client_key.hpp
 * @brief Identity of a linked peer: network address plus UDP port.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "ysfreflector/export.hpp"

namespace ysfreflector {

/**
 * @brief Identity key of a client record.
 *
 * Two records with equal keys name the same peer. A default constructed
 * key is invalid; valid keys are produced by FromParts().
 */
struct YSF_REFLECTOR_API ClientKey {
  std::string address;  ///< Dotted-quad, IPv6 literal or hostname.
  uint16_t port = 0;    ///< UDP source port (1-65535 when valid).

  ClientKey() = default;
  ClientKey(std::string addr, uint16_t p) : address(std::move(addr)), port(p) {}

  /**
   * @brief Validates and builds a key from untrusted parts.
   *
   * The address must be non-empty, at most 253 characters and consist of
   * letters, digits, '.', '-', '_' or ':'. The port must lie in 1..65535.
   *
   * @param address Peer address text.
   * @param port    Peer port as received from the boundary (may be
   *                negative or out of range).
   * @param out     Filled on success; untouched on failure.
   * @param error   Optional reason text on failure.
   * @return true if the identity is well formed.
   */
  static bool FromParts(const std::string& address, int port, ClientKey* out,
                        std::string* error = nullptr);

  /** Returns true if the key satisfies the FromParts() rules. */
  bool IsValid() const;

  /** Formats the key as "address:port" for logs. */
  std::string ToString() const;
};

inline bool operator==(const ClientKey& a, const ClientKey& b) {
  return a.port == b.port && a.address == b.address;
}

inline bool operator!=(const ClientKey& a, const ClientKey& b) {
  return !(a == b);
}

/** Hash functor for unordered containers keyed by ClientKey. */
struct ClientKeyHash {
  size_t operator()(const ClientKey& k) const noexcept {
    const size_t h = std::hash<std::string>{}(k.address);
    return h ^ (static_cast<size_t>(k.port) + 0x9e3779b9u + (h << 6) +
                (h >> 2));
  }
};

}  // namespace ysfreflector
