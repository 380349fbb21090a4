// Copyright (c) 2025 <Your Name>
/**
 * @file datagram_socket.hpp
 * @brief UDP transport used by the reflector's receive loop.
 *
 * Peers are addressed by ClientKey in both directions, so a received
 * sender can be looked up in the registry without conversion and a
 * registered record can be sent to directly.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ysfreflector/client_key.hpp"

namespace ysfreflector {
namespace internal {

/** Outcome of DatagramSocket::ReceiveFrom(). */
enum class RecvStatus {
  kFrame,    ///< One datagram of at most YsfPacket::kMaxDatagram bytes.
  kTimeout,  ///< Nothing arrived (or the wait was interrupted).
  kDropped,  ///< A datagram was consumed but is unusable, see LastError().
  kError,    ///< Socket failure, see LastError().
};

/**
 * @brief IPv4 UDP socket bound to all interfaces.
 *
 * Not thread-safe except for SendTo(), which may be called from the admin
 * thread while the receive loop runs.
 */
class DatagramSocket {
 public:
  virtual ~DatagramSocket() = default;

  /**
   * @brief Creates the socket and binds it to port (0 = ephemeral).
   *
   * Address reuse is left off: a port held by another live socket fails
   * to bind. A closed UDP port can be rebound at once. Calling Open() on
   * an open socket closes it first.
   */
  virtual bool Open(uint16_t port) = 0;

  /**
   * @brief Waits up to timeout for one datagram.
   *
   * Datagrams longer than YsfPacket::kMaxDatagram and datagrams whose
   * source does not form a valid ClientKey are consumed and reported as
   * kDropped. from and frame are written for kFrame only.
   */
  virtual RecvStatus ReceiveFrom(std::chrono::milliseconds timeout,
                                 ClientKey* from,
                                 std::vector<uint8_t>* frame) = 0;

  /** Sends frame to a dotted-quad peer. */
  virtual bool SendTo(const ClientKey& to,
                      const std::vector<uint8_t>& frame) = 0;

  /** Bound port, 0 when closed. */
  virtual uint16_t BoundPort() const = 0;

  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  virtual std::string LastError() const = 0;
};

std::unique_ptr<DatagramSocket> CreateDatagramSocket();

}  // namespace internal
}  // namespace ysfreflector
