// Copyright (c) 2025 <Your Name>
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ysfreflector/export.hpp"
#include "ysfreflector/log_sink.hpp"

namespace ysfreflector {

class ClientRegistry;

/**
 * Immutable configuration options for ReflectorServer.
 */
class YSF_REFLECTOR_API Options {
 public:
  using LogCallback = ysfreflector::LogCallback;

  class YSF_REFLECTOR_API Builder {
   public:
    Builder();
    Builder& Name(const std::string& v);
    Builder& Description(const std::string& v);
    Builder& Id(uint32_t v);
    Builder& ClientTimeout(std::chrono::steady_clock::duration v);
    Builder& SweepInterval(std::chrono::steady_clock::duration v);
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    std::string name_;
    std::string description_;
    uint32_t id_;
    std::chrono::steady_clock::duration client_timeout_;
    std::chrono::steady_clock::duration sweep_interval_;
    LogCallback log_sink_cb_;
  };

  Options();

  /** Reflector name as announced in status replies (max 16 chars). */
  const std::string& Name() const;
  /** Short description (max 14 chars). */
  const std::string& Description() const;
  /** Configured id, or the id derived from Name() when none was set. */
  uint32_t Id() const;
  std::chrono::steady_clock::duration ClientTimeout() const;
  std::chrono::steady_clock::duration SweepInterval() const;
  const LogCallback& LogSink() const;

  static constexpr const char* kDefaultName = "YSF Reflector";
  static constexpr const char* kDefaultDescription = "C++ reflector";
  static constexpr std::chrono::steady_clock::duration kDefaultClientTimeout =
      std::chrono::seconds(60);
  static constexpr std::chrono::steady_clock::duration kDefaultSweepInterval =
      std::chrono::seconds(5);

 private:
  Options(std::string name, std::string description, uint32_t id,
          std::chrono::steady_clock::duration client_timeout,
          std::chrono::steady_clock::duration sweep_interval,
          LogCallback log_cb);

  std::string name_;
  std::string description_;
  uint32_t id_;
  std::chrono::steady_clock::duration client_timeout_;
  std::chrono::steady_clock::duration sweep_interval_;
  LogCallback log_callback_;
};

struct ServerStats {
  uint64_t packets_received = 0;   ///< Datagrams read from the socket
  uint64_t packets_forwarded = 0;  ///< Data frames accepted for relaying
  uint64_t packets_sent = 0;       ///< Datagrams sent successfully
  uint64_t invalid_packets = 0;    ///< Unknown tag or bad length
  uint64_t unknown_sender = 0;     ///< Data/unlink from unlinked peers
  uint64_t recv_errors = 0;        ///< recvfrom() failures
  uint64_t send_errors = 0;        ///< sendto() failures or partial sends
  uint64_t links = 0;              ///< Peers linked by poll
  uint64_t unlinks = 0;            ///< Peers removed by unlink/admin
  uint64_t timeouts = 0;           ///< Peers removed by the sweeper
  uint64_t active_clients = 0;     ///< Currently linked peers
  std::string last_error;          ///< Latest error message
};

/** Snapshot of one linked peer for the admin interface. */
struct ClientInfo {
  std::string address;
  uint16_t port = 0;
  std::string callsign;
  std::chrono::steady_clock::duration idle{};  ///< Time since last frame
};

/**
 * YSF reflector over UDP/IPv4.
 *
 * Links gateways that poll, relays data frames from a linked gateway to
 * every other linked gateway, answers status requests and unlinks gateways
 * that stop polling.
 */
class YSF_REFLECTOR_API ReflectorServer {
 public:
  ReflectorServer();

  /**
   * @brief Serves the given registry instead of a private one.
   *
   * Lets an embedding application inspect or seed the linked peers
   * directly. The registry's own log sink is used for its integrity
   * errors. A null registry behaves like the default constructor.
   */
  explicit ReflectorServer(std::shared_ptr<ClientRegistry> registry);
  ~ReflectorServer();

  ReflectorServer(const ReflectorServer&) = delete;
  ReflectorServer& operator=(const ReflectorServer&) = delete;

  /**
   * @brief Starts serving on the given UDP port.
   * @param port UDP port to bind (0 picks an ephemeral port, see Port()).
   * @param options Immutable configuration snapshot.
   * @return true on success, false on failure (see GetStats().last_error).
   */
  bool Start(uint16_t port = 42000, const Options& options = Options());

  /** Stops the server. Safe to call multiple times. */
  void Stop();

  /** True while the receive loop is serving. */
  bool IsRunning() const;

  /** Bound UDP port, 0 when stopped. */
  uint16_t Port() const;

  /** Returns latest statistics snapshot (thread-safe). */
  ServerStats GetStats() const;

  /** Snapshot of linked peers (thread-safe). */
  std::vector<ClientInfo> Clients() const;

  /**
   * @brief Forcibly unlinks a peer.
   * @return true if the peer was linked.
   */
  bool Disconnect(const std::string& address, int port);

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace ysfreflector
