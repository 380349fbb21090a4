// Copyright (c) 2025 <Your Name>
/**
 * @file link_sweeper.hpp
 * @brief Last-seen tracking for linked gateways and timeout sweeping.
 *
 * The reflector attaches a LinkState to every record it links. Receive
 * handling refreshes it on each poll or data frame; the sweeper removes
 * records whose state has not been refreshed within the timeout.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

#include "ysfreflector/client_record.hpp"
#include "ysfreflector/client_registry.hpp"

namespace ysfreflector {
namespace internal {

/**
 * @brief Reflector payload stored in ClientRecord::Extra.
 *
 * Thread-safe: the timestamp is atomic, so receive threads may Touch()
 * while the sweeper reads LastSeen().
 */
class LinkState : public ClientExtra {
 public:
  explicit LinkState(std::chrono::steady_clock::time_point now)
      : last_seen_ns_(ToNs(now)) {}

  void Touch(std::chrono::steady_clock::time_point now) {
    last_seen_ns_.store(ToNs(now), std::memory_order_relaxed);
  }

  std::chrono::steady_clock::time_point LastSeen() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::nanoseconds(
                last_seen_ns_.load(std::memory_order_relaxed))));
  }

 private:
  static int64_t ToNs(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               t.time_since_epoch())
        .count();
  }

  std::atomic<int64_t> last_seen_ns_;
};

/**
 * @brief Removes records whose LinkState is older than the timeout.
 *
 * Records without a LinkState are not owned by the link logic (e.g. added
 * through the admin interface) and are never expired.
 */
class LinkSweeper {
 public:
  explicit LinkSweeper(std::chrono::steady_clock::duration timeout) {
    SetTimeout(timeout);
  }

  /** Sets the timeout; non-positive values select the 60 s default. */
  void SetTimeout(std::chrono::steady_clock::duration timeout) {
    timeout_ = timeout > std::chrono::steady_clock::duration::zero()
                   ? timeout
                   : std::chrono::steady_clock::duration(kDefaultTimeout);
  }

  std::chrono::steady_clock::duration Timeout() const { return timeout_; }

  /**
   * @brief Sweeps a snapshot of the registry.
   *
   * Uses steady_clock timestamps so that wall-clock jumps do not expire
   * or retain clients.
   *
   * @return Records that this call removed.
   */
  std::vector<ClientRecordPtr> Sweep(
      ClientRegistry* registry, std::chrono::steady_clock::time_point now) {
    std::vector<ClientRecordPtr> removed;
    for (const auto& record : registry->List()) {
      const LinkState* state = record->ExtraAs<LinkState>();
      if (!state) continue;
      if (now - state->LastSeen() <= timeout_) continue;
      // A record replaced by a re-link under the same key is kept.
      if (registry->RemoveIfCurrent(record)) removed.push_back(record);
    }
    return removed;
  }

  static constexpr std::chrono::seconds kDefaultTimeout{60};

 private:
  std::chrono::steady_clock::duration timeout_;
};

}  // namespace internal
}  // namespace ysfreflector
