// Copyright (c) 2025 <Your Name>
/**
 * @file reflector_server.cc
 * @brief YSF reflector: UDP receive loop, linking, relaying and sweeping.
 */
#include "ysfreflector/reflector_server.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/datagram_socket.hpp"
#include "internal/link_sweeper.hpp"
#include "ysfreflector/client_key.hpp"
#include "ysfreflector/client_record.hpp"
#include "ysfreflector/client_registry.hpp"
#include "ysfreflector/ysf_packet.hpp"

namespace ysfreflector {

namespace {

/** Call-sign the reflector puts into its poll replies. */
constexpr const char* kReflectorCallsign = "REFLECTOR";

constexpr std::chrono::milliseconds kReceiveTimeout{200};

class StatsTracker {
 public:
  void IncPacketsReceived() {
    packets_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncPacketsForwarded() {
    packets_forwarded_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncPacketsSent() {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncInvalidPackets() {
    invalid_packets_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncUnknownSender() {
    unknown_sender_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncLinks() { links_.fetch_add(1, std::memory_order_relaxed); }
  void IncUnlinks() { unlinks_.fetch_add(1, std::memory_order_relaxed); }
  void IncTimeouts() { timeouts_.fetch_add(1, std::memory_order_relaxed); }
  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_ = text;
  }

  ServerStats Snapshot(uint64_t active_clients) const {
    ServerStats stats;
    stats.packets_received = packets_received_.load(std::memory_order_relaxed);
    stats.packets_forwarded =
        packets_forwarded_.load(std::memory_order_relaxed);
    stats.packets_sent = packets_sent_.load(std::memory_order_relaxed);
    stats.invalid_packets = invalid_packets_.load(std::memory_order_relaxed);
    stats.unknown_sender = unknown_sender_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    stats.links = links_.load(std::memory_order_relaxed);
    stats.unlinks = unlinks_.load(std::memory_order_relaxed);
    stats.timeouts = timeouts_.load(std::memory_order_relaxed);
    stats.active_clients = active_clients;
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> packets_received_{0};
  std::atomic<uint64_t> packets_forwarded_{0};
  std::atomic<uint64_t> packets_sent_{0};
  std::atomic<uint64_t> invalid_packets_{0};
  std::atomic<uint64_t> unknown_sender_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> links_{0};
  std::atomic<uint64_t> unlinks_{0};
  std::atomic<uint64_t> timeouts_{0};
  mutable std::mutex last_error_mtx_;
  std::string last_error_;
};

}  // namespace

class ReflectorServer::Impl {
 public:
  explicit Impl(std::shared_ptr<ClientRegistry> registry)
      : registry_(registry ? std::move(registry)
                           : std::make_shared<ClientRegistry>(
                                 [this](const std::string& msg) { Log(msg); })),
        sweeper_(Options::kDefaultClientTimeout) {}
  ~Impl() { Stop(); }

  bool Start(uint16_t port, const Options& options) {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (running_.load()) return true;
    // The loop may have exited on its own (registry fault).
    if (thread_.joinable()) thread_.join();

    options_ = options;
    {
      std::lock_guard<std::mutex> lk(log_mtx_);
      log_callback_ = options.LogSink();
    }
    if (!registry_->Healthy()) {
      RecordError("client registry disabled after integrity fault");
      return false;
    }

    sweeper_.SetTimeout(options.ClientTimeout());
    // Statistics and linked clients persist across Start/Stop.
    socket_ = internal::CreateDatagramSocket();
    if (!socket_->Open(port)) {
      RecordError("Socket open failed: " + socket_->LastError());
      socket_.reset();
      return false;
    }
    port_.store(socket_->BoundPort());

    {
      std::ostringstream oss;
      oss << "[INFO Server] " << options_.Name() << " (id "
          << options_.Id() << ") listening on UDP " << port_.load();
      Log(oss.str());
    }

    last_sweep_ = std::chrono::steady_clock::now();
    running_.store(true);
    thread_ = std::thread([this]() { Loop(); });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    running_.store(false);
    if (thread_.joinable()) {
      thread_.join();
    }
    if (socket_) {
      socket_->Close();
      socket_.reset();
    }
    port_.store(0);
  }

  bool IsRunning() const { return running_.load(); }

  uint16_t Port() const { return port_.load(); }

  ServerStats GetStats() const { return stats_.Snapshot(registry_->Size()); }

  std::vector<ClientInfo> Clients() const {
    const auto now = std::chrono::steady_clock::now();
    std::vector<ClientInfo> out;
    for (const auto& record : registry_->List()) {
      ClientInfo info;
      info.address = record->Address();
      info.port = record->Port();
      info.callsign = record->Label();
      if (const auto* state = record->ExtraAs<internal::LinkState>()) {
        info.idle = now - state->LastSeen();
      }
      out.push_back(info);
    }
    return out;
  }

  bool Disconnect(const std::string& address, int port) {
    ClientKey key;
    std::string error;
    if (!ClientKey::FromParts(address, port, &key, &error)) {
      RecordError("Disconnect rejected: " + error);
      return false;
    }
    ClientRecordPtr record = registry_->Find(key);
    if (!record || !registry_->Remove(*record)) return false;
    stats_.IncUnlinks();
    Log("[INFO Server] " + record->Label() + " (" + key.ToString() +
        ") disconnected by admin");
    return true;
  }

 private:
  /** Main loop: receive and dispatch datagrams, sweep periodically. */
  void Loop() {
    ClientKey from;
    std::vector<uint8_t> data;
    while (running_.load()) {
      if (!registry_->Healthy()) {
        RecordError("client registry disabled after integrity fault");
        running_.store(false);
        break;
      }
      switch (socket_->ReceiveFrom(kReceiveTimeout, &from, &data)) {
        case internal::RecvStatus::kFrame:
          stats_.IncPacketsReceived();
          Dispatch(from, data);
          break;
        case internal::RecvStatus::kDropped:
          stats_.IncPacketsReceived();
          stats_.IncInvalidPackets();
          Log("[DEBUG Server] dropped datagram: " + socket_->LastError());
          break;
        case internal::RecvStatus::kError:
          stats_.IncRecvErrors();
          RecordError("Receive failed: " + socket_->LastError());
          break;
        case internal::RecvStatus::kTimeout:
          break;
      }
      MaybeSweep(std::chrono::steady_clock::now());
    }
  }

  void Dispatch(const ClientKey& key, const std::vector<uint8_t>& data) {
    switch (YsfPacket::Classify(data)) {
      case PacketType::kPoll:
        HandlePoll(key, data);
        break;
      case PacketType::kUnlink:
        HandleUnlink(key);
        break;
      case PacketType::kData:
        HandleData(key, data);
        break;
      case PacketType::kStatusRequest:
        HandleStatus(key);
        break;
      case PacketType::kInvalid:
        stats_.IncInvalidPackets();
        break;
    }
  }

  /**
   * @brief Links or refreshes the polling gateway and answers the poll.
   *
   * A gateway that polls from a known endpoint under a new call-sign
   * replaces the previous record.
   */
  void HandlePoll(const ClientKey& key, const std::vector<uint8_t>& data) {
    std::string callsign;
    if (!YsfPacket::ParseCallsign(data, &callsign)) {
      stats_.IncInvalidPackets();
      return;
    }

    const auto now = std::chrono::steady_clock::now();
    auto record = std::make_shared<ClientRecord>(
        key, callsign, std::make_shared<internal::LinkState>(now));
    bool inserted = false;
    ClientRecordPtr current = registry_->FindOrAdd(record, &inserted);
    if (!current) return;

    if (inserted) {
      stats_.IncLinks();
      Log("[INFO Server] " + callsign + " (" + key.ToString() + ") linked");
    } else if (current->Label() != callsign) {
      if (registry_->Add(record) == ClientRegistry::AddResult::kReplaced) {
        Log("[INFO Server] " + key.ToString() + " relinked as " + callsign +
            " (was " + current->Label() + ")");
      }
    } else if (auto* state = current->ExtraAs<internal::LinkState>()) {
      state->Touch(now);
    }

    SendTo(key, YsfPacket::BuildPoll(kReflectorCallsign));
  }

  void HandleUnlink(const ClientKey& key) {
    ClientRecordPtr record = registry_->Find(key);
    if (!record) {
      stats_.IncUnknownSender();
      return;
    }
    if (registry_->Remove(*record)) {
      stats_.IncUnlinks();
      Log("[INFO Server] " + record->Label() + " (" + key.ToString() +
          ") unlinked");
    }
  }

  /** Relays a data frame from a linked gateway to every other one. */
  void HandleData(const ClientKey& key, const std::vector<uint8_t>& data) {
    ClientRecordPtr sender = registry_->Find(key);
    if (!sender) {
      stats_.IncUnknownSender();
      return;
    }
    if (auto* state = sender->ExtraAs<internal::LinkState>()) {
      state->Touch(std::chrono::steady_clock::now());
    }
    stats_.IncPacketsForwarded();

    DataHeader header;
    if (HasLogSink() && YsfPacket::ParseDataHeader(data, &header) &&
        header.end_of_transmission) {
      std::ostringstream oss;
      oss << "[DEBUG Server] end of transmission from " << header.source
          << " via " << header.gateway << " to " << header.destination;
      Log(oss.str());
    }

    for (const auto& client : registry_->List()) {
      if (client->Key() == key) continue;
      SendTo(client->Key(), data);
    }
  }

  void HandleStatus(const ClientKey& key) {
    StatusInfo info;
    info.id = options_.Id();
    info.name = options_.Name();
    info.description = options_.Description();
    info.linked = registry_->Size();
    SendTo(key, YsfPacket::BuildStatusReply(info));
  }

  void MaybeSweep(std::chrono::steady_clock::time_point now) {
    if (now - last_sweep_ < options_.SweepInterval()) return;
    last_sweep_ = now;
    for (const auto& record : sweeper_.Sweep(registry_.get(), now)) {
      stats_.IncTimeouts();
      Log("[INFO Server] " + record->Label() + " (" +
          record->Key().ToString() + ") timed out");
    }
  }

  bool SendTo(const ClientKey& to, const std::vector<uint8_t>& buf) {
    if (!socket_->SendTo(to, buf)) {
      stats_.IncSendErrors();
      RecordError("Send to " + to.ToString() +
                  " failed: " + socket_->LastError());
      return false;
    }

    stats_.IncPacketsSent();
    return true;
  }

  void Log(const std::string& msg) const {
    Options::LogCallback sink;
    {
      std::lock_guard<std::mutex> lk(log_mtx_);
      sink = log_callback_;
    }
    if (sink) sink(msg);
  }

  bool HasLogSink() const {
    std::lock_guard<std::mutex> lk(log_mtx_);
    return static_cast<bool>(log_callback_);
  }

  void RecordError(const std::string& msg);

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
  std::unique_ptr<internal::DatagramSocket> socket_;
  std::mutex start_stop_mtx_;

  Options options_;
  mutable std::mutex log_mtx_;
  Options::LogCallback log_callback_;
  StatsTracker stats_;
  std::chrono::steady_clock::time_point last_sweep_{};

  std::shared_ptr<ClientRegistry> registry_;
  internal::LinkSweeper sweeper_;
};

void ReflectorServer::Impl::RecordError(const std::string& msg) {
  Log("[ERROR Server] " + msg);
  stats_.SetLastError(msg);
}

ReflectorServer::ReflectorServer() : impl_(new Impl(nullptr)) {}
ReflectorServer::ReflectorServer(std::shared_ptr<ClientRegistry> registry)
    : impl_(new Impl(std::move(registry))) {}
ReflectorServer::~ReflectorServer() = default;

bool ReflectorServer::Start(uint16_t port, const Options& options) {
  return impl_->Start(port, options);
}
void ReflectorServer::Stop() { impl_->Stop(); }
bool ReflectorServer::IsRunning() const { return impl_->IsRunning(); }
uint16_t ReflectorServer::Port() const { return impl_->Port(); }
ServerStats ReflectorServer::GetStats() const { return impl_->GetStats(); }
std::vector<ClientInfo> ReflectorServer::Clients() const {
  return impl_->Clients();
}
bool ReflectorServer::Disconnect(const std::string& address, int port) {
  return impl_->Disconnect(address, port);
}

}  // namespace ysfreflector
