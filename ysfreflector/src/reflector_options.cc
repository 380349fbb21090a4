// Copyright (c) 2025 <Your Name>
#include <string>
#include <utility>

#include "ysfreflector/reflector_server.hpp"
#include "ysfreflector/ysf_packet.hpp"

namespace ysfreflector {

namespace {

std::string Truncate(const std::string& s, size_t width) {
  return s.size() > width ? s.substr(0, width) : s;
}

}  // namespace

Options::Builder::Builder() {
  name_ = Options::kDefaultName;
  description_ = Options::kDefaultDescription;
  id_ = 0;
  client_timeout_ = Options::kDefaultClientTimeout;
  sweep_interval_ = Options::kDefaultSweepInterval;
}

Options::Builder& Options::Builder::Name(const std::string& v) {
  name_ = v;
  return *this;
}

Options::Builder& Options::Builder::Description(const std::string& v) {
  description_ = v;
  return *this;
}

Options::Builder& Options::Builder::Id(uint32_t v) {
  id_ = v;
  return *this;
}

Options::Builder& Options::Builder::ClientTimeout(
    std::chrono::steady_clock::duration v) {
  client_timeout_ = v;
  return *this;
}

Options::Builder& Options::Builder::SweepInterval(
    std::chrono::steady_clock::duration v) {
  sweep_interval_ = v;
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(name_, description_, id_, client_timeout_, sweep_interval_,
                 log_sink_cb_);
}

Options::Options()
    : Options(kDefaultName, kDefaultDescription, 0, kDefaultClientTimeout,
              kDefaultSweepInterval, nullptr) {}

Options::Options(std::string name, std::string description, uint32_t id,
                 std::chrono::steady_clock::duration client_timeout,
                 std::chrono::steady_clock::duration sweep_interval,
                 LogCallback log_cb) {
  name_ = Truncate(name, YsfPacket::kNameLength);
  description_ = Truncate(description, YsfPacket::kDescriptionLength);
  id_ = id != 0 ? id % 100000U : YsfPacket::ReflectorId(name_);
  client_timeout_ = client_timeout > std::chrono::steady_clock::duration::zero()
                        ? client_timeout
                        : kDefaultClientTimeout;
  sweep_interval_ = sweep_interval > std::chrono::steady_clock::duration::zero()
                        ? sweep_interval
                        : kDefaultSweepInterval;
  log_callback_ = std::move(log_cb);
}

const std::string& Options::Name() const { return name_; }

const std::string& Options::Description() const { return description_; }

uint32_t Options::Id() const { return id_; }

std::chrono::steady_clock::duration Options::ClientTimeout() const {
  return client_timeout_;
}

std::chrono::steady_clock::duration Options::SweepInterval() const {
  return sweep_interval_;
}

const Options::LogCallback& Options::LogSink() const { return log_callback_; }

}  // namespace ysfreflector
