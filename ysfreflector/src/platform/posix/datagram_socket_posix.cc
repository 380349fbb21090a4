// Copyright (c) 2025 <Your Name>
/**
 * @file datagram_socket_posix.cc
 * @brief BSD sockets implementation of DatagramSocket.
 */
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/datagram_socket.hpp"
#include "ysfreflector/ysf_packet.hpp"

namespace ysfreflector {
namespace internal {

namespace {

std::string ErrnoText(const char* context, int err) {
  std::ostringstream oss;
  oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
  return oss.str();
}

}  // namespace

class DatagramSocketPosix : public DatagramSocket {
 public:
  ~DatagramSocketPosix() override { Close(); }

  bool Open(uint16_t port) override {
    Close();
    const int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
      SetError(ErrnoText("socket", errno));
      return false;
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(port);
    if (bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
      std::ostringstream ctx;
      ctx << "bind UDP " << port;
      SetError(ErrnoText(ctx.str().c_str(), errno));
      close(fd);
      return false;
    }

    socklen_t len = sizeof(local);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) < 0) {
      SetError(ErrnoText("getsockname", errno));
      close(fd);
      return false;
    }
    bound_port_.store(ntohs(local.sin_port));
    fd_.store(fd);
    return true;
  }

  RecvStatus ReceiveFrom(std::chrono::milliseconds timeout, ClientKey* from,
                         std::vector<uint8_t>* frame) override {
    const int fd = fd_.load();
    if (fd < 0) {
      SetError("socket not open");
      return RecvStatus::kError;
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
      if (errno == EINTR) return RecvStatus::kTimeout;
      SetError(ErrnoText("poll", errno));
      return RecvStatus::kError;
    }
    if (ready == 0 || !(pfd.revents & POLLIN)) return RecvStatus::kTimeout;

    sockaddr_in peer{};
    iovec iov{};
    iov.iov_base = buffer_.data();
    iov.iov_len = buffer_.size();
    msghdr msg{};
    msg.msg_name = &peer;
    msg.msg_namelen = sizeof(peer);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;

    ssize_t n;
    do {
      n = recvmsg(fd, &msg, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      SetError(ErrnoText("recvmsg", errno));
      return RecvStatus::kError;
    }
    if (msg.msg_flags & MSG_TRUNC) {
      SetError("datagram exceeds " + std::to_string(buffer_.size()) +
               " bytes");
      return RecvStatus::kDropped;
    }

    char text[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &peer.sin_addr, text, sizeof(text)) == nullptr) {
      SetError(ErrnoText("inet_ntop", errno));
      return RecvStatus::kDropped;
    }
    ClientKey key;
    std::string why;
    if (!ClientKey::FromParts(text, ntohs(peer.sin_port), &key, &why)) {
      SetError("unusable source: " + why);
      return RecvStatus::kDropped;
    }

    *from = std::move(key);
    frame->assign(buffer_.begin(), buffer_.begin() + n);
    return RecvStatus::kFrame;
  }

  bool SendTo(const ClientKey& to, const std::vector<uint8_t>& frame) override {
    const int fd = fd_.load();
    if (fd < 0) {
      SetError("socket not open");
      return false;
    }

    sockaddr_in peer{};
    peer.sin_family = AF_INET;
    peer.sin_port = htons(to.port);
    if (inet_pton(AF_INET, to.address.c_str(), &peer.sin_addr) != 1) {
      SetError("not an IPv4 address: " + to.address);
      return false;
    }

    ssize_t sent;
    do {
      sent = sendto(fd, frame.data(), frame.size(), 0,
                    reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
    } while (sent < 0 && errno == EINTR);
    if (sent < 0) {
      SetError(ErrnoText("sendto", errno));
      return false;
    }
    if (static_cast<size_t>(sent) != frame.size()) {
      std::ostringstream oss;
      oss << "short send: " << sent << " of " << frame.size() << " bytes";
      SetError(oss.str());
      return false;
    }
    return true;
  }

  uint16_t BoundPort() const override { return bound_port_.load(); }

  void Close() override {
    const int fd = fd_.exchange(-1);
    if (fd >= 0) close(fd);
    bound_port_.store(0);
  }

  bool IsOpen() const override { return fd_.load() >= 0; }

  std::string LastError() const override {
    std::lock_guard<std::mutex> lk(error_mtx_);
    return last_error_;
  }

 private:
  void SetError(const std::string& text) {
    std::lock_guard<std::mutex> lk(error_mtx_);
    last_error_ = text;
  }

  std::atomic<int> fd_{-1};
  std::atomic<uint16_t> bound_port_{0};
  std::array<uint8_t, YsfPacket::kMaxDatagram> buffer_{};
  mutable std::mutex error_mtx_;
  std::string last_error_;
};

std::unique_ptr<DatagramSocket> CreateDatagramSocket() {
  return std::unique_ptr<DatagramSocket>(new DatagramSocketPosix());
}

}  // namespace internal
}  // namespace ysfreflector
