// Copyright (c) 2025 <Your Name>
#include "ysfreflector/client_key.hpp"

#include <sstream>
#include <string>

namespace ysfreflector {

namespace {

constexpr size_t kMaxAddressLength = 253;

bool IsAddressChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_' ||
         c == ':';
}

bool CheckAddress(const std::string& address, std::string* error) {
  if (address.empty()) {
    if (error) *error = "empty address";
    return false;
  }
  if (address.size() > kMaxAddressLength) {
    if (error) *error = "address too long";
    return false;
  }
  for (char c : address) {
    if (!IsAddressChar(c)) {
      if (error) *error = "invalid character in address: " + address;
      return false;
    }
  }
  return true;
}

}  // namespace

bool ClientKey::FromParts(const std::string& address, int port,
                          ClientKey* out, std::string* error) {
  if (!CheckAddress(address, error)) return false;
  if (port < 1 || port > 65535) {
    if (error) {
      std::ostringstream oss;
      oss << "port out of range: " << port;
      *error = oss.str();
    }
    return false;
  }
  if (out) {
    out->address = address;
    out->port = static_cast<uint16_t>(port);
  }
  return true;
}

bool ClientKey::IsValid() const {
  return port != 0 && CheckAddress(address, nullptr);
}

std::string ClientKey::ToString() const {
  std::ostringstream oss;
  if (address.find(':') != std::string::npos) {
    oss << '[' << address << "]:" << port;
  } else {
    oss << address << ':' << port;
  }
  return oss.str();
}

}  // namespace ysfreflector
