// Copyright (c) 2025 <Your Name>
/**
 * @file ysf_packet.cc
 * @brief Implementation of YSF frame classify/parse/build helpers.
 */
#include "ysfreflector/ysf_packet.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace ysfreflector {

namespace {

bool HasTag(const std::vector<uint8_t>& bytes, const char (&tag)[5]) {
  return bytes.size() >= YsfPacket::kTagLength &&
         std::memcmp(bytes.data(), tag, YsfPacket::kTagLength) == 0;
}

/** Reads a fixed-width text field and strips trailing spaces/NULs. */
std::string ReadField(const std::vector<uint8_t>& bytes, size_t offset,
                      size_t width) {
  std::string s(reinterpret_cast<const char*>(bytes.data()) + offset, width);
  size_t end = s.find_last_not_of(std::string(" \0", 2));
  if (end == std::string::npos) return std::string();
  s.resize(end + 1);
  // Some gateways NUL-terminate inside the field.
  size_t nul = s.find('\0');
  if (nul != std::string::npos) s.resize(nul);
  return s;
}

/** Appends text space padded (or truncated) to width bytes. */
void AppendField(std::vector<uint8_t>* out, const std::string& text,
                 size_t width) {
  const size_t n = std::min(text.size(), width);
  out->insert(out->end(), text.begin(), text.begin() + n);
  out->insert(out->end(), width - n, static_cast<uint8_t>(' '));
}

void AppendTag(std::vector<uint8_t>* out, const char (&tag)[5]) {
  out->insert(out->end(), tag, tag + YsfPacket::kTagLength);
}

}  // namespace

PacketType YsfPacket::Classify(const std::vector<uint8_t>& bytes) {
  if (HasTag(bytes, "YSFP")) {
    return bytes.size() == kPollLength ? PacketType::kPoll
                                       : PacketType::kInvalid;
  }
  if (HasTag(bytes, "YSFU")) {
    return bytes.size() == kUnlinkLength ? PacketType::kUnlink
                                         : PacketType::kInvalid;
  }
  if (HasTag(bytes, "YSFD")) {
    return bytes.size() == kDataLength ? PacketType::kData
                                       : PacketType::kInvalid;
  }
  if (HasTag(bytes, "YSFS")) {
    return bytes.size() == kStatusRequestLength ? PacketType::kStatusRequest
                                                : PacketType::kInvalid;
  }
  return PacketType::kInvalid;
}

bool YsfPacket::ParseCallsign(const std::vector<uint8_t>& bytes,
                              std::string* out) {
  const PacketType type = Classify(bytes);
  if (type != PacketType::kPoll && type != PacketType::kUnlink) return false;
  std::string cs = ReadField(bytes, kTagLength, kCallsignLength);
  if (cs.empty()) return false;
  *out = cs;
  return true;
}

bool YsfPacket::ParseDataHeader(const std::vector<uint8_t>& bytes,
                                DataHeader* out) {
  if (Classify(bytes) != PacketType::kData) return false;
  DataHeader h;
  h.gateway = ReadField(bytes, 4, kCallsignLength);
  h.source = ReadField(bytes, 14, kCallsignLength);
  h.destination = ReadField(bytes, 24, kCallsignLength);
  h.counter = bytes[34];
  h.end_of_transmission = (h.counter & 0x01U) != 0U;
  *out = h;
  return true;
}

std::vector<uint8_t> YsfPacket::BuildPoll(const std::string& callsign) {
  std::vector<uint8_t> out;
  out.reserve(kPollLength);
  AppendTag(&out, "YSFP");
  AppendField(&out, callsign, kCallsignLength);
  return out;
}

std::vector<uint8_t> YsfPacket::BuildUnlink(const std::string& callsign) {
  std::vector<uint8_t> out;
  out.reserve(kUnlinkLength);
  AppendTag(&out, "YSFU");
  AppendField(&out, callsign, kCallsignLength);
  return out;
}

std::vector<uint8_t> YsfPacket::BuildStatusRequest() {
  std::vector<uint8_t> out;
  AppendTag(&out, "YSFS");
  return out;
}

std::vector<uint8_t> YsfPacket::BuildStatusReply(const StatusInfo& info) {
  std::vector<uint8_t> out;
  out.reserve(kStatusReplyLength);
  AppendTag(&out, "YSFS");

  char digits[8];
  std::snprintf(digits, sizeof(digits), "%05u",
                static_cast<unsigned>(info.id % 100000U));
  AppendField(&out, digits, 5);
  AppendField(&out, info.name, kNameLength);
  AppendField(&out, info.description, kDescriptionLength);
  std::snprintf(digits, sizeof(digits), "%03u",
                static_cast<unsigned>(std::min<size_t>(info.linked, 999U)));
  AppendField(&out, digits, 3);
  return out;
}

uint32_t YsfPacket::ReflectorId(const std::string& name) {
  uint32_t hash = 0U;
  for (unsigned char c : name) {
    hash += c;
    hash += (hash << 10);
    hash ^= (hash >> 6);
  }
  hash += (hash << 3);
  hash ^= (hash >> 11);
  hash += (hash << 15);
  return hash % 100000U;
}

}  // namespace ysfreflector
