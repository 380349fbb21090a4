// Copyright (c) 2025 <Your Name>
/**
 * @file ysf_packet.hpp
 * @brief YSF reflector frame classification and construction.
 *
 * Every frame starts with a 4-byte ASCII tag. Call-sign fields are 10
 * bytes, padded with spaces (or NULs from some gateways).
 *
 * Layout:
 *
 *   Poll    "YSFP" + callsign[10]                           (14 bytes)
 *   Unlink  "YSFU" + callsign[10]                           (14 bytes)
 *   Data    "YSFD" + gateway[10] + source[10] + dest[10]
 *           + counter[1] + payload[120]                     (155 bytes)
 *           counter bit0 = end of transmission
 *   Status  "YSFS"                                          (4 bytes, request)
 *   Status  "YSFS" + id[5] + name[16] + desc[14] + count[3] (42 bytes, reply)
 *
 * The reflector answers polls with a poll whose call-sign field is
 * "REFLECTOR ".
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ysfreflector/export.hpp"

namespace ysfreflector {

/** Frame kinds understood by the reflector. */
enum class PacketType {
  kInvalid,
  kPoll,
  kUnlink,
  kData,
  kStatusRequest,
};

/** @brief Parsed routing header of a data frame. */
struct DataHeader {
  std::string gateway;      ///< Call-sign of the sending gateway.
  std::string source;       ///< Originating station.
  std::string destination;  ///< Destination ("ALL" for group calls).
  uint8_t counter = 0;      ///< Raw frame counter byte.
  bool end_of_transmission = false;
};

/** Reflector status fields carried in the status reply. */
struct StatusInfo {
  uint32_t id = 0;  ///< 0..99999
  std::string name;
  std::string description;
  size_t linked = 0;  ///< Clamped to 999 on the wire.
};

struct YSF_REFLECTOR_API YsfPacket {
  static constexpr size_t kTagLength = 4;
  static constexpr size_t kCallsignLength = 10;
  static constexpr size_t kPollLength = 14;
  static constexpr size_t kUnlinkLength = 14;
  static constexpr size_t kDataLength = 155;
  static constexpr size_t kStatusRequestLength = 4;
  static constexpr size_t kStatusReplyLength = 42;
  static constexpr size_t kNameLength = 16;
  static constexpr size_t kDescriptionLength = 14;
  static constexpr size_t kMaxDatagram = 200;

  /**
   * @brief Classifies a received datagram.
   * @return kInvalid for unknown tags or lengths that do not match the tag.
   */
  static PacketType Classify(const std::vector<uint8_t>& bytes);

  /**
   * @brief Extracts the call-sign of a poll or unlink frame.
   * @param out Trimmed call-sign on success; untouched on failure.
   * @return false if the frame is neither poll nor unlink, or if the
   *         call-sign field is blank.
   */
  static bool ParseCallsign(const std::vector<uint8_t>& bytes,
                            std::string* out);

  /**
   * @brief Parses the routing header of a data frame.
   * @param out Filled on success; untouched on failure.
   */
  static bool ParseDataHeader(const std::vector<uint8_t>& bytes,
                              DataHeader* out);

  /** Builds a poll frame carrying callsign (space padded/truncated). */
  static std::vector<uint8_t> BuildPoll(const std::string& callsign);

  /** Builds an unlink frame carrying callsign. */
  static std::vector<uint8_t> BuildUnlink(const std::string& callsign);

  /** Builds the 4-byte status request. */
  static std::vector<uint8_t> BuildStatusRequest();

  /** Builds the 42-byte status reply. */
  static std::vector<uint8_t> BuildStatusReply(const StatusInfo& info);

  /**
   * @brief Derives the 5-digit reflector id from its name.
   *
   * Jenkins one-at-a-time hash of the name, modulo 100000.
   */
  static uint32_t ReflectorId(const std::string& name);
};

}  // namespace ysfreflector
