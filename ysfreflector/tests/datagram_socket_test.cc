// Copyright (c) 2025 <Your Name>
/**
 * @file datagram_socket_test.cc
 * @brief UDP transport over loopback: framing limits, peer keys, rebinding.
 */
#include "internal/datagram_socket.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "ysfreflector/ysf_packet.hpp"

namespace ysfreflector {
namespace internal {

namespace {

using std::chrono::milliseconds;

class DatagramSocketTest : public ::testing::Test {
 protected:
  void SetUp() override {
    a_ = CreateDatagramSocket();
    b_ = CreateDatagramSocket();
    ASSERT_TRUE(a_->Open(0)) << a_->LastError();
    ASSERT_TRUE(b_->Open(0)) << b_->LastError();
  }

  ClientKey LoopbackOf(const DatagramSocket& s) const {
    return ClientKey("127.0.0.1", s.BoundPort());
  }

  std::unique_ptr<DatagramSocket> a_;
  std::unique_ptr<DatagramSocket> b_;
};

}  // namespace

/**
 * @test DatagramSocketTest.SenderArrivesAsClientKey
 * @steps
 * 1. Socket A sends a poll frame to socket B over loopback.
 * @expected
 * - B receives the frame unchanged.
 * - The sender key equals 127.0.0.1 and A's bound port, so it can be used
 *   for a registry lookup and as a reply target as is.
 */
TEST_F(DatagramSocketTest, SenderArrivesAsClientKey) {
  const auto poll = YsfPacket::BuildPoll("G0ABC");
  ASSERT_TRUE(a_->SendTo(LoopbackOf(*b_), poll)) << a_->LastError();

  ClientKey from;
  std::vector<uint8_t> frame;
  ASSERT_EQ(b_->ReceiveFrom(milliseconds(1000), &from, &frame),
            RecvStatus::kFrame)
      << b_->LastError();
  EXPECT_EQ(frame, poll);
  EXPECT_EQ(from, LoopbackOf(*a_));

  ASSERT_TRUE(b_->SendTo(from, YsfPacket::BuildStatusRequest()));
  ASSERT_EQ(a_->ReceiveFrom(milliseconds(1000), &from, &frame),
            RecvStatus::kFrame);
  EXPECT_EQ(frame, YsfPacket::BuildStatusRequest());
}

TEST_F(DatagramSocketTest, IdleWaitTimesOut) {
  ClientKey from("untouched", 1);
  std::vector<uint8_t> frame;
  EXPECT_EQ(b_->ReceiveFrom(milliseconds(20), &from, &frame),
            RecvStatus::kTimeout);
  EXPECT_EQ(from.address, "untouched");
}

TEST_F(DatagramSocketTest, OversizedDatagramIsDropped) {
  std::vector<uint8_t> big(YsfPacket::kMaxDatagram + 1, 0x42);
  ASSERT_TRUE(a_->SendTo(LoopbackOf(*b_), big));
  std::vector<uint8_t> max(YsfPacket::kMaxDatagram, 0x43);
  ASSERT_TRUE(a_->SendTo(LoopbackOf(*b_), max));

  ClientKey from;
  std::vector<uint8_t> frame;
  EXPECT_EQ(b_->ReceiveFrom(milliseconds(1000), &from, &frame),
            RecvStatus::kDropped);
  EXPECT_NE(b_->LastError().find("exceeds"), std::string::npos);
  EXPECT_TRUE(frame.empty());

  ASSERT_EQ(b_->ReceiveFrom(milliseconds(1000), &from, &frame),
            RecvStatus::kFrame);
  EXPECT_EQ(frame, max);
}

TEST_F(DatagramSocketTest, SendToNonIpv4PeerFails) {
  EXPECT_FALSE(a_->SendTo(ClientKey("gateway.example", 42000), {'Y'}));
  EXPECT_NE(a_->LastError().find("gateway.example"), std::string::npos);
}

/**
 * @test DatagramSocketTest.ReopenOnSamePort
 * @steps
 * 1. Close socket B and reopen it on the port it had.
 * @expected
 * - The bind succeeds and traffic reaches the reopened socket.
 * - Closed sockets report port 0 and refuse to send.
 */
TEST_F(DatagramSocketTest, ReopenOnSamePort) {
  const uint16_t port = b_->BoundPort();
  b_->Close();
  EXPECT_FALSE(b_->IsOpen());
  EXPECT_EQ(b_->BoundPort(), 0);
  EXPECT_FALSE(b_->SendTo(LoopbackOf(*a_), {'Y'}));

  ASSERT_TRUE(b_->Open(port)) << b_->LastError();
  EXPECT_EQ(b_->BoundPort(), port);
  ASSERT_TRUE(a_->SendTo(ClientKey("127.0.0.1", port), {'Y', 'S', 'F', 'S'}));

  ClientKey from;
  std::vector<uint8_t> frame;
  EXPECT_EQ(b_->ReceiveFrom(milliseconds(1000), &from, &frame),
            RecvStatus::kFrame);
}

TEST(DatagramSocketBindTest, PortInUseReportsError) {
  auto first = CreateDatagramSocket();
  ASSERT_TRUE(first->Open(0));
  auto second = CreateDatagramSocket();
  EXPECT_FALSE(second->Open(first->BoundPort()));
  EXPECT_NE(second->LastError().find("bind"), std::string::npos);
  EXPECT_FALSE(second->IsOpen());
}

}  // namespace internal
}  // namespace ysfreflector
