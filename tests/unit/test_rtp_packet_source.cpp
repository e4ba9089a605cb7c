#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>
#include "receivers/rtp/rtp_packet_source.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace voicetap::audio;

namespace {

std::vector<uint8_t> make_rtp(uint32_t ssrc, uint16_t seq, uint32_t timestamp,
                              const std::vector<uint8_t>& payload,
                              uint8_t csrc_count = 0,
                              std::size_t extension_words = 0,
                              uint8_t padding = 0) {
    std::vector<uint8_t> out;
    uint8_t first = 0x80 | (csrc_count & 0x0F);
    if (padding > 0) first |= 0x20;
    if (extension_words > 0) first |= 0x10;
    out.push_back(first);
    out.push_back(kRtpPayloadTypeOpus);
    out.push_back(static_cast<uint8_t>(seq >> 8));
    out.push_back(static_cast<uint8_t>(seq & 0xFF));
    for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(timestamp >> shift));
    for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(ssrc >> shift));
    for (uint8_t i = 0; i < csrc_count; ++i) {
        out.insert(out.end(), {0x11, 0x22, 0x33, static_cast<uint8_t>(i)});
    }
    if (extension_words > 0) {
        out.insert(out.end(), {0xBE, 0xDE, 0x00, static_cast<uint8_t>(extension_words)});
        out.insert(out.end(), extension_words * 4, 0xAA);
    }
    out.insert(out.end(), payload.begin(), payload.end());
    if (padding > 0) {
        out.insert(out.end(), padding - 1, 0x00);
        out.push_back(padding);
    }
    return out;
}

const std::vector<uint8_t> kOpusFrame = {0xF8, 0x01, 0x02, 0x03, 0x04};

} // namespace

class RtpParseTest : public ::testing::Test {
protected:
    bool parse(const std::vector<uint8_t>& datagram) {
        error.clear();
        return RtpPacketSource::parse_rtp_datagram(datagram.data(), datagram.size(), packet, error);
    }

    AudioPacket packet;
    std::string error;
};

TEST_F(RtpParseTest, ParsesBasicHeader) {
    ASSERT_TRUE(parse(make_rtp(0xDEADBEEF, 513, 96000, kOpusFrame))) << error;
    EXPECT_EQ(packet.source_tag, 0xDEADBEEFu);
    EXPECT_EQ(packet.sequence_number, 513u);
    EXPECT_EQ(packet.rtp_timestamp, 96000u);
    EXPECT_EQ(packet.payload_type, kRtpPayloadTypeOpus);
    EXPECT_EQ(packet.payload, kOpusFrame);
}

TEST_F(RtpParseTest, SkipsCsrcList) {
    ASSERT_TRUE(parse(make_rtp(1, 1, 0, kOpusFrame, 2))) << error;
    EXPECT_EQ(packet.payload, kOpusFrame);
}

TEST_F(RtpParseTest, SkipsHeaderExtension) {
    ASSERT_TRUE(parse(make_rtp(1, 1, 0, kOpusFrame, 1, 2))) << error;
    EXPECT_EQ(packet.payload, kOpusFrame);
}

TEST_F(RtpParseTest, StripsPadding) {
    ASSERT_TRUE(parse(make_rtp(1, 1, 0, kOpusFrame, 0, 0, 4))) << error;
    EXPECT_EQ(packet.payload, kOpusFrame);
}

TEST_F(RtpParseTest, SilenceSentinelPayloadPreserved) {
    std::vector<uint8_t> sentinel(kSilenceSentinel.begin(), kSilenceSentinel.end());
    ASSERT_TRUE(parse(make_rtp(9, 2, 0, sentinel)));
    EXPECT_EQ(packet.payload, sentinel);
}

TEST_F(RtpParseTest, HeaderOnlyGivesEmptyPayload) {
    ASSERT_TRUE(parse(make_rtp(9, 2, 0, {})));
    EXPECT_TRUE(packet.payload.empty());
}

TEST_F(RtpParseTest, RejectsShortDatagram) {
    std::vector<uint8_t> tiny = {0x80, 111, 0, 1};
    EXPECT_FALSE(parse(tiny));
    EXPECT_FALSE(error.empty());
}

TEST_F(RtpParseTest, RejectsWrongVersion) {
    auto datagram = make_rtp(1, 1, 0, kOpusFrame);
    datagram[0] = (datagram[0] & 0x3F) | 0x40;  // version 1
    EXPECT_FALSE(parse(datagram));
    EXPECT_NE(error.find("version"), std::string::npos);
}

TEST_F(RtpParseTest, RejectsTruncatedCsrcList) {
    auto datagram = make_rtp(1, 1, 0, {}, 3);
    datagram.resize(12 + 8);
    EXPECT_FALSE(parse(datagram));
}

TEST_F(RtpParseTest, RejectsTruncatedExtension) {
    auto datagram = make_rtp(1, 1, 0, {}, 0, 4);
    datagram.resize(datagram.size() - 6);
    EXPECT_FALSE(parse(datagram));
}

TEST_F(RtpParseTest, RejectsInvalidPadding) {
    auto datagram = make_rtp(1, 1, 0, kOpusFrame);
    datagram[0] |= 0x20;
    datagram.back() = 0;
    EXPECT_FALSE(parse(datagram));

    datagram.back() = 200;
    EXPECT_FALSE(parse(datagram));
}

class RtpPacketSourceLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        sender_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(sender_fd, 0);
        settings.bind_address = "127.0.0.1";
        settings.listen_port = 0;
    }

    void TearDown() override {
        if (sender_fd >= 0) {
            ::close(sender_fd);
        }
    }

    void send_to(uint16_t port, const std::vector<uint8_t>& datagram) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ASSERT_EQ(::sendto(sender_fd, datagram.data(), datagram.size(), 0,
                           reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)),
                  static_cast<ssize_t>(datagram.size()));
    }

    int sender_fd = -1;
    RtpSourceSettings settings;
};

TEST_F(RtpPacketSourceLoopbackTest, ReceivesDatagramsFromTwoSources) {
    RtpPacketSource source(settings);
    ASSERT_TRUE(source.open());
    ASSERT_NE(source.bound_port(), 0u);

    send_to(source.bound_port(), make_rtp(0x100, 1, 960, kOpusFrame));
    send_to(source.bound_port(), {0x00, 0x01});  // garbage
    send_to(source.bound_port(), make_rtp(0x200, 7, 960, kOpusFrame));

    AudioPacket first;
    AudioPacket second;
    ASSERT_TRUE(source.receive(first));
    ASSERT_TRUE(source.receive(second));
    EXPECT_EQ(first.source_tag, 0x100u);
    EXPECT_EQ(second.source_tag, 0x200u);
    EXPECT_EQ(second.payload, kOpusFrame);
    EXPECT_NE(second.received_time, std::chrono::steady_clock::time_point{});

    auto stats = source.get_stats();
    EXPECT_EQ(stats.datagrams_received, 3u);
    EXPECT_EQ(stats.malformed_datagrams, 1u);
    EXPECT_EQ(stats.packets_delivered, 2u);
    EXPECT_EQ(stats.known_ssrcs, 2u);
}

TEST_F(RtpPacketSourceLoopbackTest, ReordersWithinWindow) {
    settings.reorder_window_ms = 30;
    RtpPacketSource source(settings);
    ASSERT_TRUE(source.open());

    send_to(source.bound_port(), make_rtp(0x300, 10, 0, kOpusFrame));
    send_to(source.bound_port(), make_rtp(0x300, 12, 1920, kOpusFrame));
    send_to(source.bound_port(), make_rtp(0x300, 11, 960, kOpusFrame));

    std::vector<uint16_t> order;
    for (int i = 0; i < 3; ++i) {
        AudioPacket packet;
        ASSERT_TRUE(source.receive(packet));
        order.push_back(packet.sequence_number);
    }
    EXPECT_EQ(order, (std::vector<uint16_t>{10, 11, 12}));
}

TEST_F(RtpPacketSourceLoopbackTest, CloseUnblocksReceive) {
    settings.poll_timeout_ms = 10;
    RtpPacketSource source(settings);
    ASSERT_TRUE(source.open());

    std::thread closer([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        source.close();
    });
    AudioPacket packet;
    EXPECT_FALSE(source.receive(packet));
    closer.join();
}

TEST_F(RtpPacketSourceLoopbackTest, InvalidBindAddressFails) {
    settings.bind_address = "not-an-address";
    RtpPacketSource source(settings);
    EXPECT_FALSE(source.open());
}

TEST_F(RtpPacketSourceLoopbackTest, ReceiveWithoutOpenFails) {
    RtpPacketSource source(settings);
    AudioPacket packet;
    EXPECT_FALSE(source.receive(packet));
}
