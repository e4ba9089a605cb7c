/**
 * @file rtp_packet_source.h
 * @brief UDP/RTP implementation of the live packet source.
 */
#ifndef RTP_PACKET_SOURCE_H
#define RTP_PACKET_SOURCE_H

#include "rtp_reordering_buffer.h"
#include "../../ingest/i_packet_source.h"
#include "../../configuration/voice_engine_settings.h"
#include "../../voice_types.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

/**
 * @struct RtpPacketSourceStats
 * @brief Receive-side counters of an `RtpPacketSource`.
 */
struct RtpPacketSourceStats {
    uint64_t datagrams_received = 0;
    uint64_t malformed_datagrams = 0;
    uint64_t packets_delivered = 0;
    std::size_t known_ssrcs = 0;
};

/**
 * @class RtpPacketSource
 * @brief Receives RTP datagrams on a UDP socket and yields one `AudioPacket` per datagram.
 * @details The SSRC becomes the packet's source tag; CSRCs, header extensions and padding
 *          are stripped so the payload is the bare Opus frame. With a non-zero reorder
 *          window, packets of each SSRC pass through an `RtpReorderingBuffer` and are
 *          delivered in sequence order.
 *
 *          `receive` and `open` must be called from one thread; `close` may be called from
 *          any thread and takes effect within one poll interval.
 */
class RtpPacketSource : public IPacketSource {
public:
    explicit RtpPacketSource(RtpSourceSettings settings);
    ~RtpPacketSource() override;

    RtpPacketSource(const RtpPacketSource&) = delete;
    RtpPacketSource& operator=(const RtpPacketSource&) = delete;

    /**
     * @brief Creates, configures and binds the UDP socket.
     * @return false if the socket could not be created or bound.
     */
    bool open();

    bool receive(AudioPacket& out_packet) override;
    void close() override;

    /** @brief Port the socket is bound to (useful when the configured port is 0). */
    uint16_t bound_port() const { return bound_port_; }

    RtpPacketSourceStats get_stats() const;

    /**
     * @brief Parses one RTP datagram into an `AudioPacket`.
     * @param out_error Receives the reason when the datagram is rejected.
     * @return false for truncated datagrams, a version other than 2, or inconsistent
     *         extension/padding lengths.
     */
    static bool parse_rtp_datagram(const uint8_t* data,
                                   std::size_t size,
                                   AudioPacket& out_packet,
                                   std::string& out_error);

private:
    bool wait_for_datagram();
    void read_datagram();
    void collect_ready_packets(std::chrono::steady_clock::time_point now);
    void close_socket();

    const RtpSourceSettings settings_;
    int socket_fd_ = -1;
    int epoll_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> closed_{false};

    std::vector<uint8_t> receive_buffer_;
    std::set<uint32_t> known_ssrc_set_;
    std::map<uint32_t, RtpReorderingBuffer> reordering_buffers_;
    std::deque<AudioPacket> ready_packets_;

    std::atomic<uint64_t> datagrams_received_{0};
    std::atomic<uint64_t> malformed_datagrams_{0};
    std::atomic<uint64_t> packets_delivered_{0};
    std::atomic<std::size_t> known_ssrcs_{0};
    uint64_t last_malformed_log_count_ = 0;
};

} // namespace audio
} // namespace voicetap

#endif // RTP_PACKET_SOURCE_H
