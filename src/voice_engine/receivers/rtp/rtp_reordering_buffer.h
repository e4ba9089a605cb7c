#pragma once

#include "../../voice_types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace voicetap {
namespace audio {

/**
 * @brief A buffer to handle out-of-order RTP packets of a single SSRC.
 *
 * Packets are stored sorted by sequence number and released in order. A gap is
 * waited on for at most `max_delay` before the missing packets are declared lost.
 */
class RtpReorderingBuffer {
public:
    /**
     * @brief Constructs the reordering buffer.
     * @param max_delay The maximum time to wait for a missing packet before skipping it.
     * @param max_size The maximum number of packets to store to prevent buffer bloat.
     */
    explicit RtpReorderingBuffer(
        std::chrono::milliseconds max_delay = std::chrono::milliseconds(50),
        size_t max_size = 128
    );

    /**
     * @brief Adds a packet to the buffer. Late and duplicate packets are discarded.
     */
    void add_packet(AudioPacket&& packet);

    /**
     * @brief Retrieves all packets that are now ready to be processed in sequence.
     * @param now Reference time used to decide whether a gap has timed out.
     * @return A vector of packets in correct sequence number order.
     */
    std::vector<AudioPacket> get_ready_packets(std::chrono::steady_clock::time_point now);

    /**
     * @brief Releases every buffered packet in sequence order, skipping any gaps.
     */
    std::vector<AudioPacket> drain();

    /**
     * @brief Clears all stored packets. Called on stream reset.
     */
    void reset();

    size_t size() const;

    uint64_t late_packets() const { return m_late_packets; }
    uint64_t duplicate_packets() const { return m_duplicate_packets; }
    uint64_t lost_packets() const { return m_lost_packets; }

private:
    std::map<uint16_t, AudioPacket> m_buffer;

    uint16_t m_next_expected_seq;
    bool m_is_initialized;

    const std::chrono::milliseconds m_max_delay;
    const size_t m_max_size;

    uint64_t m_late_packets = 0;
    uint64_t m_duplicate_packets = 0;
    uint64_t m_lost_packets = 0;
    std::chrono::steady_clock::time_point m_last_out_of_order_log{};

    // Compares 16-bit sequence numbers with wraparound.
    static bool is_sequence_greater(uint16_t seq1, uint16_t seq2);
};

} // namespace audio
} // namespace voicetap
