#include "rtp_reordering_buffer.h"
#include "../../utils/cpp_logger.h"

#include <limits>
#include <utility>

namespace voicetap {
namespace audio {

RtpReorderingBuffer::RtpReorderingBuffer(std::chrono::milliseconds max_delay, size_t max_size)
    : m_next_expected_seq(0),
      m_is_initialized(false),
      m_max_delay(max_delay),
      m_max_size(max_size > 0 ? max_size : 1) {}

void RtpReorderingBuffer::add_packet(AudioPacket&& packet) {
    if (!m_is_initialized) {
        m_is_initialized = true;
        m_next_expected_seq = packet.sequence_number;
        LOG_CPP_DEBUG("[RtpReorderingBuffer] SSRC 0x%08X initialized at seq %u",
                      packet.source_tag, packet.sequence_number);
    }

    if (packet.sequence_number != m_next_expected_seq &&
        is_sequence_greater(packet.sequence_number, m_next_expected_seq)) {
        const auto now = packet.received_time;
        if (m_last_out_of_order_log == std::chrono::steady_clock::time_point{} ||
            now - m_last_out_of_order_log >= std::chrono::milliseconds(200)) {
            LOG_CPP_DEBUG("[RtpReorderingBuffer] SSRC 0x%08X expected seq %u but received %u (gap=%u, buffered=%zu)",
                          packet.source_tag, m_next_expected_seq, packet.sequence_number,
                          static_cast<unsigned>(static_cast<uint16_t>(packet.sequence_number - m_next_expected_seq)),
                          m_buffer.size());
            m_last_out_of_order_log = now;
        }
    }

    // Already released.
    if (!is_sequence_greater(packet.sequence_number, m_next_expected_seq) &&
        packet.sequence_number != m_next_expected_seq) {
        m_late_packets++;
        LOG_CPP_DEBUG("[RtpReorderingBuffer] Discarding late packet seq %u (already at %u)",
                      packet.sequence_number, m_next_expected_seq);
        return;
    }

    if (m_buffer.count(packet.sequence_number)) {
        m_duplicate_packets++;
        LOG_CPP_DEBUG("[RtpReorderingBuffer] Discarding duplicate packet seq %u", packet.sequence_number);
        return;
    }

    const uint16_t new_delta = static_cast<uint16_t>(packet.sequence_number - m_next_expected_seq);

    if (m_buffer.size() >= m_max_size) {
        auto drop_it = m_buffer.end();
        uint16_t farthest_distance = 0;
        for (auto it = m_buffer.begin(); it != m_buffer.end(); ++it) {
            const uint16_t delta = static_cast<uint16_t>(it->first - m_next_expected_seq);
            if (drop_it == m_buffer.end() || delta > farthest_distance) {
                drop_it = it;
                farthest_distance = delta;
            }
        }

        if (drop_it != m_buffer.end() && new_delta > farthest_distance) {
            LOG_CPP_WARNING("[RtpReorderingBuffer] Buffer full (%zu), dropping incoming seq %u",
                            m_buffer.size(), packet.sequence_number);
            m_lost_packets++;
            return;
        }
        if (drop_it != m_buffer.end()) {
            LOG_CPP_WARNING("[RtpReorderingBuffer] Buffer full (%zu), discarding seq %u for seq %u",
                            m_buffer.size(), drop_it->first, packet.sequence_number);
            m_buffer.erase(drop_it);
            m_lost_packets++;
        }
    }

    m_buffer[packet.sequence_number] = std::move(packet);
}

std::vector<AudioPacket> RtpReorderingBuffer::get_ready_packets(std::chrono::steady_clock::time_point now) {
    std::vector<AudioPacket> ready_packets;
    if (!m_is_initialized) {
        return ready_packets;
    }

    while (!m_buffer.empty()) {
        auto exact_it = m_buffer.find(m_next_expected_seq);
        if (exact_it != m_buffer.end()) {
            ready_packets.push_back(std::move(exact_it->second));
            m_buffer.erase(exact_it);
            m_next_expected_seq++;
            continue;
        }

        auto candidate_it = m_buffer.end();
        uint16_t best_distance = std::numeric_limits<uint16_t>::max();
        for (auto it = m_buffer.begin(); it != m_buffer.end(); ++it) {
            const uint16_t delta = static_cast<uint16_t>(it->first - m_next_expected_seq);
            if (delta < best_distance) {
                candidate_it = it;
                best_distance = delta;
            }
        }

        if (now - candidate_it->second.received_time < m_max_delay) {
            break;
        }

        LOG_CPP_DEBUG("[RtpReorderingBuffer] Timed out waiting for %u packet(s) at seq %u, advancing to %u",
                      static_cast<unsigned>(best_distance), m_next_expected_seq, candidate_it->first);
        m_lost_packets += best_distance;
        m_next_expected_seq = candidate_it->first;
    }

    return ready_packets;
}

std::vector<AudioPacket> RtpReorderingBuffer::drain() {
    std::vector<AudioPacket> packets;
    packets.reserve(m_buffer.size());
    while (!m_buffer.empty()) {
        auto next_it = m_buffer.end();
        uint16_t best_distance = std::numeric_limits<uint16_t>::max();
        for (auto it = m_buffer.begin(); it != m_buffer.end(); ++it) {
            const uint16_t delta = static_cast<uint16_t>(it->first - m_next_expected_seq);
            if (next_it == m_buffer.end() || delta < best_distance) {
                next_it = it;
                best_distance = delta;
            }
        }
        m_next_expected_seq = static_cast<uint16_t>(next_it->first + 1);
        packets.push_back(std::move(next_it->second));
        m_buffer.erase(next_it);
    }
    return packets;
}

void RtpReorderingBuffer::reset() {
    m_buffer.clear();
    m_is_initialized = false;
    m_next_expected_seq = 0;
}

size_t RtpReorderingBuffer::size() const {
    return m_buffer.size();
}

bool RtpReorderingBuffer::is_sequence_greater(uint16_t seq1, uint16_t seq2) {
    return (seq1 != seq2) && (static_cast<uint16_t>(seq1 - seq2) < 32768);
}

} // namespace audio
} // namespace voicetap
