/**
 * @file voice_types.h
 * @brief Core data types shared by the voice engine components.
 * @details Packets flow from a live source through the ingestion loop into per-source
 *          sessions. Flushed sessions produce immutable batches that travel to a
 *          per-source dispatcher.
 */
#ifndef VOICE_TYPES_H
#define VOICE_TYPES_H

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

/** @brief Payload size of a silence marker frame. */
constexpr std::size_t kSilenceSentinelSize = 3;
/** @brief Payload bytes the transport sends in place of audio while a speaker is silent. */
constexpr std::array<uint8_t, kSilenceSentinelSize> kSilenceSentinel = {0xF8, 0xFF, 0xFE};

/** @brief RTP payload type used for Opus by the voice transport. */
constexpr uint8_t kRtpPayloadTypeOpus = 111;
/** @brief Opus always runs its RTP and granule clocks at 48 kHz. */
constexpr int kOpusClockRate = 48000;

/**
 * @enum PacketKind
 * @brief Classification of one inbound packet.
 */
enum class PacketKind {
    Silence, ///< Payload equals the silence sentinel.
    Empty,   ///< Zero-length payload.
    Voice    ///< Anything else: an encoded audio frame.
};

/**
 * @struct AudioPacket
 * @brief One unit delivered by the live transport.
 */
struct AudioPacket {
    /** @brief Per-participant identifier (RTP SSRC). */
    uint32_t source_tag = 0;
    uint16_t sequence_number = 0;
    /** @brief Presentation timestamp in RTP clock units. */
    uint32_t rtp_timestamp = 0;
    uint8_t payload_type = kRtpPayloadTypeOpus;
    std::chrono::steady_clock::time_point received_time{};
    /** @brief Opaque encoded payload (an Opus frame for voice packets). */
    std::vector<uint8_t> payload;
};

/**
 * @struct FlushBatch
 * @brief Immutable snapshot of a session's buffered packets, taken at flush time.
 * @details Batches are shared as `std::shared_ptr<const FlushBatch>` so that nothing
 *          downstream can mutate them.
 */
struct FlushBatch {
    uint32_t source_tag = 0;
    /** @brief Zero-based per-source flush counter; batches of one source are dispatched in this order. */
    uint64_t flush_index = 0;
    std::chrono::steady_clock::time_point flushed_at{};
    std::vector<AudioPacket> packets;

    bool empty() const { return packets.empty(); }
    std::size_t size() const { return packets.size(); }
};

/**
 * @brief Result sink invoked once per successfully recognized batch.
 * @details Never invoked concurrently for the same source tag.
 */
using TranscriptionCallback = std::function<void(uint32_t source_tag, const std::string& transcript, double confidence)>;

/**
 * @struct EngineCounters
 * @brief Process-wide counters shared by all engine threads.
 */
struct EngineCounters {
    std::atomic<uint64_t> packets_received{0};
    std::atomic<uint64_t> voice_packets{0};
    std::atomic<uint64_t> silence_markers{0};
    std::atomic<uint64_t> empty_packets_dropped{0};
    std::atomic<uint64_t> packets_rejected{0};
    std::atomic<uint64_t> session_create_failures{0};
    std::atomic<uint64_t> bytes_buffered{0};
    std::atomic<uint64_t> flushes{0};
    std::atomic<uint64_t> batches_dispatched{0};
    std::atomic<uint64_t> batches_dropped_queue_full{0};
    std::atomic<uint64_t> batches_dropped_closed{0};
    std::atomic<uint64_t> encode_failures{0};
    std::atomic<uint64_t> recognition_failures{0};
    std::atomic<uint64_t> transcripts_delivered{0};
    std::atomic<uint64_t> diagnostics_written{0};
    std::atomic<int64_t> open_recordings{0};

    void reset() {
        packets_received = 0;
        voice_packets = 0;
        silence_markers = 0;
        empty_packets_dropped = 0;
        packets_rejected = 0;
        session_create_failures = 0;
        bytes_buffered = 0;
        flushes = 0;
        batches_dispatched = 0;
        batches_dropped_queue_full = 0;
        batches_dropped_closed = 0;
        encode_failures = 0;
        recognition_failures = 0;
        transcripts_delivered = 0;
        diagnostics_written = 0;
    }
};

/**
 * @struct DispatcherStats
 * @brief Counters maintained by one per-source dispatcher worker.
 */
struct DispatcherStats {
    std::size_t queue_size = 0;
    std::size_t queue_capacity = 0;
    uint64_t batches_submitted = 0;
    uint64_t batches_dropped = 0;
    uint64_t batches_processed = 0;
    uint64_t encode_failures = 0;
    uint64_t recognition_failures = 0;
    uint64_t transcripts_delivered = 0;
    bool recording_open = false;
    bool closed = false;
};

/**
 * @struct SourceStats
 * @brief Snapshot of one source session.
 */
struct SourceStats {
    uint32_t source_tag = 0;
    std::size_t buffered_packets = 0;
    std::size_t buffered_bytes = 0;
    uint64_t flush_count = 0;
    double last_activity_age_ms = 0.0;
    DispatcherStats dispatcher;
};

/**
 * @struct GlobalStats
 * @brief Plain-value copy of `EngineCounters`.
 */
struct GlobalStats {
    uint64_t packets_received = 0;
    uint64_t voice_packets = 0;
    uint64_t silence_markers = 0;
    uint64_t empty_packets_dropped = 0;
    uint64_t packets_rejected = 0;
    uint64_t session_create_failures = 0;
    uint64_t bytes_buffered = 0;
    uint64_t flushes = 0;
    uint64_t batches_dispatched = 0;
    uint64_t batches_dropped_queue_full = 0;
    uint64_t batches_dropped_closed = 0;
    uint64_t encode_failures = 0;
    uint64_t recognition_failures = 0;
    uint64_t transcripts_delivered = 0;
    uint64_t diagnostics_written = 0;
    int64_t open_recordings = 0;
};

struct VoiceEngineStats {
    GlobalStats global_stats;
    std::map<uint32_t, SourceStats> source_stats; // Keyed by source tag
};

inline GlobalStats snapshot_counters(const EngineCounters& counters) {
    GlobalStats stats;
    stats.packets_received = counters.packets_received.load();
    stats.voice_packets = counters.voice_packets.load();
    stats.silence_markers = counters.silence_markers.load();
    stats.empty_packets_dropped = counters.empty_packets_dropped.load();
    stats.packets_rejected = counters.packets_rejected.load();
    stats.session_create_failures = counters.session_create_failures.load();
    stats.bytes_buffered = counters.bytes_buffered.load();
    stats.flushes = counters.flushes.load();
    stats.batches_dispatched = counters.batches_dispatched.load();
    stats.batches_dropped_queue_full = counters.batches_dropped_queue_full.load();
    stats.batches_dropped_closed = counters.batches_dropped_closed.load();
    stats.encode_failures = counters.encode_failures.load();
    stats.recognition_failures = counters.recognition_failures.load();
    stats.transcripts_delivered = counters.transcripts_delivered.load();
    stats.diagnostics_written = counters.diagnostics_written.load();
    stats.open_recordings = counters.open_recordings.load();
    return stats;
}

} // namespace audio
} // namespace voicetap

#endif // VOICE_TYPES_H
