/**
 * @file session_store.h
 * @brief Keyed collection of per-source sessions buffering voice packets between flushes.
 */
#ifndef SESSION_STORE_H
#define SESSION_STORE_H

#include "../voice_types.h"
#include "../dispatch/i_batch_sink.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace voicetap {
namespace audio {

/**
 * @struct SourceSession
 * @brief State owned by the store for one source tag.
 */
struct SourceSession {
    uint32_t source_tag = 0;
    std::vector<AudioPacket> buffered_packets;
    std::size_t buffered_bytes = 0;
    std::chrono::steady_clock::time_point last_activity{};
    uint64_t flush_count = 0;
    std::shared_ptr<IBatchSink> sink;
};

/**
 * @struct FlushHandoff
 * @brief A flushed batch, the sink it was submitted to and the submit outcome.
 * @details The store submits before releasing its lock, so `result` is final when the
 *          caller sees the handoff. `result` is `EmptyBatch` when `batch` is null.
 */
struct FlushHandoff {
    uint32_t source_tag = 0;
    std::shared_ptr<const FlushBatch> batch;
    std::shared_ptr<IBatchSink> sink;
    SubmitResult result = SubmitResult::EmptyBatch;
};

/** @brief Creates the dispatcher for a newly seen source. May return null or throw on failure. */
using SessionSinkFactory = std::function<std::shared_ptr<IBatchSink>(uint32_t source_tag)>;

enum class AppendResult {
    Appended,
    CreatedAndAppended,
    CreateFailed,
    StoreClosed
};

/**
 * @class SessionStore
 * @brief Owns every source session; shared by the ingestion loop and the silence detector.
 * @details A single mutex guards the map and all session buffers. Snapshots swap the
 *          buffer out under the lock, so a packet is either in the snapshot or in the
 *          fresh buffer, never in both and never lost. Sinks are created outside the lock.
 *
 *          Every flush submits its batch to the session's sink while the lock is held.
 *          `IBatchSink::submit` never blocks, and holding the lock keeps the batches of a
 *          source in flush-index order no matter which thread triggered the flush. It also
 *          means no flush can land after `close_all` has handed out the sinks.
 */
class SessionStore {
public:
    SessionStore(SessionSinkFactory sink_factory, std::shared_ptr<EngineCounters> counters);
    ~SessionStore() = default;

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Appends a voice packet to its source's session, creating the session if needed.
     * @details On `CreateFailed` the packet is dropped and nothing is registered, so the
     *          next packet of that source retries creation.
     */
    AppendResult append(AudioPacket&& packet, std::chrono::steady_clock::time_point now);

    /**
     * @brief Takes the buffered packets of one source, resets its buffer and submits the batch.
     * @details Refreshes the session's activity time. Returns a handoff with a null batch
     *          if the source is unknown, has nothing buffered or the store is closed.
     */
    FlushHandoff snapshot_and_clear(uint32_t source_tag, std::chrono::steady_clock::time_point now);

    /**
     * @brief Flushes every session that has buffered packets and has been idle for at least `threshold`.
     */
    std::vector<FlushHandoff> take_stale(std::chrono::steady_clock::time_point now,
                                         std::chrono::milliseconds threshold);

    /** @brief Flushes every session with buffered packets regardless of idle time. */
    std::vector<FlushHandoff> snapshot_all(std::chrono::steady_clock::time_point now);

    /**
     * @brief Closes the store for good.
     * @details Submits each session's final batch, then returns one handoff per session
     *          (the batch is null where nothing was buffered) so the caller can close every
     *          sink. Later appends return `StoreClosed` and later flushes find nothing.
     */
    std::vector<FlushHandoff> close_all(std::chrono::steady_clock::time_point now);

    std::vector<uint32_t> known_tags() const;
    std::size_t session_count() const;
    bool is_closed() const;

    std::map<uint32_t, SourceStats> collect_stats(std::chrono::steady_clock::time_point now) const;

private:
    std::shared_ptr<const FlushBatch> take_batch_locked(SourceSession& session,
                                                        std::chrono::steady_clock::time_point now);
    FlushHandoff flush_locked(SourceSession& session, std::chrono::steady_clock::time_point now);

    SessionSinkFactory sink_factory_;
    std::shared_ptr<EngineCounters> counters_;

    mutable std::mutex mutex_;
    std::map<uint32_t, SourceSession> sessions_;
    bool closed_ = false;
};

} // namespace audio
} // namespace voicetap

#endif // SESSION_STORE_H
