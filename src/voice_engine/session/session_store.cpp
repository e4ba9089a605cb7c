#include "session_store.h"

#include "../utils/cpp_logger.h"

#include <exception>
#include <utility>

namespace voicetap {
namespace audio {

SessionStore::SessionStore(SessionSinkFactory sink_factory, std::shared_ptr<EngineCounters> counters)
    : sink_factory_(std::move(sink_factory)),
      counters_(counters ? std::move(counters) : std::make_shared<EngineCounters>()) {}

AppendResult SessionStore::append(AudioPacket&& packet, std::chrono::steady_clock::time_point now) {
    const uint32_t tag = packet.source_tag;
    const std::size_t payload_size = packet.payload.size();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return AppendResult::StoreClosed;
        }
        auto it = sessions_.find(tag);
        if (it != sessions_.end()) {
            it->second.buffered_packets.push_back(std::move(packet));
            it->second.buffered_bytes += payload_size;
            it->second.last_activity = now;
            counters_->bytes_buffered += payload_size;
            return AppendResult::Appended;
        }
    }

    // Unknown source: build its sink without holding the lock.
    std::shared_ptr<IBatchSink> sink;
    try {
        sink = sink_factory_ ? sink_factory_(tag) : nullptr;
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("[SessionStore] Failed to create dispatcher for SSRC 0x%08X: %s", tag, e.what());
        sink.reset();
    }
    if (!sink) {
        return AppendResult::CreateFailed;
    }

    std::shared_ptr<IBatchSink> discarded;
    AppendResult result = AppendResult::CreatedAndAppended;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            discarded = std::move(sink);
            result = AppendResult::StoreClosed;
        } else {
            auto inserted = sessions_.emplace(tag, SourceSession{});
            SourceSession& session = inserted.first->second;
            if (inserted.second) {
                session.source_tag = tag;
                session.sink = std::move(sink);
            } else {
                // Created concurrently by another caller; keep the registered sink.
                discarded = std::move(sink);
                result = AppendResult::Appended;
            }
            session.buffered_packets.push_back(std::move(packet));
            session.buffered_bytes += payload_size;
            session.last_activity = now;
            counters_->bytes_buffered += payload_size;
        }
    }

    if (discarded) {
        discarded->request_close();
        discarded->close();
    }
    if (result == AppendResult::CreatedAndAppended) {
        LOG_CPP_INFO("[SessionStore] New source session for SSRC 0x%08X", tag);
    }
    return result;
}

std::shared_ptr<const FlushBatch> SessionStore::take_batch_locked(SourceSession& session,
                                                                  std::chrono::steady_clock::time_point now) {
    session.last_activity = now;
    if (session.buffered_packets.empty()) {
        return nullptr;
    }

    auto batch = std::make_shared<FlushBatch>();
    batch->source_tag = session.source_tag;
    batch->flush_index = session.flush_count++;
    batch->flushed_at = now;
    batch->packets.swap(session.buffered_packets);
    session.buffered_bytes = 0;
    counters_->flushes++;
    return batch;
}

FlushHandoff SessionStore::flush_locked(SourceSession& session, std::chrono::steady_clock::time_point now) {
    FlushHandoff handoff;
    handoff.source_tag = session.source_tag;
    handoff.sink = session.sink;
    handoff.batch = take_batch_locked(session, now);
    if (handoff.batch && handoff.sink) {
        handoff.result = handoff.sink->submit(handoff.batch);
    }
    return handoff;
}

FlushHandoff SessionStore::snapshot_and_clear(uint32_t source_tag, std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(source_tag);
    if (it == sessions_.end()) {
        return {};
    }
    FlushHandoff handoff = flush_locked(it->second, now);
    if (!handoff.batch) {
        handoff.sink.reset();
    }
    return handoff;
}

std::vector<FlushHandoff> SessionStore::take_stale(std::chrono::steady_clock::time_point now,
                                                   std::chrono::milliseconds threshold) {
    std::vector<FlushHandoff> handoffs;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : sessions_) {
        SourceSession& session = entry.second;
        if (session.buffered_packets.empty()) {
            continue;
        }
        if (now - session.last_activity < threshold) {
            continue;
        }
        handoffs.push_back(flush_locked(session, now));
    }
    return handoffs;
}

std::vector<FlushHandoff> SessionStore::snapshot_all(std::chrono::steady_clock::time_point now) {
    std::vector<FlushHandoff> handoffs;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : sessions_) {
        SourceSession& session = entry.second;
        if (session.buffered_packets.empty()) {
            continue;
        }
        handoffs.push_back(flush_locked(session, now));
    }
    return handoffs;
}

std::vector<FlushHandoff> SessionStore::close_all(std::chrono::steady_clock::time_point now) {
    std::vector<FlushHandoff> handoffs;
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return handoffs;
    }
    closed_ = true;
    handoffs.reserve(sessions_.size());
    for (auto& entry : sessions_) {
        handoffs.push_back(flush_locked(entry.second, now));
    }
    sessions_.clear();
    return handoffs;
}

std::vector<uint32_t> SessionStore::known_tags() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> tags;
    tags.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        tags.push_back(entry.first);
    }
    return tags;
}

std::size_t SessionStore::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionStore::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::map<uint32_t, SourceStats> SessionStore::collect_stats(std::chrono::steady_clock::time_point now) const {
    std::vector<std::pair<SourceStats, std::shared_ptr<IBatchSink>>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.reserve(sessions_.size());
        for (const auto& [tag, session] : sessions_) {
            SourceStats stats;
            stats.source_tag = tag;
            stats.buffered_packets = session.buffered_packets.size();
            stats.buffered_bytes = session.buffered_bytes;
            stats.flush_count = session.flush_count;
            stats.last_activity_age_ms =
                std::chrono::duration<double, std::milli>(now - session.last_activity).count();
            pending.emplace_back(stats, session.sink);
        }
    }

    std::map<uint32_t, SourceStats> result;
    for (auto& [stats, sink] : pending) {
        if (sink) {
            stats.dispatcher = sink->get_stats();
        }
        result[stats.source_tag] = stats;
    }
    return result;
}

} // namespace audio
} // namespace voicetap
