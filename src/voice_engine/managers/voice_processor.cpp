#include "voice_processor.h"

#include "../dispatch/segment_dispatcher.h"
#include "../utils/cpp_logger.h"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace voicetap {
namespace audio {

VoiceProcessor::VoiceProcessor(VoiceEngineSettings settings,
                               std::shared_ptr<ISpeechRecognizer> recognizer,
                               TranscriptionCallback on_transcript)
    : m_settings(std::move(settings)),
      m_recognizer(std::move(recognizer)),
      m_on_transcript(std::move(on_transcript)),
      m_counters(std::make_shared<EngineCounters>()) {
    if (!m_recognizer) {
        throw std::invalid_argument("VoiceProcessor requires a speech recognizer");
    }
    m_diagnostics = std::make_shared<DiagnosticsWriter>(m_settings.dispatch.diagnostics_directory,
                                                        m_settings.dispatch.write_diagnostics);
    LOG_CPP_INFO("[VoiceProcessor] Initialized (threshold=%ldms, scan=%ldms, queue=%zu, recording=%s)",
                 m_settings.silence_detection.silence_threshold_ms,
                 m_settings.silence_detection.scan_interval_ms,
                 m_settings.dispatch.queue_capacity,
                 m_settings.recording.enabled ? "on" : "off");
}

VoiceProcessor::~VoiceProcessor() {
    stop_processing();
}

std::shared_ptr<IBatchSink> VoiceProcessor::create_dispatcher(uint32_t source_tag) {
    auto dispatcher = std::make_shared<SegmentDispatcher>(source_tag, m_settings, m_recognizer,
                                                          m_on_transcript, m_diagnostics, m_counters);
    dispatcher->start();
    return dispatcher;
}

bool VoiceProcessor::start_processing(std::shared_ptr<IPacketSource> source) {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_running) {
        LOG_CPP_ERROR("[VoiceProcessor] Processing already started");
        return false;
    }
    if (!source) {
        LOG_CPP_ERROR("[VoiceProcessor] Cannot start processing without a packet source");
        return false;
    }

    LOG_CPP_INFO("[VoiceProcessor] Starting processing...");
    m_counters->reset();

    auto store = std::make_shared<SessionStore>(
        [this](uint32_t source_tag) { return create_dispatcher(source_tag); }, m_counters);
    m_silence_detector = std::make_unique<SilenceDetector>(store, m_settings.silence_detection);
    m_ingestion_loop = std::make_unique<IngestionLoop>(std::move(source), store, m_counters,
                                                       m_settings.telemetry);
    {
        std::lock_guard<std::mutex> store_lock(m_store_mutex);
        m_session_store = store;
        m_final_source_stats.clear();
    }

    try {
        m_silence_detector->start();
        m_ingestion_loop->start();
    } catch (const std::system_error& e) {
        LOG_CPP_ERROR("[VoiceProcessor] Failed to start processing threads: %s", e.what());
        m_ingestion_loop->stop();
        m_silence_detector->stop();
        m_ingestion_loop.reset();
        m_silence_detector.reset();
        std::lock_guard<std::mutex> store_lock(m_store_mutex);
        m_session_store.reset();
        return false;
    }

    m_running = true;
    LOG_CPP_INFO("[VoiceProcessor] Processing started");
    return true;
}

void VoiceProcessor::stop_processing() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_running) {
        return;
    }
    LOG_CPP_INFO("[VoiceProcessor] Stopping processing...");

    m_ingestion_loop->stop();
    m_silence_detector->stop();

    std::shared_ptr<SessionStore> store;
    {
        std::lock_guard<std::mutex> store_lock(m_store_mutex);
        store = m_session_store;
    }
    const auto now = std::chrono::steady_clock::now();
    auto final_stats = store->collect_stats(now);
    auto handoffs = store->close_all(now);

    std::size_t final_flushes = 0;
    for (auto& handoff : handoffs) {
        if (handoff.batch) {
            LOG_CPP_DEBUG("[VoiceProcessor] Final flush for SSRC 0x%08X (%zu packets)",
                          handoff.source_tag, handoff.batch->size());
        }
        if (handoff.result == SubmitResult::Queued) {
            ++final_flushes;
        }
    }
    for (auto& handoff : handoffs) {
        if (handoff.sink) {
            handoff.sink->request_close();
        }
    }
    for (auto& handoff : handoffs) {
        if (!handoff.sink) {
            continue;
        }
        handoff.sink->close();

        SourceStats& stats = final_stats[handoff.source_tag];
        stats.source_tag = handoff.source_tag;
        if (handoff.batch) {
            stats.flush_count++;
        }
        stats.buffered_packets = 0;
        stats.buffered_bytes = 0;
        stats.dispatcher = handoff.sink->get_stats();
    }

    m_ingestion_loop.reset();
    m_silence_detector.reset();
    VoiceEngineStats stats;
    stats.global_stats = snapshot_counters(*m_counters);
    stats.source_stats = final_stats;
    {
        std::lock_guard<std::mutex> store_lock(m_store_mutex);
        m_final_source_stats = std::move(final_stats);
        m_session_store.reset();
    }
    m_running = false;

    LOG_CPP_INFO("[VoiceProcessor] Processing stopped (%zu final flushes)", final_flushes);
    log_final_stats(stats);
}

bool VoiceProcessor::flush_source(uint32_t source_tag) {
    std::shared_ptr<SessionStore> store;
    {
        std::lock_guard<std::mutex> lock(m_store_mutex);
        store = m_session_store;
    }
    if (!store) {
        return false;
    }
    auto handoff = store->snapshot_and_clear(source_tag, std::chrono::steady_clock::now());
    if (!handoff.batch) {
        return false;
    }
    LOG_CPP_INFO("[VoiceProcessor] Manual flush for SSRC 0x%08X (%zu packets)", source_tag, handoff.batch->size());
    return handoff.result == SubmitResult::Queued;
}

std::size_t VoiceProcessor::flush_all() {
    std::shared_ptr<SessionStore> store;
    {
        std::lock_guard<std::mutex> lock(m_store_mutex);
        store = m_session_store;
    }
    if (!store) {
        return 0;
    }
    std::size_t queued = 0;
    for (const auto& handoff : store->snapshot_all(std::chrono::steady_clock::now())) {
        if (handoff.result == SubmitResult::Queued) {
            ++queued;
        }
    }
    LOG_CPP_INFO("[VoiceProcessor] Manual flush of all sources queued %zu batches", queued);
    return queued;
}

VoiceEngineStats VoiceProcessor::get_stats() const {
    VoiceEngineStats stats;
    stats.global_stats = snapshot_counters(*m_counters);

    std::shared_ptr<SessionStore> store;
    {
        std::lock_guard<std::mutex> lock(m_store_mutex);
        store = m_session_store;
        if (!store) {
            stats.source_stats = m_final_source_stats;
            return stats;
        }
    }
    stats.source_stats = store->collect_stats(std::chrono::steady_clock::now());
    return stats;
}

void VoiceProcessor::log_final_stats(const VoiceEngineStats& stats) const {
    const GlobalStats& g = stats.global_stats;
    LOG_CPP_INFO("[VoiceProcessor] Final stats: packets=%llu voice=%llu silence=%llu empty=%llu flushes=%llu "
                 "dispatched=%llu dropped=%llu dropped_closed=%llu transcripts=%llu recognition_failures=%llu encode_failures=%llu "
                 "bytes=%llu sources=%zu",
                 static_cast<unsigned long long>(g.packets_received),
                 static_cast<unsigned long long>(g.voice_packets),
                 static_cast<unsigned long long>(g.silence_markers),
                 static_cast<unsigned long long>(g.empty_packets_dropped),
                 static_cast<unsigned long long>(g.flushes),
                 static_cast<unsigned long long>(g.batches_dispatched),
                 static_cast<unsigned long long>(g.batches_dropped_queue_full),
                 static_cast<unsigned long long>(g.batches_dropped_closed),
                 static_cast<unsigned long long>(g.transcripts_delivered),
                 static_cast<unsigned long long>(g.recognition_failures),
                 static_cast<unsigned long long>(g.encode_failures),
                 static_cast<unsigned long long>(g.bytes_buffered),
                 stats.source_stats.size());
    for (const auto& [tag, source] : stats.source_stats) {
        LOG_CPP_INFO("[VoiceProcessor]   SSRC 0x%08X: flushes=%llu processed=%llu dropped=%llu transcripts=%llu",
                     tag,
                     static_cast<unsigned long long>(source.flush_count),
                     static_cast<unsigned long long>(source.dispatcher.batches_processed),
                     static_cast<unsigned long long>(source.dispatcher.batches_dropped),
                     static_cast<unsigned long long>(source.dispatcher.transcripts_delivered));
    }
}

} // namespace audio
} // namespace voicetap
