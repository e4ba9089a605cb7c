/**
 * @file voice_processor.h
 * @brief Defines the VoiceProcessor class, the orchestrator of the voice engine.
 * @details A VoiceProcessor owns the session store, the silence detector, the ingestion
 *          loop and (through the store) one segment dispatcher per active source. It
 *          exposes the start/stop lifecycle, manual flush triggers and a stats snapshot.
 */
#ifndef VOICE_PROCESSOR_H
#define VOICE_PROCESSOR_H

#include "../voice_types.h"
#include "../configuration/voice_engine_settings.h"
#include "../diagnostics/diagnostics_writer.h"
#include "../dispatch/silence_detector.h"
#include "../ingest/i_packet_source.h"
#include "../ingest/ingestion_loop.h"
#include "../recognition/i_speech_recognizer.h"
#include "../session/session_store.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace voicetap {
namespace audio {

/**
 * @class VoiceProcessor
 * @brief Splits a live multi-speaker stream per source and turns each utterance into a transcript.
 * @details Lifecycle: `start_processing` spawns the ingestion and silence-detection threads;
 *          dispatcher workers are spawned lazily as new sources appear. `stop_processing`
 *          stops ingestion, stops the detector, force-flushes every source with buffered
 *          audio, closes each dispatcher queue and waits for the workers to drain.
 *
 *          A processor can be started again after it has been stopped; counters are reset
 *          on every start.
 */
class VoiceProcessor {
public:
    /**
     * @param settings Engine tuning.
     * @param recognizer External speech-to-text backend. Must not be null.
     * @param on_transcript Invoked from dispatcher workers for every recognized batch.
     * @throws std::invalid_argument if `recognizer` is null.
     */
    VoiceProcessor(VoiceEngineSettings settings,
                   std::shared_ptr<ISpeechRecognizer> recognizer,
                   TranscriptionCallback on_transcript);
    ~VoiceProcessor();

    VoiceProcessor(const VoiceProcessor&) = delete;
    VoiceProcessor& operator=(const VoiceProcessor&) = delete;

    /**
     * @brief Starts consuming `source`.
     * @return false if processing is already running, `source` is null, or a thread could not be started.
     */
    bool start_processing(std::shared_ptr<IPacketSource> source);

    /**
     * @brief Stops processing and delivers the final forced flush of every source.
     * @details Blocks until every dispatcher has drained its queue. Safe to call repeatedly.
     */
    void stop_processing();

    bool is_processing() const { return m_running.load(); }

    /**
     * @brief Immediately flushes one source, regardless of silence.
     * @return true if a non-empty batch was queued for that source.
     */
    bool flush_source(uint32_t source_tag);

    /**
     * @brief Immediately flushes every source with buffered audio.
     * @return Number of batches queued.
     */
    std::size_t flush_all();

    /**
     * @brief Returns global counters and per-source stats.
     * @details After `stop_processing`, the per-source stats of the last run are returned.
     */
    VoiceEngineStats get_stats() const;

    const VoiceEngineSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<IBatchSink> create_dispatcher(uint32_t source_tag);
    void log_final_stats(const VoiceEngineStats& stats) const;

    const VoiceEngineSettings m_settings;
    std::shared_ptr<ISpeechRecognizer> m_recognizer;
    TranscriptionCallback m_on_transcript;
    std::shared_ptr<DiagnosticsWriter> m_diagnostics;
    std::shared_ptr<EngineCounters> m_counters;

    std::mutex m_lifecycle_mutex; // Serializes start/stop
    std::atomic<bool> m_running{false};
    mutable std::mutex m_store_mutex; // Guards m_session_store and m_final_source_stats
    std::shared_ptr<SessionStore> m_session_store;
    std::unique_ptr<SilenceDetector> m_silence_detector;
    std::unique_ptr<IngestionLoop> m_ingestion_loop;
    std::map<uint32_t, SourceStats> m_final_source_stats;
};

} // namespace audio
} // namespace voicetap

#endif // VOICE_PROCESSOR_H
