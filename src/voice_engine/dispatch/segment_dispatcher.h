/**
 * @file segment_dispatcher.h
 * @brief Per-source worker that encodes flushed batches and forwards them to the recognizer.
 */
#ifndef SEGMENT_DISPATCHER_H
#define SEGMENT_DISPATCHER_H

#include "i_batch_sink.h"
#include "../utils/audio_component.h"
#include "../utils/thread_safe_queue.h"
#include "../voice_types.h"
#include "../configuration/voice_engine_settings.h"
#include "../encoding/container_encoder.h"
#include "../encoding/ogg_opus_writer.h"
#include "../recognition/i_speech_recognizer.h"
#include "../diagnostics/diagnostics_writer.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace voicetap {
namespace audio {

using BatchQueue = utils::ThreadSafeQueue<std::shared_ptr<const FlushBatch>>;

/**
 * @class SegmentDispatcher
 * @brief Owns the bounded batch queue and the single worker thread of one source.
 * @details Batches are processed strictly in submission order, so transcripts of a
 *          source are delivered in the order they were spoken. When the queue is full
 *          the newest batch is dropped and counted; the producer never blocks.
 *
 *          If session recording is enabled, the worker also appends every batch's frames
 *          to a per-source Ogg file that stays open until `close()`.
 */
class SegmentDispatcher : public AudioComponent, public IBatchSink {
public:
    SegmentDispatcher(uint32_t source_tag,
                      const VoiceEngineSettings& settings,
                      std::shared_ptr<ISpeechRecognizer> recognizer,
                      TranscriptionCallback on_transcript,
                      std::shared_ptr<DiagnosticsWriter> diagnostics,
                      std::shared_ptr<EngineCounters> counters);
    ~SegmentDispatcher() override;

    void start() override;
    void stop() override;

    SubmitResult submit(std::shared_ptr<const FlushBatch> batch) override;
    void request_close() override;
    void close() override;
    DispatcherStats get_stats() const override;

    uint32_t source_tag() const { return source_tag_; }

protected:
    void run() override;

private:
    void process_batch(const FlushBatch& batch);
    void append_to_recording(const FlushBatch& batch);
    void close_recording();
    void save_diagnostics(const std::vector<uint8_t>& encoded);

    const uint32_t source_tag_;
    const DispatchTuning dispatch_tuning_;
    const RecordingSettings recording_settings_;
    const RecognitionFormat recognition_format_;
    ContainerEncoder encoder_;

    std::shared_ptr<ISpeechRecognizer> recognizer_;
    TranscriptionCallback on_transcript_;
    std::shared_ptr<DiagnosticsWriter> diagnostics_;
    std::shared_ptr<EngineCounters> counters_;

    BatchQueue queue_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> closed_{false};

    // Touched only by the worker thread, then by close() after the join.
    std::unique_ptr<OggOpusWriter> recording_;
    bool recording_failed_logged_ = false;
    std::atomic<bool> recording_open_{false};

    std::atomic<uint64_t> batches_submitted_{0};
    std::atomic<uint64_t> batches_dropped_{0};
    std::atomic<uint64_t> batches_processed_{0};
    std::atomic<uint64_t> encode_failures_{0};
    std::atomic<uint64_t> recognition_failures_{0};
    std::atomic<uint64_t> transcripts_delivered_{0};
};

} // namespace audio
} // namespace voicetap

#endif // SEGMENT_DISPATCHER_H
