#include "segment_dispatcher.h"

#include "../utils/cpp_logger.h"

#include <ctime>
#include <exception>
#include <cstdio>
#include <utility>

namespace voicetap {
namespace audio {

namespace {

RecognitionFormat make_recognition_format(const VoiceEngineSettings& settings) {
    RecognitionFormat format;
    format.sample_rate = settings.stream_format.sample_rate;
    format.channels = settings.stream_format.channels;
    format.encoding = settings.dispatch.encoding;
    format.language_code = settings.dispatch.language_code;
    return format;
}

std::string dispatcher_name(uint32_t source_tag) {
    char name[32];
    std::snprintf(name, sizeof(name), "SegmentDispatcher:0x%08X", source_tag);
    return name;
}

} // namespace

SegmentDispatcher::SegmentDispatcher(uint32_t source_tag,
                                     const VoiceEngineSettings& settings,
                                     std::shared_ptr<ISpeechRecognizer> recognizer,
                                     TranscriptionCallback on_transcript,
                                     std::shared_ptr<DiagnosticsWriter> diagnostics,
                                     std::shared_ptr<EngineCounters> counters)
    : AudioComponent(dispatcher_name(source_tag)),
      source_tag_(source_tag),
      dispatch_tuning_(settings.dispatch),
      recording_settings_(settings.recording),
      recognition_format_(make_recognition_format(settings)),
      encoder_(settings.stream_format),
      recognizer_(std::move(recognizer)),
      on_transcript_(std::move(on_transcript)),
      diagnostics_(std::move(diagnostics)),
      counters_(counters ? std::move(counters) : std::make_shared<EngineCounters>()),
      queue_(settings.dispatch.queue_capacity) {
    LOG_CPP_DEBUG("[SegmentDispatcher:0x%08X] Created (queue capacity %zu)", source_tag_, queue_.capacity());
}

SegmentDispatcher::~SegmentDispatcher() {
    close();
}

void SegmentDispatcher::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_) {
        return;
    }
    launch_thread();
}

void SegmentDispatcher::stop() {
    close();
}

SubmitResult SegmentDispatcher::submit(std::shared_ptr<const FlushBatch> batch) {
    if (!batch || batch->empty()) {
        return SubmitResult::EmptyBatch;
    }
    const std::size_t packet_count = batch->size();

    switch (queue_.try_push(std::move(batch))) {
        case BatchQueue::PushResult::Pushed:
            batches_submitted_++;
            counters_->batches_dispatched++;
            return SubmitResult::Queued;
        case BatchQueue::PushResult::QueueFull:
            batches_dropped_++;
            counters_->batches_dropped_queue_full++;
            LOG_CPP_WARNING("[SegmentDispatcher:0x%08X] Queue full (%zu), dropping batch",
                            source_tag_, queue_.capacity());
            return SubmitResult::DroppedQueueFull;
        case BatchQueue::PushResult::QueueStopped:
        default:
            batches_dropped_++;
            counters_->batches_dropped_closed++;
            LOG_CPP_WARNING("[SegmentDispatcher:0x%08X] Batch of %zu packets submitted after close, dropping",
                            source_tag_, packet_count);
            return SubmitResult::DroppedClosed;
    }
}

void SegmentDispatcher::request_close() {
    queue_.stop();
}

void SegmentDispatcher::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_) {
        return;
    }
    queue_.stop();
    stop_flag_ = true;
    join_thread();
    close_recording();
    closed_ = true;
    LOG_CPP_DEBUG("[SegmentDispatcher:0x%08X] Closed after %llu batches", source_tag_,
                  static_cast<unsigned long long>(batches_processed_.load()));
}

DispatcherStats SegmentDispatcher::get_stats() const {
    DispatcherStats stats;
    stats.queue_size = queue_.size();
    stats.queue_capacity = queue_.capacity();
    stats.batches_submitted = batches_submitted_.load();
    stats.batches_dropped = batches_dropped_.load();
    stats.batches_processed = batches_processed_.load();
    stats.encode_failures = encode_failures_.load();
    stats.recognition_failures = recognition_failures_.load();
    stats.transcripts_delivered = transcripts_delivered_.load();
    stats.recording_open = recording_open_.load();
    stats.closed = closed_.load();
    return stats;
}

void SegmentDispatcher::run() {
    LOG_CPP_DEBUG("[SegmentDispatcher:0x%08X] Worker started", source_tag_);
    std::shared_ptr<const FlushBatch> batch;
    // pop() keeps returning queued batches after stop(), so the queue drains before exit.
    while (queue_.pop(batch)) {
        if (batch) {
            process_batch(*batch);
        }
        batch.reset();
    }
    LOG_CPP_DEBUG("[SegmentDispatcher:0x%08X] Worker exiting", source_tag_);
}

void SegmentDispatcher::process_batch(const FlushBatch& batch) {
    batches_processed_++;

    if (recording_settings_.enabled) {
        append_to_recording(batch);
    }

    std::vector<uint8_t> encoded;
    std::string error;
    if (!encoder_.encode(batch, encoded, error)) {
        encode_failures_++;
        counters_->encode_failures++;
        LOG_CPP_ERROR("[SegmentDispatcher:0x%08X] Failed to encode batch #%llu (%zu packets): %s",
                      source_tag_, static_cast<unsigned long long>(batch.flush_index), batch.size(), error.c_str());
        return;
    }

    RecognitionResult result;
    try {
        result = recognizer_->recognize(source_tag_, encoded, recognition_format_);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    if (result.success && result.transcript.empty()) {
        result.success = false;
        result.error = "recognizer returned no transcript";
    }

    if (!result.success) {
        recognition_failures_++;
        counters_->recognition_failures++;
        LOG_CPP_WARNING("[SegmentDispatcher:0x%08X] Recognition failed for batch #%llu (%zu bytes): %s",
                        source_tag_, static_cast<unsigned long long>(batch.flush_index), encoded.size(),
                        result.error.c_str());
        save_diagnostics(encoded);
        return;
    }

    LOG_CPP_DEBUG("[SegmentDispatcher:0x%08X] Transcript for batch #%llu (confidence %.2f)",
                  source_tag_, static_cast<unsigned long long>(batch.flush_index), result.confidence);
    if (!on_transcript_) {
        return;
    }
    transcripts_delivered_++;
    counters_->transcripts_delivered++;
    try {
        on_transcript_(source_tag_, result.transcript, static_cast<double>(result.confidence));
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("[SegmentDispatcher:0x%08X] Transcript callback threw: %s", source_tag_, e.what());
    }
}

void SegmentDispatcher::append_to_recording(const FlushBatch& batch) {
    if (!recording_) {
        const std::string path =
            make_timestamped_filename(recording_settings_.directory, "audio", source_tag_, std::time(nullptr));
        auto writer = std::make_unique<OggOpusWriter>(recognition_format_.sample_rate,
                                                      recognition_format_.channels, source_tag_);
        if (!writer->open_file(path)) {
            // Retried with the next batch.
            if (!recording_failed_logged_) {
                LOG_CPP_ERROR("[SegmentDispatcher:0x%08X] Failed to open recording %s: %s",
                              source_tag_, path.c_str(), writer->last_error().c_str());
                recording_failed_logged_ = true;
            }
            return;
        }
        recording_ = std::move(writer);
        recording_open_ = true;
        counters_->open_recordings++;
        LOG_CPP_INFO("[SegmentDispatcher:0x%08X] Recording to %s", source_tag_, path.c_str());
    }

    for (const auto& packet : batch.packets) {
        if (!recording_->write_packet(packet)) {
            LOG_CPP_WARNING("[SegmentDispatcher:0x%08X] Recording skipped packet seq=%u: %s",
                            source_tag_, packet.sequence_number, recording_->last_error().c_str());
        }
    }
}

void SegmentDispatcher::close_recording() {
    if (!recording_) {
        return;
    }
    if (!recording_->close()) {
        LOG_CPP_ERROR("[SegmentDispatcher:0x%08X] Failed to finalize recording %s: %s",
                      source_tag_, recording_->path().c_str(), recording_->last_error().c_str());
    } else {
        LOG_CPP_INFO("[SegmentDispatcher:0x%08X] Closed recording %s (%llu packets)", source_tag_,
                     recording_->path().c_str(),
                     static_cast<unsigned long long>(recording_->packets_written()));
    }
    recording_.reset();
    recording_open_ = false;
    counters_->open_recordings--;
}

void SegmentDispatcher::save_diagnostics(const std::vector<uint8_t>& encoded) {
    if (!diagnostics_ || !diagnostics_->enabled()) {
        return;
    }
    std::string path;
    if (diagnostics_->write_failed_batch(source_tag_, encoded, path)) {
        counters_->diagnostics_written++;
    }
}

} // namespace audio
} // namespace voicetap
