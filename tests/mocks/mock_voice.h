#pragma once
/**
 * Mock collaborators for the voice engine tests.
 * They let the pipeline run without a network transport or a real recognizer.
 */

#include "dispatch/i_batch_sink.h"
#include "ingest/i_packet_source.h"
#include "recognition/i_speech_recognizer.h"
#include "voice_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {
namespace testing {

/** A 20 ms CELT frame header followed by filler bytes; decodes to 960 samples. */
inline AudioPacket make_voice_packet(uint32_t tag, uint16_t seq, std::size_t payload_size = 4) {
    AudioPacket packet;
    packet.source_tag = tag;
    packet.sequence_number = seq;
    packet.rtp_timestamp = static_cast<uint32_t>(seq) * 960u;
    packet.received_time = std::chrono::steady_clock::now();
    packet.payload.assign(payload_size < 1 ? 1 : payload_size, 0x00);
    packet.payload[0] = 0xF8;
    for (std::size_t i = 1; i < packet.payload.size(); ++i) {
        packet.payload[i] = static_cast<uint8_t>(seq + i);
    }
    return packet;
}

inline AudioPacket make_silence_packet(uint32_t tag, uint16_t seq) {
    AudioPacket packet;
    packet.source_tag = tag;
    packet.sequence_number = seq;
    packet.rtp_timestamp = static_cast<uint32_t>(seq) * 960u;
    packet.payload.assign(kSilenceSentinel.begin(), kSilenceSentinel.end());
    return packet;
}

inline AudioPacket make_empty_packet(uint32_t tag, uint16_t seq) {
    AudioPacket packet;
    packet.source_tag = tag;
    packet.sequence_number = seq;
    return packet;
}

/**
 * Packet source fed by the test. `finish()` ends the stream once queued packets are consumed.
 */
class MockPacketSource : public IPacketSource {
public:
    void push(AudioPacket packet) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            packets_.push_back(std::move(packet));
        }
        cv_.notify_all();
    }

    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    bool receive(AudioPacket& out_packet) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !packets_.empty() || finished_; });
        if (closed_ || packets_.empty()) {
            return false;
        }
        out_packet = std::move(packets_.front());
        packets_.pop_front();
        ++delivered_;
        cv_.notify_all();
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            close_called_ = true;
        }
        cv_.notify_all();
    }

    /** Waits until every pushed packet has been handed to the consumer. */
    bool wait_until_drained(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return packets_.empty(); });
    }

    std::size_t delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

    bool close_called() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_called_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioPacket> packets_;
    std::size_t delivered_ = 0;
    bool finished_ = false;
    bool closed_ = false;
    bool close_called_ = false;
};

/**
 * Recognizer that records every request and replies with a configurable result.
 * Calls can be held at a gate to simulate a slow service.
 */
class MockSpeechRecognizer : public ISpeechRecognizer {
public:
    struct Call {
        uint32_t source_tag = 0;
        std::vector<uint8_t> audio;
        RecognitionFormat format;
    };

    RecognitionResult recognize(uint32_t source_tag,
                                const std::vector<uint8_t>& encoded_audio,
                                const RecognitionFormat& format) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++in_flight_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !blocked_; });
        --in_flight_;

        Call call;
        call.source_tag = source_tag;
        call.audio = encoded_audio;
        call.format = format;
        calls_.push_back(std::move(call));
        cv_.notify_all();

        if (throw_on_call_) {
            throw std::runtime_error("recognizer exploded");
        }
        RecognitionResult result = next_result_;
        if (result.success && result.transcript.empty() && !reply_empty_) {
            result.transcript = "segment " + std::to_string(calls_.size()) + " from " + std::to_string(source_tag);
        }
        return result;
    }

    void set_success(float confidence = 0.9f) {
        std::lock_guard<std::mutex> lock(mutex_);
        next_result_ = RecognitionResult{};
        next_result_.success = true;
        next_result_.confidence = confidence;
        reply_empty_ = false;
        throw_on_call_ = false;
    }

    void set_failure(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        next_result_ = RecognitionResult{};
        next_result_.success = false;
        next_result_.error = error;
        throw_on_call_ = false;
    }

    void set_empty_transcript() {
        std::lock_guard<std::mutex> lock(mutex_);
        next_result_ = RecognitionResult{};
        next_result_.success = true;
        reply_empty_ = true;
        throw_on_call_ = false;
    }

    void set_throw() {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_on_call_ = true;
    }

    void block() {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_ = true;
    }

    void unblock() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_ = false;
        }
        cv_.notify_all();
    }

    bool wait_for_calls(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return calls_.size() >= count; });
    }

    bool wait_for_in_flight(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return in_flight_ >= count; });
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Call> calls_;
    RecognitionResult next_result_{true, "", 0.9f, ""};
    bool reply_empty_ = false;
    bool throw_on_call_ = false;
    bool blocked_ = false;
    std::size_t in_flight_ = 0;
};

/**
 * Batch sink that keeps every submitted batch; used to observe the session store and detector.
 */
class RecordingBatchSink : public IBatchSink {
public:
    SubmitResult submit(std::shared_ptr<const FlushBatch> batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_requested_) {
            return SubmitResult::DroppedClosed;
        }
        batches_.push_back(std::move(batch));
        return SubmitResult::Queued;
    }

    void request_close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        close_requested_ = true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        close_requested_ = true;
        closed_ = true;
    }

    DispatcherStats get_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        DispatcherStats stats;
        stats.batches_submitted = batches_.size();
        stats.closed = closed_;
        return stats;
    }

    std::vector<std::shared_ptr<const FlushBatch>> batches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batches_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const FlushBatch>> batches_;
    bool close_requested_ = false;
    bool closed_ = false;
};

/**
 * Thread-safe collector for transcription callbacks.
 */
class TranscriptCollector {
public:
    struct Entry {
        uint32_t source_tag;
        std::string transcript;
        double confidence;
    };

    TranscriptionCallback callback() {
        return [this](uint32_t tag, const std::string& text, double confidence) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(Entry{tag, text, confidence});
            cv_.notify_all();
        };
    }

    bool wait_for(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return entries_.size() >= count; });
    }

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Entry> entries_;
};

} // namespace testing
} // namespace audio
} // namespace voicetap
