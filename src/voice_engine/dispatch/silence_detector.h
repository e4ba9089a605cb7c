/**
 * @file silence_detector.h
 * @brief Periodic scanner that flushes sources which have gone quiet.
 */
#ifndef SILENCE_DETECTOR_H
#define SILENCE_DETECTOR_H

#include "../utils/audio_component.h"
#include "../configuration/voice_engine_settings.h"
#include "../session/session_store.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace voicetap {
namespace audio {

/**
 * @class SilenceDetector
 * @brief Every scan interval, hands the batches of idle sources to their dispatchers.
 * @details A source is idle once no voice packet arrived for at least the silence
 *          threshold. Flushing resets its activity time, so a source that stays quiet is
 *          not flushed again until new audio has arrived and gone quiet.
 */
class SilenceDetector : public AudioComponent {
public:
    SilenceDetector(std::shared_ptr<SessionStore> store, SilenceDetectionTuning tuning);
    ~SilenceDetector() override;

    void start() override;
    void stop() override;

    /**
     * @brief Runs one scan immediately on the calling thread.
     * @return Number of batches handed to dispatchers.
     */
    std::size_t scan_once(std::chrono::steady_clock::time_point now);

    uint64_t ticks() const { return ticks_.load(); }

protected:
    void run() override;

private:
    std::shared_ptr<SessionStore> store_;
    const std::chrono::milliseconds threshold_;
    const std::chrono::milliseconds scan_interval_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::atomic<uint64_t> ticks_{0};
};

} // namespace audio
} // namespace voicetap

#endif // SILENCE_DETECTOR_H
