/**
 * @file ingestion_loop.h
 * @brief Single consumer of the live packet stream.
 */
#ifndef INGESTION_LOOP_H
#define INGESTION_LOOP_H

#include "i_packet_source.h"
#include "../utils/audio_component.h"
#include "../configuration/voice_engine_settings.h"
#include "../session/session_store.h"
#include "../voice_types.h"

#include <chrono>
#include <memory>

namespace voicetap {
namespace audio {

/**
 * @class IngestionLoop
 * @brief Pulls packets from an `IPacketSource`, classifies them and buffers voice frames.
 * @details The loop performs no encoding, file or network I/O of its own. It exits when
 *          the source reports end-of-stream or when `stop()` closes the source.
 */
class IngestionLoop : public AudioComponent {
public:
    IngestionLoop(std::shared_ptr<IPacketSource> source,
                  std::shared_ptr<SessionStore> store,
                  std::shared_ptr<EngineCounters> counters,
                  TelemetrySettings telemetry);
    ~IngestionLoop() override;

    void start() override;
    void stop() override;

    /** @brief True once the source reported end-of-stream. */
    bool stream_ended() const { return stream_ended_.load(); }

    /** @brief Handles one packet as the loop would. Exposed for tests. */
    void process_packet(AudioPacket&& packet);

protected:
    void run() override;

private:
    void maybe_log_telemetry(std::chrono::steady_clock::time_point now);

    std::shared_ptr<IPacketSource> source_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<EngineCounters> counters_;
    const TelemetrySettings telemetry_;

    std::atomic<bool> stream_ended_{false};
    std::chrono::steady_clock::time_point last_telemetry_log_time_{};
    uint64_t last_logged_packets_ = 0;
};

} // namespace audio
} // namespace voicetap

#endif // INGESTION_LOOP_H
