#ifndef VOICE_ENGINE_SETTINGS_H
#define VOICE_ENGINE_SETTINGS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace voicetap {
namespace audio {

inline constexpr long kDefaultSilenceThresholdMs = 2000;
inline constexpr long kDefaultSilenceScanIntervalMs = 100;
inline constexpr std::size_t kDefaultDispatchQueueCapacity = 10;
inline constexpr int kDefaultStreamSampleRate = 48000;
inline constexpr int kDefaultStreamChannels = 2;
inline constexpr uint16_t kDefaultRtpListenPort = 40000;

/** @brief Format of the live stream, carried into every container header. */
struct StreamFormat {
    int sample_rate = kDefaultStreamSampleRate;
    int channels = kDefaultStreamChannels;
};

struct SilenceDetectionTuning {
    long silence_threshold_ms = kDefaultSilenceThresholdMs; // Inactivity before a buffered source is flushed
    long scan_interval_ms = kDefaultSilenceScanIntervalMs;  // Detector tick period
};

struct DispatchTuning {
    std::size_t queue_capacity = kDefaultDispatchQueueCapacity;
    std::string language_code = "en-US";
    std::string encoding = "ogg/opus";
    bool write_diagnostics = true;
    std::string diagnostics_directory = ".";
};

struct RecordingSettings {
    bool enabled = false;
    std::string directory = ".";
};

struct RtpSourceSettings {
    std::string bind_address = "0.0.0.0";
    uint16_t listen_port = kDefaultRtpListenPort; // 0 binds an ephemeral port
    long reorder_window_ms = 0;                    // 0 disables per-SSRC reordering
    std::size_t reorder_max_packets = 128;
    int poll_timeout_ms = 20;
    int receive_buffer_bytes = 4 * 1024 * 1024;
};

struct RecognizerEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    long connect_timeout_ms = 3000;
    long io_timeout_ms = 30000;
};

struct TelemetrySettings {
    bool enabled = true;
    long log_interval_ms = 30000;
};

class VoiceEngineSettings {
public:
    StreamFormat stream_format;
    SilenceDetectionTuning silence_detection;
    DispatchTuning dispatch;
    RecordingSettings recording;
    TelemetrySettings telemetry;
};

} // namespace audio
} // namespace voicetap

#endif // VOICE_ENGINE_SETTINGS_H
