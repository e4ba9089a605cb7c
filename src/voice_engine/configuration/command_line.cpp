#include "command_line.h"

#include "../utils/cpp_logger.h"

#include <cerrno>
#include <cstdlib>

namespace voicetap {
namespace audio {

namespace {

bool parse_long(const std::string& text, long min_value, long max_value, long& out_value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    if (value < min_value || value > max_value) {
        return false;
    }
    out_value = value;
    return true;
}

bool parse_port(const std::string& text, uint16_t& out_port) {
    long value = 0;
    if (!parse_long(text, 0, 65535, value)) {
        return false;
    }
    out_port = static_cast<uint16_t>(value);
    return true;
}

std::string invalid_value(const std::string& name, const std::string& value) {
    return "invalid value '" + value + "' for " + name;
}

} // namespace

bool apply_environment(VoicetapOptions& options, const EnvironmentLookup& lookup, std::string& out_error) {
    if (!lookup) {
        return true;
    }
    if (const char* value = lookup("VOICETAP_LISTEN_ADDRESS")) {
        options.rtp.bind_address = value;
    }
    if (const char* value = lookup("VOICETAP_LISTEN_PORT")) {
        if (!parse_port(value, options.rtp.listen_port)) {
            out_error = invalid_value("VOICETAP_LISTEN_PORT", value);
            return false;
        }
    }
    if (const char* value = lookup("VOICETAP_RECOGNIZER_HOST")) {
        options.recognizer.host = value;
    }
    if (const char* value = lookup("VOICETAP_RECOGNIZER_PORT")) {
        if (!parse_port(value, options.recognizer.port)) {
            out_error = invalid_value("VOICETAP_RECOGNIZER_PORT", value);
            return false;
        }
    }
    if (const char* value = lookup("VOICETAP_SILENCE_THRESHOLD_MS")) {
        if (!parse_long(value, 1, 3600000, options.engine.silence_detection.silence_threshold_ms)) {
            out_error = invalid_value("VOICETAP_SILENCE_THRESHOLD_MS", value);
            return false;
        }
    }
    if (const char* value = lookup("VOICETAP_LANGUAGE")) {
        options.engine.dispatch.language_code = value;
    }
    if (const char* value = lookup("VOICETAP_DIAGNOSTICS_DIR")) {
        options.engine.dispatch.diagnostics_directory = value;
    }
    if (const char* value = lookup("VOICETAP_RECORD_DIR")) {
        options.engine.recording.enabled = true;
        options.engine.recording.directory = value;
    }
    if (const char* value = lookup("VOICETAP_LOG_LEVEL")) {
        options.log_level = value;
    }
    return true;
}

bool parse_command_line(int argc, const char* const argv[], VoicetapOptions& options, std::string& out_error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") { options.show_help = true; continue; }
        if (arg == "--record") { options.engine.recording.enabled = true; continue; }
        if (arg == "--no-diagnostics") { options.engine.dispatch.write_diagnostics = false; continue; }
        if (arg == "--no-telemetry") { options.engine.telemetry.enabled = false; continue; }

        if (i + 1 >= argc) {
            out_error = (arg.rfind("--", 0) == 0) ? "missing value for " + arg : "unknown argument " + arg;
            return false;
        }
        const std::string value = argv[i + 1];
        bool ok = true;
        long number = 0;

        if (arg == "--listen-address") {
            options.rtp.bind_address = value;
        } else if (arg == "--listen-port") {
            ok = parse_port(value, options.rtp.listen_port);
        } else if (arg == "--reorder-window-ms") {
            ok = parse_long(value, 0, 10000, options.rtp.reorder_window_ms);
        } else if (arg == "--reorder-max-packets") {
            ok = parse_long(value, 1, 65535, number);
            options.rtp.reorder_max_packets = static_cast<std::size_t>(number);
        } else if (arg == "--recognizer-host") {
            options.recognizer.host = value;
        } else if (arg == "--recognizer-port") {
            ok = parse_port(value, options.recognizer.port);
        } else if (arg == "--connect-timeout-ms") {
            ok = parse_long(value, 1, 600000, options.recognizer.connect_timeout_ms);
        } else if (arg == "--io-timeout-ms") {
            ok = parse_long(value, 1, 3600000, options.recognizer.io_timeout_ms);
        } else if (arg == "--silence-threshold-ms") {
            ok = parse_long(value, 1, 3600000, options.engine.silence_detection.silence_threshold_ms);
        } else if (arg == "--scan-interval-ms") {
            ok = parse_long(value, 1, 60000, options.engine.silence_detection.scan_interval_ms);
        } else if (arg == "--queue-capacity") {
            ok = parse_long(value, 1, 10000, number);
            options.engine.dispatch.queue_capacity = static_cast<std::size_t>(number);
        } else if (arg == "--language") {
            options.engine.dispatch.language_code = value;
        } else if (arg == "--diagnostics-dir") {
            options.engine.dispatch.diagnostics_directory = value;
        } else if (arg == "--record-dir") {
            options.engine.recording.enabled = true;
            options.engine.recording.directory = value;
        } else if (arg == "--sample-rate") {
            ok = parse_long(value, 1, 192000, number);
            options.engine.stream_format.sample_rate = static_cast<int>(number);
        } else if (arg == "--channels") {
            ok = parse_long(value, 1, 255, number);
            options.engine.stream_format.channels = static_cast<int>(number);
        } else if (arg == "--telemetry-interval-ms") {
            ok = parse_long(value, 1, 3600000, options.engine.telemetry.log_interval_ms);
        } else if (arg == "--log-level") {
            options.log_level = value;
        } else {
            out_error = "unknown argument " + arg;
            return false;
        }

        if (!ok) {
            out_error = invalid_value(arg, value);
            return false;
        }
        ++i;
    }
    return true;
}

bool validate_options(const VoicetapOptions& options, std::string& out_error) {
    const auto& engine = options.engine;
    if (options.recognizer.host.empty()) {
        out_error = "recognizer host must not be empty";
        return false;
    }
    if (options.recognizer.port == 0) {
        out_error = "recognizer port is required (--recognizer-port or VOICETAP_RECOGNIZER_PORT)";
        return false;
    }
    if (engine.silence_detection.scan_interval_ms <= 0) {
        out_error = "scan interval must be positive";
        return false;
    }
    if (engine.silence_detection.silence_threshold_ms <= engine.silence_detection.scan_interval_ms) {
        out_error = "silence threshold must be longer than the scan interval";
        return false;
    }
    if (engine.dispatch.queue_capacity == 0) {
        out_error = "queue capacity must be at least 1";
        return false;
    }
    if (engine.stream_format.channels < 1 || engine.stream_format.channels > 2) {
        out_error = "channels must be 1 or 2";
        return false;
    }
    switch (engine.stream_format.sample_rate) {
        case 8000: case 12000: case 16000: case 24000: case 48000:
            break;
        default:
            out_error = "sample rate must be one of 8000, 12000, 16000, 24000, 48000";
            return false;
    }
    if (engine.telemetry.enabled && engine.telemetry.log_interval_ms <= 0) {
        out_error = "telemetry interval must be positive";
        return false;
    }
    logging::LogLevel level;
    if (!logging::parse_log_level(options.log_level, level)) {
        out_error = "unknown log level '" + options.log_level + "'";
        return false;
    }
    return true;
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " --recognizer-port PORT [options]\n"
        << "\n"
        << "Receives a multi-speaker RTP/Opus stream, splits it per SSRC at pauses and\n"
        << "sends each utterance to a transcription service.\n"
        << "\n"
        << "Input:\n"
        << "  --listen-address ADDR       UDP bind address (default 0.0.0.0)\n"
        << "  --listen-port PORT          UDP port, 0 for ephemeral (default " << kDefaultRtpListenPort << ")\n"
        << "  --reorder-window-ms MS      per-SSRC reordering window, 0 disables (default 0)\n"
        << "  --reorder-max-packets N     reordering buffer size (default 128)\n"
        << "  --sample-rate HZ            stream sample rate (default 48000)\n"
        << "  --channels N                stream channel count, 1 or 2 (default 2)\n"
        << "\n"
        << "Segmentation:\n"
        << "  --silence-threshold-ms MS   inactivity before a source is flushed (default "
        << kDefaultSilenceThresholdMs << ")\n"
        << "  --scan-interval-ms MS       silence scan period (default " << kDefaultSilenceScanIntervalMs << ")\n"
        << "  --queue-capacity N          batches queued per source (default " << kDefaultDispatchQueueCapacity << ")\n"
        << "\n"
        << "Recognition:\n"
        << "  --recognizer-host HOST      transcription service host (default 127.0.0.1)\n"
        << "  --recognizer-port PORT      transcription service port (required)\n"
        << "  --connect-timeout-ms MS     connect timeout (default 3000)\n"
        << "  --io-timeout-ms MS          send/receive timeout (default 30000)\n"
        << "  --language CODE             language hint (default en-US)\n"
        << "\n"
        << "Output:\n"
        << "  --diagnostics-dir DIR       where failed segments are written (default .)\n"
        << "  --no-diagnostics            do not write failed segments\n"
        << "  --record                    record each source to audio_<time>_<ssrc>.ogg\n"
        << "  --record-dir DIR            recording directory (implies --record)\n"
        << "  --log-level LEVEL           debug, info, warning or error (default info)\n"
        << "  --telemetry-interval-ms MS  counter log period (default 30000)\n"
        << "  --no-telemetry              disable periodic counter logs\n"
        << "  -h, --help                  show this help\n"
        << "\n"
        << "Environment: VOICETAP_LISTEN_ADDRESS, VOICETAP_LISTEN_PORT, VOICETAP_RECOGNIZER_HOST,\n"
        << "VOICETAP_RECOGNIZER_PORT, VOICETAP_SILENCE_THRESHOLD_MS, VOICETAP_LANGUAGE,\n"
        << "VOICETAP_DIAGNOSTICS_DIR, VOICETAP_RECORD_DIR, VOICETAP_LOG_LEVEL.\n"
        << "Command-line flags take precedence.\n";
}

} // namespace audio
} // namespace voicetap
