/**
 * @file command_line.h
 * @brief Command-line and environment configuration of the voicetap executable.
 */
#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#include "voice_engine_settings.h"

#include <functional>
#include <ostream>
#include <string>

namespace voicetap {
namespace audio {

struct VoicetapOptions {
    VoiceEngineSettings engine;
    RtpSourceSettings rtp;
    RecognizerEndpoint recognizer;
    std::string log_level = "info";
    bool show_help = false;
};

/** @brief Looks up an environment variable; returns null when unset. */
using EnvironmentLookup = std::function<const char*(const char* name)>;

/**
 * @brief Applies `VOICETAP_*` environment variables on top of the current options.
 * @details Recognized: VOICETAP_LISTEN_ADDRESS, VOICETAP_LISTEN_PORT,
 *          VOICETAP_RECOGNIZER_HOST, VOICETAP_RECOGNIZER_PORT,
 *          VOICETAP_SILENCE_THRESHOLD_MS, VOICETAP_LANGUAGE, VOICETAP_DIAGNOSTICS_DIR,
 *          VOICETAP_RECORD_DIR (also enables recording) and VOICETAP_LOG_LEVEL.
 * @return false if a variable holds an unparsable value; `out_error` names it.
 */
bool apply_environment(VoicetapOptions& options, const EnvironmentLookup& lookup, std::string& out_error);

/**
 * @brief Parses command-line flags on top of the current options.
 * @return false on an unknown flag, a missing value or an unparsable number.
 */
bool parse_command_line(int argc, const char* const argv[], VoicetapOptions& options, std::string& out_error);

/**
 * @brief Checks cross-field constraints (ports, intervals, stream format).
 */
bool validate_options(const VoicetapOptions& options, std::string& out_error);

void print_usage(std::ostream& out, const char* program_name);

} // namespace audio
} // namespace voicetap

#endif // COMMAND_LINE_H
