/**
 * @file tcp_speech_recognizer.h
 * @brief Recognizer client that talks to a transcription service over TCP.
 */
#ifndef TCP_SPEECH_RECOGNIZER_H
#define TCP_SPEECH_RECOGNIZER_H

#include "i_speech_recognizer.h"
#include "../configuration/voice_engine_settings.h"

#include <cstdint>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

/** @brief Largest transcript or error text accepted from the service. */
constexpr uint32_t kMaxRecognizerReplyBytes = 1024 * 1024;

/**
 * @class TcpSpeechRecognizer
 * @brief Opens one connection per segment and exchanges length-prefixed frames.
 *
 * Request, all integers big-endian:
 *   u32 metadata length, metadata as `key=value\n` lines
 *   (source_tag, sample_rate, channels, encoding, language),
 *   u32 audio length, encoded container bytes.
 *
 * Reply:
 *   u32 status (0 = success), u32 IEEE-754 confidence bits,
 *   u32 text length, text (transcript on success, error message otherwise).
 *
 * Stateless between calls, so concurrent use from several dispatcher workers is safe.
 */
class TcpSpeechRecognizer : public ISpeechRecognizer {
public:
    explicit TcpSpeechRecognizer(RecognizerEndpoint endpoint);

    RecognitionResult recognize(uint32_t source_tag,
                                const std::vector<uint8_t>& encoded_audio,
                                const RecognitionFormat& format) override;

    /** @brief Builds the metadata block sent ahead of the audio. */
    static std::string build_metadata(uint32_t source_tag, const RecognitionFormat& format);

    const RecognizerEndpoint& endpoint() const { return endpoint_; }

private:
    int connect_to_service(std::string& out_error) const;

    const RecognizerEndpoint endpoint_;
};

} // namespace audio
} // namespace voicetap

#endif // TCP_SPEECH_RECOGNIZER_H
