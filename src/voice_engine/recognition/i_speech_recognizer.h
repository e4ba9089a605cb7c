#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

/**
 * @brief Format metadata sent alongside each encoded segment.
 */
struct RecognitionFormat {
    int sample_rate = 48000;
    int channels = 2;
    std::string encoding = "ogg/opus";
    std::string language_code = "en-US";
};

/**
 * @brief Reply of an external recognizer.
 */
struct RecognitionResult {
    bool success = false;
    std::string transcript;
    float confidence = 0.0f;
    std::string error; // Set when success is false
};

/**
 * @brief Interface for an external speech-to-text backend.
 * @details Called synchronously from dispatcher workers. Several workers may call
 *          `recognize` concurrently, so implementations must be thread-safe. Failures are
 *          reported through `RecognitionResult::success`; they are not retried by the
 *          caller.
 */
class ISpeechRecognizer {
public:
    virtual ~ISpeechRecognizer() = default;

    virtual RecognitionResult recognize(uint32_t source_tag,
                                        const std::vector<uint8_t>& encoded_audio,
                                        const RecognitionFormat& format) = 0;
};

} // namespace audio
} // namespace voicetap
