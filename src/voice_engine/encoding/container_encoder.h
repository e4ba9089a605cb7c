#ifndef CONTAINER_ENCODER_H
#define CONTAINER_ENCODER_H

#include "../voice_types.h"
#include "../configuration/voice_engine_settings.h"

#include <cstdint>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

/**
 * @class ContainerEncoder
 * @brief Turns one flush batch into a standalone Ogg Opus byte buffer.
 * @details The output carries its own `OpusHead`/`OpusTags` headers so a recognizer can
 *          decode it without side-channel format information. Packets are written in the
 *          order they appear in the batch.
 */
class ContainerEncoder {
public:
    explicit ContainerEncoder(StreamFormat format);

    /**
     * @brief Encodes a batch.
     * @param batch Voice packets of a single source.
     * @param out_bytes Receives the finalized container on success.
     * @param out_error Receives a description of the failure otherwise.
     * @return false if the container could not be opened or finalized, or if no packet
     *         of the batch could be written.
     */
    bool encode(const FlushBatch& batch, std::vector<uint8_t>& out_bytes, std::string& out_error) const;

    const StreamFormat& format() const { return format_; }

private:
    StreamFormat format_;
};

} // namespace audio
} // namespace voicetap

#endif // CONTAINER_ENCODER_H
