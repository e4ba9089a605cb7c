#include "container_encoder.h"

#include "ogg_opus_writer.h"
#include "../utils/cpp_logger.h"

namespace voicetap {
namespace audio {

ContainerEncoder::ContainerEncoder(StreamFormat format) : format_(format) {}

bool ContainerEncoder::encode(const FlushBatch& batch, std::vector<uint8_t>& out_bytes, std::string& out_error) const {
    if (batch.empty()) {
        out_error = "batch is empty";
        return false;
    }

    OggOpusWriter writer(format_.sample_rate, format_.channels, batch.source_tag);
    if (!writer.open_buffer()) {
        out_error = "failed to open container: " + writer.last_error();
        return false;
    }

    std::size_t skipped = 0;
    for (const auto& packet : batch.packets) {
        if (!writer.write_packet(packet)) {
            ++skipped;
            LOG_CPP_WARNING("[ContainerEncoder] SSRC 0x%08X: skipping packet seq=%u (%s)",
                            batch.source_tag, packet.sequence_number, writer.last_error().c_str());
        }
    }

    if (!writer.close()) {
        out_error = "failed to finalize container: " + writer.last_error();
        return false;
    }

    if (skipped == batch.size()) {
        out_error = "no packet of the batch could be written";
        return false;
    }

    out_bytes = writer.take_buffer();
    LOG_CPP_DEBUG("[ContainerEncoder] SSRC 0x%08X: encoded %zu packets (%zu skipped) into %zu bytes, granule=%llu",
                  batch.source_tag, batch.size() - skipped, skipped, out_bytes.size(),
                  static_cast<unsigned long long>(writer.granule_position()));
    return true;
}

} // namespace audio
} // namespace voicetap
