#pragma once

#include "../voice_types.h"

namespace voicetap {
namespace audio {

/**
 * @brief Interface of the live audio transport consumed by the ingestion loop.
 */
class IPacketSource {
public:
    virtual ~IPacketSource() = default;

    /**
     * @brief Blocks until the next packet is available.
     * @param out_packet Receives the packet.
     * @return false once the stream has been closed; no further packets will follow.
     */
    virtual bool receive(AudioPacket& out_packet) = 0;

    /**
     * @brief Closes the stream and unblocks a pending `receive`. Safe to call from any thread.
     */
    virtual void close() = 0;
};

} // namespace audio
} // namespace voicetap
