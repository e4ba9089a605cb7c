/**
 * @file packet_classifier.h
 * @brief Tags inbound packets as silence markers, empty packets or voice payload.
 */
#ifndef PACKET_CLASSIFIER_H
#define PACKET_CLASSIFIER_H

#include "../voice_types.h"

#include <cstddef>
#include <cstdint>

namespace voicetap {
namespace audio {

/**
 * @brief Classifies a raw payload.
 * @details Constant time and allocation free; runs for every packet on the ingestion
 *          thread. A three byte voice frame identical to the sentinel is reported as
 *          silence.
 */
PacketKind classify_payload(const uint8_t* payload, std::size_t size) noexcept;

/** @brief Classifies a packet by its payload. */
inline PacketKind classify_packet(const AudioPacket& packet) noexcept {
    return classify_payload(packet.payload.data(), packet.payload.size());
}

const char* packet_kind_name(PacketKind kind) noexcept;

} // namespace audio
} // namespace voicetap

#endif // PACKET_CLASSIFIER_H
