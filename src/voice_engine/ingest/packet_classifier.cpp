#include "packet_classifier.h"

namespace voicetap {
namespace audio {

PacketKind classify_payload(const uint8_t* payload, std::size_t size) noexcept {
    if (size == 0 || payload == nullptr) {
        return PacketKind::Empty;
    }
    if (size == kSilenceSentinelSize &&
        payload[0] == kSilenceSentinel[0] &&
        payload[1] == kSilenceSentinel[1] &&
        payload[2] == kSilenceSentinel[2]) {
        return PacketKind::Silence;
    }
    return PacketKind::Voice;
}

const char* packet_kind_name(PacketKind kind) noexcept {
    switch (kind) {
        case PacketKind::Silence: return "silence";
        case PacketKind::Empty:   return "empty";
        case PacketKind::Voice:   return "voice";
    }
    return "unknown";
}

} // namespace audio
} // namespace voicetap
