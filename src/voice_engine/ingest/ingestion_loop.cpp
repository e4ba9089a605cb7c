#include "ingestion_loop.h"

#include "packet_classifier.h"
#include "../utils/cpp_logger.h"

#include <utility>

namespace voicetap {
namespace audio {

IngestionLoop::IngestionLoop(std::shared_ptr<IPacketSource> source,
                             std::shared_ptr<SessionStore> store,
                             std::shared_ptr<EngineCounters> counters,
                             TelemetrySettings telemetry)
    : AudioComponent("IngestionLoop"),
      source_(std::move(source)),
      store_(std::move(store)),
      counters_(counters ? std::move(counters) : std::make_shared<EngineCounters>()),
      telemetry_(telemetry) {
    stop_flag_ = true;
}

IngestionLoop::~IngestionLoop() {
    stop();
}

void IngestionLoop::start() {
    if (is_running()) {
        return;
    }
    LOG_CPP_INFO("[IngestionLoop] Starting...");
    stream_ended_ = false;
    last_telemetry_log_time_ = std::chrono::steady_clock::now();
    last_logged_packets_ = counters_->packets_received.load();
    launch_thread();
}

void IngestionLoop::stop() {
    stop_flag_ = true;
    if (source_) {
        source_->close();
    }
    join_thread();
}

void IngestionLoop::run() {
    LOG_CPP_DEBUG("[IngestionLoop] Thread started");
    AudioPacket packet;
    while (!stop_flag_) {
        if (!source_ || !source_->receive(packet)) {
            if (!stop_flag_) {
                LOG_CPP_INFO("[IngestionLoop] Packet source closed, ending ingestion");
                stream_ended_ = true;
            }
            break;
        }
        process_packet(std::move(packet));
        packet = AudioPacket{};
        maybe_log_telemetry(std::chrono::steady_clock::now());
    }
    LOG_CPP_DEBUG("[IngestionLoop] Thread exiting");
}

void IngestionLoop::process_packet(AudioPacket&& packet) {
    counters_->packets_received++;

    switch (classify_packet(packet)) {
        case PacketKind::Silence:
            counters_->silence_markers++;
            return;
        case PacketKind::Empty:
            counters_->empty_packets_dropped++;
            return;
        case PacketKind::Voice:
            break;
    }

    counters_->voice_packets++;
    const uint32_t tag = packet.source_tag;
    const auto now = std::chrono::steady_clock::now();
    if (packet.received_time == std::chrono::steady_clock::time_point{}) {
        packet.received_time = now;
    }

    switch (store_->append(std::move(packet), now)) {
        case AppendResult::Appended:
        case AppendResult::CreatedAndAppended:
            break;
        case AppendResult::CreateFailed:
            counters_->session_create_failures++;
            LOG_CPP_WARNING("[IngestionLoop] Dropping packet for SSRC 0x%08X: session could not be created", tag);
            break;
        case AppendResult::StoreClosed:
            counters_->packets_rejected++;
            break;
    }
}

void IngestionLoop::maybe_log_telemetry(std::chrono::steady_clock::time_point now) {
    if (!telemetry_.enabled || telemetry_.log_interval_ms <= 0) {
        return;
    }
    if (now - last_telemetry_log_time_ < std::chrono::milliseconds(telemetry_.log_interval_ms)) {
        return;
    }
    last_telemetry_log_time_ = now;

    const uint64_t total = counters_->packets_received.load();
    LOG_CPP_INFO("[Telemetry][IngestionLoop] packets=%llu (+%llu) voice=%llu silence=%llu empty=%llu sessions=%zu flushes=%llu",
                 static_cast<unsigned long long>(total),
                 static_cast<unsigned long long>(total - last_logged_packets_),
                 static_cast<unsigned long long>(counters_->voice_packets.load()),
                 static_cast<unsigned long long>(counters_->silence_markers.load()),
                 static_cast<unsigned long long>(counters_->empty_packets_dropped.load()),
                 store_->session_count(),
                 static_cast<unsigned long long>(counters_->flushes.load()));
    last_logged_packets_ = total;
}

} // namespace audio
} // namespace voicetap
