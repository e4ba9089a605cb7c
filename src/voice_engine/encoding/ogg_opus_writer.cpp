#include "ogg_opus_writer.h"

#include "../utils/cpp_logger.h"

#include <opus/opus.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace voicetap {
namespace audio {

namespace {

constexpr uint8_t kOggHeaderBeginOfStream = 0x02;
constexpr uint8_t kOggHeaderEndOfStream = 0x04;
constexpr std::size_t kOggPageHeaderSize = 27;
constexpr uint32_t kDefaultFrameSamples = 960; // 20 ms at 48 kHz

const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t r = i << 24;
            for (int bit = 0; bit < 8; ++bit) {
                r = (r & 0x80000000u) ? ((r << 1) ^ 0x04C11DB7u) : (r << 1);
            }
            t[i] = r;
        }
        return t;
    }();
    return table;
}

void put_le16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void put_le32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void put_le64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

} // namespace

OggOpusWriter::OggOpusWriter(int sample_rate, int channels, uint32_t serial_number)
    : sample_rate_(sample_rate), channels_(channels), serial_number_(serial_number) {}

OggOpusWriter::~OggOpusWriter() noexcept {
    if (open_ && !close()) {
        LOG_CPP_WARNING("[OggOpusWriter] Failed to finalize stream %s on destruction: %s",
                        path_.empty() ? "<memory>" : path_.c_str(), last_error_.c_str());
    }
}

uint32_t OggOpusWriter::ogg_crc32(const uint8_t* data, std::size_t size) {
    const auto& table = crc_table();
    uint32_t crc = 0;
    for (std::size_t i = 0; i < size; ++i) {
        crc = (crc << 8) ^ table[((crc >> 24) & 0xFF) ^ data[i]];
    }
    return crc;
}

bool OggOpusWriter::fail(const std::string& error) {
    last_error_ = error;
    return false;
}

bool OggOpusWriter::open_buffer() {
    if (open_) {
        return fail("writer already open");
    }
    to_file_ = false;
    buffer_.clear();
    return begin_stream();
}

bool OggOpusWriter::open_file(const std::string& path) {
    if (open_) {
        return fail("writer already open");
    }
    auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!file->is_open()) {
        return fail("cannot open " + path + ": " + std::string(std::strerror(errno)));
    }
    file_ = std::move(file);
    path_ = path;
    to_file_ = true;
    return begin_stream();
}

bool OggOpusWriter::begin_stream() {
    if (channels_ < 1 || channels_ > 2) {
        return fail("unsupported channel count " + std::to_string(channels_));
    }
    if (sample_rate_ <= 0) {
        return fail("invalid sample rate " + std::to_string(sample_rate_));
    }

    page_sequence_ = 0;
    granule_position_ = 0;
    packets_written_ = 0;
    has_last_timestamp_ = false;
    pending_ = PendingPage{};
    open_ = true;

    if (!write_page(build_id_header(), kOggHeaderBeginOfStream, 0)) {
        open_ = false;
        return false;
    }

    // OpusTags is held back so an empty stream still ends with an end-of-stream page.
    pending_.payload = build_comment_header();
    pending_.granule = 0;
    pending_.valid = true;
    return true;
}

std::vector<uint8_t> OggOpusWriter::build_id_header() const {
    std::vector<uint8_t> header;
    header.reserve(19);
    const char magic[] = "OpusHead";
    header.insert(header.end(), magic, magic + 8);
    header.push_back(1); // version
    header.push_back(static_cast<uint8_t>(channels_));
    put_le16(header, kOggOpusPreSkip);
    put_le32(header, static_cast<uint32_t>(sample_rate_));
    put_le16(header, 0); // output gain
    header.push_back(0); // mapping family 0: mono or stereo
    return header;
}

std::vector<uint8_t> OggOpusWriter::build_comment_header() const {
    std::vector<uint8_t> header;
    const char magic[] = "OpusTags";
    header.insert(header.end(), magic, magic + 8);
    std::string vendor = "voicetap";
    if (const char* opus_version = opus_get_version_string()) {
        vendor += " (";
        vendor += opus_version;
        vendor += ")";
    }
    put_le32(header, static_cast<uint32_t>(vendor.size()));
    header.insert(header.end(), vendor.begin(), vendor.end());
    put_le32(header, 0); // user comment count
    return header;
}

bool OggOpusWriter::sink_bytes(const uint8_t* data, std::size_t size) {
    if (to_file_) {
        file_->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!file_->good()) {
            return fail("write failed for " + path_);
        }
        return true;
    }
    buffer_.insert(buffer_.end(), data, data + size);
    return true;
}

bool OggOpusWriter::write_page(const std::vector<uint8_t>& payload, uint8_t header_type, uint64_t granule) {
    if (payload.size() > kMaxOggPacketBytes) {
        return fail("packet of " + std::to_string(payload.size()) + " bytes exceeds single page capacity");
    }

    const std::size_t full_segments = payload.size() / 255;
    const std::size_t segment_count = full_segments + 1;

    std::vector<uint8_t> page;
    page.reserve(kOggPageHeaderSize + segment_count + payload.size());
    page.insert(page.end(), {'O', 'g', 'g', 'S'});
    page.push_back(0); // stream structure version
    page.push_back(header_type);
    put_le64(page, granule);
    put_le32(page, serial_number_);
    put_le32(page, page_sequence_);
    put_le32(page, 0); // CRC placeholder
    page.push_back(static_cast<uint8_t>(segment_count));
    for (std::size_t i = 0; i < full_segments; ++i) {
        page.push_back(255);
    }
    page.push_back(static_cast<uint8_t>(payload.size() % 255));
    page.insert(page.end(), payload.begin(), payload.end());

    const uint32_t crc = ogg_crc32(page.data(), page.size());
    page[22] = static_cast<uint8_t>(crc & 0xFF);
    page[23] = static_cast<uint8_t>((crc >> 8) & 0xFF);
    page[24] = static_cast<uint8_t>((crc >> 16) & 0xFF);
    page[25] = static_cast<uint8_t>((crc >> 24) & 0xFF);

    if (!sink_bytes(page.data(), page.size())) {
        return false;
    }
    ++page_sequence_;
    return true;
}

bool OggOpusWriter::flush_pending(bool end_of_stream) {
    if (!pending_.valid) {
        return true;
    }
    const uint8_t header_type = end_of_stream ? kOggHeaderEndOfStream : 0;
    const bool ok = write_page(pending_.payload, header_type, pending_.granule);
    pending_.valid = false;
    pending_.payload.clear();
    return ok;
}

uint32_t OggOpusWriter::samples_in_packet(const AudioPacket& packet) {
    uint32_t samples = 0;
    const int parsed = opus_packet_get_nb_samples(packet.payload.data(),
                                                  static_cast<opus_int32>(packet.payload.size()),
                                                  kOpusClockRate);
    if (parsed > 0) {
        samples = static_cast<uint32_t>(parsed);
    } else if (has_last_timestamp_) {
        const uint32_t delta = packet.rtp_timestamp - last_timestamp_;
        if (delta > 0 && delta <= kMaxOpusPacketSamples) {
            samples = delta;
        }
    }
    if (samples == 0) {
        samples = kDefaultFrameSamples;
    }
    last_timestamp_ = packet.rtp_timestamp;
    has_last_timestamp_ = true;
    return samples;
}

bool OggOpusWriter::write_packet(const AudioPacket& packet) {
    if (!open_) {
        return fail("writer not open");
    }
    if (packet.payload.empty()) {
        return fail("empty payload");
    }
    if (packet.payload.size() > kMaxOggPacketBytes) {
        return fail("payload of " + std::to_string(packet.payload.size()) + " bytes is too large");
    }

    if (!flush_pending(false)) {
        return false;
    }

    granule_position_ += samples_in_packet(packet);
    pending_.payload = packet.payload;
    pending_.granule = granule_position_;
    pending_.valid = true;
    ++packets_written_;
    return true;
}

bool OggOpusWriter::close() {
    if (!open_) {
        return true;
    }
    open_ = false;
    bool ok = flush_pending(true);
    if (to_file_ && file_) {
        file_->flush();
        file_->close();
        if (file_->fail() && ok) {
            ok = fail("failed to finalize " + path_);
        }
        file_.reset();
    }
    return ok;
}

std::vector<uint8_t> OggOpusWriter::take_buffer() {
    std::vector<uint8_t> out;
    out.swap(buffer_);
    return out;
}

} // namespace audio
} // namespace voicetap
