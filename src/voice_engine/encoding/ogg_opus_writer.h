/**
 * @file ogg_opus_writer.h
 * @brief Writes Opus frames into a self-describing Ogg Opus stream (RFC 3533, RFC 7845).
 */
#ifndef OGG_OPUS_WRITER_H
#define OGG_OPUS_WRITER_H

#include "../voice_types.h"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

constexpr uint16_t kOggOpusPreSkip = 312;
constexpr uint32_t kMaxOpusPacketSamples = 5760; // 120 ms at 48 kHz
constexpr std::size_t kMaxOggPacketBytes = 255 * 254 + 254; // Largest packet that fits a single page

/**
 * @class OggOpusWriter
 * @brief Streams Opus frames into Ogg pages, either in memory or to a file.
 * @details The stream begins with an `OpusHead` page (beginning-of-stream) and an
 *          `OpusTags` page. Each audio frame gets its own page. The most recent page is
 *          held back until the next write so that `close()` can mark it end-of-stream.
 *          Frames are written in call order; sequence numbers are not re-sequenced.
 */
class OggOpusWriter {
public:
    /**
     * @param sample_rate Original input sample rate recorded in `OpusHead`.
     * @param channels Channel count (1 or 2).
     * @param serial_number Ogg logical bitstream serial.
     */
    OggOpusWriter(int sample_rate, int channels, uint32_t serial_number);
    ~OggOpusWriter() noexcept;

    OggOpusWriter(const OggOpusWriter&) = delete;
    OggOpusWriter& operator=(const OggOpusWriter&) = delete;

    /** @brief Opens an in-memory stream and writes the header pages. */
    bool open_buffer();
    /** @brief Creates (truncates) `path` and writes the header pages. */
    bool open_file(const std::string& path);

    /** @brief Appends one Opus frame. Fails for empty or oversized payloads. */
    bool write_packet(const AudioPacket& packet);

    /** @brief Emits the held-back page with the end-of-stream flag and finalizes the sink. */
    bool close();

    bool is_open() const { return open_; }

    /** @brief Moves the in-memory stream out of the writer. Only meaningful after `close()`. */
    std::vector<uint8_t> take_buffer();

    const std::string& last_error() const { return last_error_; }
    const std::string& path() const { return path_; }
    uint64_t granule_position() const { return granule_position_; }
    uint32_t pages_written() const { return page_sequence_; }
    uint64_t packets_written() const { return packets_written_; }

    /** @brief CRC-32 as specified for Ogg pages (poly 0x04C11DB7, no reflection, init 0). */
    static uint32_t ogg_crc32(const uint8_t* data, std::size_t size);

private:
    struct PendingPage {
        std::vector<uint8_t> payload;
        uint64_t granule = 0;
        bool valid = false;
    };

    bool begin_stream();
    bool write_page(const std::vector<uint8_t>& payload, uint8_t header_type, uint64_t granule);
    bool flush_pending(bool end_of_stream);
    bool sink_bytes(const uint8_t* data, std::size_t size);
    uint32_t samples_in_packet(const AudioPacket& packet);
    bool fail(const std::string& error);

    std::vector<uint8_t> build_id_header() const;
    std::vector<uint8_t> build_comment_header() const;

    const int sample_rate_;
    const int channels_;
    const uint32_t serial_number_;

    bool open_ = false;
    bool to_file_ = false;
    std::string path_;
    std::unique_ptr<std::ofstream> file_;
    std::vector<uint8_t> buffer_;

    PendingPage pending_;
    uint32_t page_sequence_ = 0;
    uint64_t granule_position_ = 0;
    uint64_t packets_written_ = 0;
    bool has_last_timestamp_ = false;
    uint32_t last_timestamp_ = 0;
    std::string last_error_;
};

} // namespace audio
} // namespace voicetap

#endif // OGG_OPUS_WRITER_H
