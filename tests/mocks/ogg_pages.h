#pragma once
/**
 * Minimal Ogg page walker used to inspect encoder output in tests.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voicetap {
namespace audio {
namespace testing {

struct OggPage {
    uint8_t header_type = 0;
    uint64_t granule = 0;
    uint32_t serial = 0;
    uint32_t sequence = 0;
    uint32_t crc = 0;
    std::size_t offset = 0;
    std::size_t total_size = 0;
    std::vector<uint8_t> payload;
};

inline uint64_t read_le(const std::vector<uint8_t>& data, std::size_t offset, int bytes) {
    uint64_t value = 0;
    for (int i = bytes - 1; i >= 0; --i) {
        value = (value << 8) | data[offset + static_cast<std::size_t>(i)];
    }
    return value;
}

/** Splits a byte stream into pages. Returns false on a malformed or truncated page. */
inline bool split_ogg_pages(const std::vector<uint8_t>& data, std::vector<OggPage>& pages) {
    pages.clear();
    std::size_t pos = 0;
    while (pos < data.size()) {
        if (data.size() - pos < 27 ||
            data[pos] != 'O' || data[pos + 1] != 'g' || data[pos + 2] != 'g' || data[pos + 3] != 'S') {
            return false;
        }
        OggPage page;
        page.offset = pos;
        page.header_type = data[pos + 5];
        page.granule = read_le(data, pos + 6, 8);
        page.serial = static_cast<uint32_t>(read_le(data, pos + 14, 4));
        page.sequence = static_cast<uint32_t>(read_le(data, pos + 18, 4));
        page.crc = static_cast<uint32_t>(read_le(data, pos + 22, 4));
        const std::size_t segments = data[pos + 26];
        if (data.size() - pos < 27 + segments) {
            return false;
        }
        std::size_t body = 0;
        for (std::size_t i = 0; i < segments; ++i) {
            body += data[pos + 27 + i];
        }
        const std::size_t header_size = 27 + segments;
        if (data.size() - pos < header_size + body) {
            return false;
        }
        page.payload.assign(data.begin() + static_cast<std::ptrdiff_t>(pos + header_size),
                            data.begin() + static_cast<std::ptrdiff_t>(pos + header_size + body));
        page.total_size = header_size + body;
        pages.push_back(std::move(page));
        pos += header_size + body;
    }
    return true;
}

} // namespace testing
} // namespace audio
} // namespace voicetap
