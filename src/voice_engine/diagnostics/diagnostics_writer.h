/**
 * @file diagnostics_writer.h
 * @brief Persists encoded segments that the recognizer rejected, for offline inspection.
 */
#ifndef DIAGNOSTICS_WRITER_H
#define DIAGNOSTICS_WRITER_H

#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

namespace voicetap {
namespace audio {

/**
 * @brief Builds `<directory>/<prefix>_<YYYYmmdd_HHMMSS>_<source_tag>.ogg` using local time.
 */
std::string make_timestamped_filename(const std::string& directory,
                                      const std::string& prefix,
                                      uint32_t source_tag,
                                      std::time_t when);

/**
 * @class DiagnosticsWriter
 * @brief Writes failed batches as `debug_audio_<timestamp>_<tag>.ogg` files.
 * @details Thread-safe; called from dispatcher workers only. If a file with the same
 *          name already exists (two failures of one source within a second) a numeric
 *          suffix is appended rather than overwriting it.
 */
class DiagnosticsWriter {
public:
    DiagnosticsWriter(std::string directory, bool enabled);
    virtual ~DiagnosticsWriter() = default;

    /**
     * @brief Writes one failed batch.
     * @param out_path Receives the written file path on success.
     * @return false if disabled, if `data` is empty, or if the file could not be written.
     */
    virtual bool write_failed_batch(uint32_t source_tag, const std::vector<uint8_t>& data, std::string& out_path);

    bool enabled() const { return enabled_; }
    const std::string& directory() const { return directory_; }

private:
    std::string unique_path_for(uint32_t source_tag);

    const std::string directory_;
    const bool enabled_;
    std::mutex mutex_;
};

} // namespace audio
} // namespace voicetap

#endif // DIAGNOSTICS_WRITER_H
