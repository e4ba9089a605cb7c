#include "diagnostics_writer.h"

#include "../utils/cpp_logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <utility>

#include <sys/stat.h>

namespace voicetap {
namespace audio {

namespace {

bool path_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

std::string make_timestamped_filename(const std::string& directory,
                                      const std::string& prefix,
                                      uint32_t source_tag,
                                      std::time_t when) {
    std::tm local_tm{};
    localtime_r(&when, &local_tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local_tm);

    std::string path;
    if (!directory.empty() && directory != ".") {
        path = directory;
        if (path.back() != '/') {
            path.push_back('/');
        }
    }
    path += prefix + "_" + stamp + "_" + std::to_string(source_tag) + ".ogg";
    return path;
}

DiagnosticsWriter::DiagnosticsWriter(std::string directory, bool enabled)
    : directory_(std::move(directory)), enabled_(enabled) {}

std::string DiagnosticsWriter::unique_path_for(uint32_t source_tag) {
    const std::string base = make_timestamped_filename(directory_, "debug_audio", source_tag, std::time(nullptr));
    if (!path_exists(base)) {
        return base;
    }
    const std::string stem = base.substr(0, base.size() - 4); // strip ".ogg"
    for (int suffix = 1; suffix < 1000; ++suffix) {
        std::string candidate = stem + "_" + std::to_string(suffix) + ".ogg";
        if (!path_exists(candidate)) {
            return candidate;
        }
    }
    return base;
}

bool DiagnosticsWriter::write_failed_batch(uint32_t source_tag, const std::vector<uint8_t>& data, std::string& out_path) {
    if (!enabled_ || data.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string path = unique_path_for(source_tag);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        LOG_CPP_WARNING("[DiagnosticsWriter] Failed to open %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (file.fail()) {
        LOG_CPP_WARNING("[DiagnosticsWriter] Failed to write %s", path.c_str());
        return false;
    }

    LOG_CPP_INFO("[DiagnosticsWriter] Wrote %s (%zu bytes) for SSRC 0x%08X", path.c_str(), data.size(), source_tag);
    out_path = path;
    return true;
}

} // namespace audio
} // namespace voicetap
