#include "silence_detector.h"

#include "../utils/cpp_logger.h"

#include <utility>

namespace voicetap {
namespace audio {

SilenceDetector::SilenceDetector(std::shared_ptr<SessionStore> store, SilenceDetectionTuning tuning)
    : AudioComponent("SilenceDetector"),
      store_(std::move(store)),
      threshold_(std::chrono::milliseconds(tuning.silence_threshold_ms)),
      scan_interval_(std::chrono::milliseconds(tuning.scan_interval_ms > 0 ? tuning.scan_interval_ms : 1)) {
    stop_flag_ = true;
    LOG_CPP_INFO("[SilenceDetector] Initialized (threshold=%lldms, interval=%lldms)",
                 static_cast<long long>(threshold_.count()), static_cast<long long>(scan_interval_.count()));
}

SilenceDetector::~SilenceDetector() {
    stop();
}

void SilenceDetector::start() {
    if (is_running()) {
        return;
    }
    LOG_CPP_INFO("[SilenceDetector] Starting...");
    launch_thread();
}

void SilenceDetector::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_flag_ = true;
    }
    wait_cv_.notify_all();
    join_thread();
}

std::size_t SilenceDetector::scan_once(std::chrono::steady_clock::time_point now) {
    if (!store_) {
        return 0;
    }
    auto handoffs = store_->take_stale(now, threshold_);
    std::size_t submitted = 0;
    for (auto& handoff : handoffs) {
        if (!handoff.batch || !handoff.sink) {
            continue;
        }
        LOG_CPP_DEBUG("[SilenceDetector] SSRC 0x%08X silent, flushing %zu packets",
                      handoff.batch->source_tag, handoff.batch->size());
        if (handoff.result == SubmitResult::Queued) {
            ++submitted;
        }
    }
    return submitted;
}

void SilenceDetector::run() {
    LOG_CPP_DEBUG("[SilenceDetector] Thread started");
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (!stop_flag_) {
        wait_cv_.wait_for(lock, scan_interval_, [this] { return stop_flag_.load(); });
        if (stop_flag_) {
            break;
        }
        lock.unlock();
        ticks_++;
        scan_once(std::chrono::steady_clock::now());
        lock.lock();
    }
    LOG_CPP_DEBUG("[SilenceDetector] Thread exiting");
}

} // namespace audio
} // namespace voicetap
