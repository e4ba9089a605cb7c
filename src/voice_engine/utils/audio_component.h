/**
 * @file audio_component.h
 * @brief Defines the AudioComponent base class for stages that own one thread.
 * @details The ingestion loop, the silence detector and every per-source dispatcher
 *          worker own exactly one thread. Subclasses implement `run()` and decide how
 *          their loop is woken on stop; the base owns thread launch and join.
 */
#ifndef AUDIO_COMPONENT_H
#define AUDIO_COMPONENT_H

#include "cpp_logger.h"

#include <atomic>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace voicetap {
namespace audio {

/**
 * @class AudioComponent
 * @brief Base class for components with their own processing thread.
 */
class AudioComponent {
public:
    virtual ~AudioComponent() = default;

    AudioComponent(const AudioComponent&) = delete;
    AudioComponent& operator=(const AudioComponent&) = delete;
    AudioComponent(AudioComponent&&) = delete;
    AudioComponent& operator=(AudioComponent&&) = delete;

    /** @brief Launches the processing thread. Throws std::system_error if it cannot be created. */
    virtual void start() = 0;

    /** @brief Signals the processing thread and joins it. Safe to call repeatedly. */
    virtual void stop() = 0;

    /** @brief True while the thread exists and no stop has been requested. */
    bool is_running() const {
        return component_thread_.joinable() && !stop_flag_;
    }

    const std::string& component_name() const { return component_name_; }

protected:
    explicit AudioComponent(std::string component_name)
        : component_name_(std::move(component_name)), stop_flag_(false) {}

    /** @brief Body of the processing thread; returns once `stop_flag_` is observed. */
    virtual void run() = 0;

    /**
     * @brief Clears the stop flag and spawns the thread running `run()`.
     * @return false if a thread is already running.
     */
    bool launch_thread() {
        if (component_thread_.joinable()) {
            return false;
        }
        stop_flag_ = false;
        try {
            component_thread_ = std::thread([this]() { run(); });
        } catch (const std::system_error& e) {
            LOG_CPP_ERROR("[%s] Failed to start thread: %s", component_name_.c_str(), e.what());
            stop_flag_ = true;
            throw;
        }
        return true;
    }

    /** @brief Joins the thread if one was launched. The caller must have woken it first. */
    void join_thread() {
        if (component_thread_.joinable()) {
            component_thread_.join();
        }
    }

    const std::string component_name_;
    std::thread component_thread_;
    std::atomic<bool> stop_flag_;
};

} // namespace audio
} // namespace voicetap

#endif // AUDIO_COMPONENT_H
