#pragma once

#include "../voice_types.h"

#include <memory>

namespace voicetap {
namespace audio {

enum class SubmitResult {
    Queued,
    DroppedQueueFull,
    DroppedClosed,
    EmptyBatch // Null or empty batch; nothing to dispatch
};

/**
 * @brief Per-source consumer of flush batches, owned by a source session.
 */
class IBatchSink {
public:
    virtual ~IBatchSink() = default;

    /** @brief Hands a batch over. Never blocks the caller. */
    virtual SubmitResult submit(std::shared_ptr<const FlushBatch> batch) = 0;

    /** @brief Stops accepting batches; already queued batches are still processed. */
    virtual void request_close() = 0;

    /** @brief Waits for queued batches to drain and releases the sink's resources. */
    virtual void close() = 0;

    virtual DispatcherStats get_stats() const = 0;
};

} // namespace audio
} // namespace voicetap
