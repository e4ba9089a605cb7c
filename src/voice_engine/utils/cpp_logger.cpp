#include "cpp_logger.h"
#include <iostream>
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <cctype>
#include <cstdarg> // For va_list, va_start, va_end
#include <cstdio>  // For vsnprintf
#include <cstring> // For strrchr

#include <chrono>
#include <algorithm>
#include <condition_variable>

namespace voicetap {
namespace audio {
namespace logging {

std::atomic<LogLevel> current_log_level{LogLevel::INFO};

namespace {
    std::deque<LogEntry> internal_log_queue;
    std::mutex internal_log_queue_mutex;
    std::condition_variable internal_log_queue_cv;
    const size_t MAX_LOG_QUEUE_SIZE = 2048;
    const size_t MAX_RETRIEVE_BATCH = 100;
    bool shutdown_requested = false;
    bool overflow_message_logged_since_clear = false;
}

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* last_slash = strrchr(path, '/');
    const char* last_backslash = strrchr(path, '\\');

    const char* base = nullptr;
    if (last_slash && last_backslash) {
        base = (last_slash > last_backslash) ? last_slash + 1 : last_backslash + 1;
    } else if (last_slash) {
        base = last_slash + 1;
    } else if (last_backslash) {
        base = last_backslash + 1;
    } else {
        base = path;
    }
    return base;
}

void set_cpp_log_level(LogLevel level) {
    current_log_level.store(level);
}

bool parse_log_level(const std::string& name, LogLevel& out_level) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lowered == "debug") {
        out_level = LogLevel::DEBUG;
    } else if (lowered == "info") {
        out_level = LogLevel::INFO;
    } else if (lowered == "warning" || lowered == "warn") {
        out_level = LogLevel::WARNING;
    } else if (lowered == "error" || lowered == "err") {
        out_level = LogLevel::ERR;
    } else {
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERR:     return "ERROR";
    }
    return "UNKNOWN";
}

void log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(current_log_level.load(std::memory_order_relaxed))) {
        return;
    }

    std::vector<char> buffer(512);
    va_list args;
    va_start(args, format);
    int needed = vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);

    if (needed < 0) {
        std::cerr << "CppLogger: Encoding error in log_message for file " << (file ? file : "unknown_file") << ":" << line << std::endl;
        return;
    }

    if (static_cast<size_t>(needed) >= buffer.size()) {
        buffer.resize(static_cast<size_t>(needed) + 1);
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
    }

    LogEntry new_entry;
    new_entry.level = level;
    new_entry.message = std::string(buffer.data());
    new_entry.filename = (file ? std::string(file) : "unknown_file");
    new_entry.line_number = line;

    std::unique_lock<std::mutex> lock(internal_log_queue_mutex);
    if (shutdown_requested) {
        return;
    }

    if (internal_log_queue.size() >= MAX_LOG_QUEUE_SIZE) {
        internal_log_queue.pop_front();
        if (!overflow_message_logged_since_clear) {
            // Logged once until the consumer catches up.
            LogEntry overflow_entry;
            overflow_entry.level = LogLevel::WARNING;
            overflow_entry.message = "Log queue overflow. Oldest messages dropped.";
            overflow_entry.filename = "cpp_logger.cpp";
            overflow_entry.line_number = __LINE__;
            internal_log_queue.push_back(std::move(overflow_entry));
            overflow_message_logged_since_clear = true;
        }
    }
    internal_log_queue.push_back(std::move(new_entry));
    lock.unlock();
    internal_log_queue_cv.notify_one();
}

std::vector<LogEntry> retrieve_log_entries(int timeout_ms) {
    std::vector<LogEntry> batch;
    std::unique_lock<std::mutex> lock(internal_log_queue_mutex);

    if (!internal_log_queue_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                         []{ return !internal_log_queue.empty() || shutdown_requested; })) {
        return batch;
    }

    if (shutdown_requested && internal_log_queue.empty()) {
        return batch;
    }

    size_t items_to_grab = std::min(internal_log_queue.size(), MAX_RETRIEVE_BATCH);
    batch.reserve(items_to_grab);

    for (size_t i = 0; i < items_to_grab && !internal_log_queue.empty(); ++i) {
        batch.push_back(std::move(internal_log_queue.front()));
        internal_log_queue.pop_front();
    }

    if (overflow_message_logged_since_clear && internal_log_queue.size() < (MAX_LOG_QUEUE_SIZE / 2)) {
        overflow_message_logged_since_clear = false;
    }

    return batch;
}

void shutdown_cpp_logger() {
    std::unique_lock<std::mutex> lock(internal_log_queue_mutex);
    shutdown_requested = true;
    lock.unlock();
    internal_log_queue_cv.notify_all();
}

} // namespace logging
} // namespace audio
} // namespace voicetap
