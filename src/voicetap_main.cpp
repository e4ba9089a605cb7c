#include "voice_engine/configuration/command_line.h"
#include "voice_engine/managers/voice_processor.h"
#include "voice_engine/receivers/rtp/rtp_packet_source.h"
#include "voice_engine/recognition/tcp_speech_recognizer.h"
#include "voice_engine/utils/cpp_logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace voicetap::audio;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int) {
    g_stop_requested = 1;
}

void print_log_entries(const std::vector<logging::LogEntry>& entries) {
    for (const auto& entry : entries) {
        std::fprintf(stderr, "[%s] [%s:%d] %s\n", logging::log_level_name(entry.level),
                     entry.filename.c_str(), entry.line_number, entry.message.c_str());
    }
}

// Drains the engine's log queue to stderr until the pump is told to stop.
void run_log_pump(std::atomic<bool>& running) {
    while (running) {
        print_log_entries(logging::retrieve_log_entries(200));
    }
    for (;;) {
        auto remaining = logging::retrieve_log_entries(0);
        if (remaining.empty()) {
            break;
        }
        print_log_entries(remaining);
    }
    std::fflush(stderr);
}

const char* env_lookup(const char* name) {
    return std::getenv(name);
}

} // namespace

int main(int argc, char* argv[]) {
    VoicetapOptions options;
    std::string error;
    if (!apply_environment(options, env_lookup, error) ||
        !parse_command_line(argc, argv, options, error)) {
        std::cerr << "voicetap: " << error << "\n\n";
        print_usage(std::cerr, argv[0]);
        return 2;
    }
    if (options.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    if (!validate_options(options, error)) {
        std::cerr << "voicetap: " << error << "\n\n";
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    logging::LogLevel level = logging::LogLevel::INFO;
    logging::parse_log_level(options.log_level, level);
    logging::set_cpp_log_level(level);

    std::atomic<bool> log_pump_running{true};
    std::thread log_pump(run_log_pump, std::ref(log_pump_running));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    try {
        auto source = std::make_shared<RtpPacketSource>(options.rtp);
        if (!source->open()) {
            LOG_CPP_ERROR("[voicetap] Could not open RTP listener on %s:%u",
                          options.rtp.bind_address.c_str(), options.rtp.listen_port);
            exit_code = 1;
        } else {
            auto recognizer = std::make_shared<TcpSpeechRecognizer>(options.recognizer);
            std::mutex stdout_mutex;
            VoiceProcessor processor(options.engine, recognizer,
                [&stdout_mutex](uint32_t source_tag, const std::string& transcript, double confidence) {
                    std::lock_guard<std::mutex> lock(stdout_mutex);
                    std::printf("[TRANSCRIPTION] SSRC %u [FINAL]: %s (confidence: %.2f)\n",
                                source_tag, transcript.c_str(), confidence);
                    std::fflush(stdout);
                });

            if (!processor.start_processing(source)) {
                exit_code = 1;
            } else {
                LOG_CPP_INFO("[voicetap] Listening on port %u, press Ctrl+C to stop", source->bound_port());
                while (!g_stop_requested) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                LOG_CPP_INFO("[voicetap] Shutdown requested");
                processor.stop_processing();
            }
        }
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("[voicetap] Fatal error: %s", e.what());
        exit_code = 1;
    }

    log_pump_running = false;
    if (log_pump.joinable()) {
        log_pump.join();
    }
    logging::shutdown_cpp_logger();
    return exit_code;
}
