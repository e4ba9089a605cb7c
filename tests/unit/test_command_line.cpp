#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include "configuration/command_line.h"

using namespace voicetap::audio;

class CommandLineTest : public ::testing::Test {
protected:
    bool parse(std::vector<const char*> args) {
        args.insert(args.begin(), "voicetap");
        error.clear();
        return parse_command_line(static_cast<int>(args.size()), args.data(), options, error);
    }

    EnvironmentLookup lookup_from(const std::map<std::string, std::string>& env) {
        environment = env;
        return [this](const char* name) -> const char* {
            auto it = environment.find(name);
            return it == environment.end() ? nullptr : it->second.c_str();
        };
    }

    VoicetapOptions options;
    std::string error;
    std::map<std::string, std::string> environment;
};

TEST_F(CommandLineTest, DefaultsMatchEngineDefaults) {
    ASSERT_TRUE(parse({}));
    EXPECT_EQ(options.engine.silence_detection.silence_threshold_ms, 2000);
    EXPECT_EQ(options.engine.silence_detection.scan_interval_ms, 100);
    EXPECT_EQ(options.engine.dispatch.queue_capacity, 10u);
    EXPECT_EQ(options.engine.stream_format.sample_rate, 48000);
    EXPECT_EQ(options.engine.stream_format.channels, 2);
    EXPECT_EQ(options.engine.dispatch.language_code, "en-US");
    EXPECT_TRUE(options.engine.dispatch.write_diagnostics);
    EXPECT_FALSE(options.engine.recording.enabled);
    EXPECT_EQ(options.rtp.listen_port, kDefaultRtpListenPort);
    EXPECT_EQ(options.log_level, "info");
    EXPECT_FALSE(options.show_help);
}

TEST_F(CommandLineTest, ParsesValueFlags) {
    ASSERT_TRUE(parse({"--listen-address", "127.0.0.1", "--listen-port", "5004",
                       "--recognizer-host", "asr.local", "--recognizer-port", "9000",
                       "--silence-threshold-ms", "1500", "--scan-interval-ms", "50",
                       "--queue-capacity", "3", "--language", "fr-FR",
                       "--reorder-window-ms", "40", "--channels", "1", "--sample-rate", "16000",
                       "--log-level", "debug"})) << error;

    EXPECT_EQ(options.rtp.bind_address, "127.0.0.1");
    EXPECT_EQ(options.rtp.listen_port, 5004);
    EXPECT_EQ(options.rtp.reorder_window_ms, 40);
    EXPECT_EQ(options.recognizer.host, "asr.local");
    EXPECT_EQ(options.recognizer.port, 9000);
    EXPECT_EQ(options.engine.silence_detection.silence_threshold_ms, 1500);
    EXPECT_EQ(options.engine.silence_detection.scan_interval_ms, 50);
    EXPECT_EQ(options.engine.dispatch.queue_capacity, 3u);
    EXPECT_EQ(options.engine.dispatch.language_code, "fr-FR");
    EXPECT_EQ(options.engine.stream_format.channels, 1);
    EXPECT_EQ(options.engine.stream_format.sample_rate, 16000);
    EXPECT_EQ(options.log_level, "debug");
}

TEST_F(CommandLineTest, ParsesBooleanFlags) {
    ASSERT_TRUE(parse({"--record", "--no-diagnostics", "--no-telemetry", "--help"}));
    EXPECT_TRUE(options.engine.recording.enabled);
    EXPECT_FALSE(options.engine.dispatch.write_diagnostics);
    EXPECT_FALSE(options.engine.telemetry.enabled);
    EXPECT_TRUE(options.show_help);
}

TEST_F(CommandLineTest, RecordDirImpliesRecording) {
    ASSERT_TRUE(parse({"--record-dir", "/var/rec"}));
    EXPECT_TRUE(options.engine.recording.enabled);
    EXPECT_EQ(options.engine.recording.directory, "/var/rec");
}

TEST_F(CommandLineTest, UnknownArgumentIsRejected) {
    EXPECT_FALSE(parse({"--frobnicate", "1"}));
    EXPECT_EQ(error, "unknown argument --frobnicate");
}

TEST_F(CommandLineTest, MissingValueIsRejected) {
    EXPECT_FALSE(parse({"--recognizer-port"}));
    EXPECT_EQ(error, "missing value for --recognizer-port");
}

TEST_F(CommandLineTest, InvalidNumberIsRejected) {
    EXPECT_FALSE(parse({"--listen-port", "70000"}));
    EXPECT_EQ(error, "invalid value '70000' for --listen-port");

    EXPECT_FALSE(parse({"--queue-capacity", "three"}));
    EXPECT_EQ(error, "invalid value 'three' for --queue-capacity");

    EXPECT_FALSE(parse({"--silence-threshold-ms", "12ms"}));
}

TEST_F(CommandLineTest, EnvironmentAppliesAndFlagsOverride) {
    ASSERT_TRUE(apply_environment(options, lookup_from({
        {"VOICETAP_RECOGNIZER_HOST", "env-host"},
        {"VOICETAP_RECOGNIZER_PORT", "7000"},
        {"VOICETAP_SILENCE_THRESHOLD_MS", "3000"},
        {"VOICETAP_RECORD_DIR", "/tmp/rec"},
        {"VOICETAP_LOG_LEVEL", "warning"},
    }), error)) << error;

    EXPECT_EQ(options.recognizer.host, "env-host");
    EXPECT_EQ(options.recognizer.port, 7000);
    EXPECT_EQ(options.engine.silence_detection.silence_threshold_ms, 3000);
    EXPECT_TRUE(options.engine.recording.enabled);
    EXPECT_EQ(options.engine.recording.directory, "/tmp/rec");
    EXPECT_EQ(options.log_level, "warning");

    ASSERT_TRUE(parse({"--recognizer-port", "7001"}));
    EXPECT_EQ(options.recognizer.port, 7001);
    EXPECT_EQ(options.recognizer.host, "env-host");
}

TEST_F(CommandLineTest, InvalidEnvironmentValueIsRejected) {
    EXPECT_FALSE(apply_environment(options, lookup_from({{"VOICETAP_LISTEN_PORT", "abc"}}), error));
    EXPECT_EQ(error, "invalid value 'abc' for VOICETAP_LISTEN_PORT");
}

TEST_F(CommandLineTest, ValidationRequiresRecognizerPort) {
    EXPECT_FALSE(validate_options(options, error));
    EXPECT_NE(error.find("recognizer port"), std::string::npos);

    options.recognizer.port = 9000;
    EXPECT_TRUE(validate_options(options, error)) << error;
}

TEST_F(CommandLineTest, ValidationRejectsInconsistentTuning) {
    options.recognizer.port = 9000;

    options.engine.silence_detection.silence_threshold_ms = 100;
    options.engine.silence_detection.scan_interval_ms = 100;
    EXPECT_FALSE(validate_options(options, error));

    options.engine.silence_detection.silence_threshold_ms = 2000;
    options.engine.dispatch.queue_capacity = 0;
    EXPECT_FALSE(validate_options(options, error));

    options.engine.dispatch.queue_capacity = 10;
    options.engine.stream_format.sample_rate = 44100;
    EXPECT_FALSE(validate_options(options, error));

    options.engine.stream_format.sample_rate = 48000;
    options.engine.stream_format.channels = 3;
    EXPECT_FALSE(validate_options(options, error));

    options.engine.stream_format.channels = 2;
    options.log_level = "verbose";
    EXPECT_FALSE(validate_options(options, error));
    EXPECT_EQ(error, "unknown log level 'verbose'");
}

TEST_F(CommandLineTest, UsageMentionsRequiredFlag) {
    std::ostringstream out;
    print_usage(out, "voicetap");
    EXPECT_NE(out.str().find("--recognizer-port"), std::string::npos);
    EXPECT_NE(out.str().find("VOICETAP_RECOGNIZER_PORT"), std::string::npos);
}
