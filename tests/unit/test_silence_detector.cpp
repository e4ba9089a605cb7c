#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <memory>
#include <thread>
#include "dispatch/silence_detector.h"
#include "../mocks/mock_voice.h"

using namespace voicetap::audio;
using voicetap::audio::testing::RecordingBatchSink;
using voicetap::audio::testing::make_voice_packet;
using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

class SilenceDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<SessionStore>(
            [this](uint32_t tag) -> std::shared_ptr<IBatchSink> {
                auto sink = std::make_shared<RecordingBatchSink>();
                sinks[tag] = sink;
                return sink;
            },
            std::make_shared<EngineCounters>());
        tuning.silence_threshold_ms = 2000;
        tuning.scan_interval_ms = 100;
    }

    std::shared_ptr<SessionStore> store;
    std::map<uint32_t, std::shared_ptr<RecordingBatchSink>> sinks;
    SilenceDetectionTuning tuning;
    Clock::time_point t0 = Clock::now();
};

TEST_F(SilenceDetectorTest, FlushesOnlyAfterThreshold) {
    SilenceDetector detector(store, tuning);
    for (uint16_t seq = 0; seq < 3; ++seq) {
        store->append(make_voice_packet(1, seq), t0 + milliseconds(20 * seq));
    }

    EXPECT_EQ(detector.scan_once(t0 + milliseconds(1000)), 0u);
    EXPECT_EQ(detector.scan_once(t0 + milliseconds(2039)), 0u);
    EXPECT_EQ(detector.scan_once(t0 + milliseconds(2040)), 1u);

    auto batches = sinks[1]->batches();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0]->size(), 3u);
}

TEST_F(SilenceDetectorTest, OneFlushPerSilence) {
    SilenceDetector detector(store, tuning);
    store->append(make_voice_packet(1, 0), t0);

    // Scanning every 100 ms through a long silence flushes exactly once.
    std::size_t flushed = 0;
    for (int ms = 0; ms <= 10000; ms += 100) {
        flushed += detector.scan_once(t0 + milliseconds(ms));
    }
    EXPECT_EQ(flushed, 1u);

    // New speech after the pause produces a second, separate batch.
    store->append(make_voice_packet(1, 1), t0 + milliseconds(10050));
    for (int ms = 10100; ms <= 13000; ms += 100) {
        flushed += detector.scan_once(t0 + milliseconds(ms));
    }
    EXPECT_EQ(flushed, 2u);

    auto batches = sinks[1]->batches();
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0]->flush_index, 0u);
    EXPECT_EQ(batches[1]->flush_index, 1u);
    EXPECT_EQ(batches[1]->packets.front().sequence_number, 1u);
}

TEST_F(SilenceDetectorTest, ContinuousSpeechIsNeverFlushed) {
    SilenceDetector detector(store, tuning);
    for (int ms = 0; ms < 10000; ms += 20) {
        store->append(make_voice_packet(1, static_cast<uint16_t>(ms / 20)), t0 + milliseconds(ms));
        if (ms % 100 == 0) {
            EXPECT_EQ(detector.scan_once(t0 + milliseconds(ms)), 0u);
        }
    }
    EXPECT_TRUE(sinks[1]->batches().empty());
}

TEST_F(SilenceDetectorTest, SourcesAreIndependent) {
    SilenceDetector detector(store, tuning);
    store->append(make_voice_packet(1, 0), t0);
    store->append(make_voice_packet(2, 0), t0);
    for (int ms = 20; ms <= 3000; ms += 20) {
        store->append(make_voice_packet(2, static_cast<uint16_t>(ms / 20)), t0 + milliseconds(ms));
    }

    EXPECT_EQ(detector.scan_once(t0 + milliseconds(3000)), 1u);
    EXPECT_EQ(sinks[1]->batches().size(), 1u);
    EXPECT_TRUE(sinks[2]->batches().empty());
}

TEST_F(SilenceDetectorTest, ClosedSinkIsNotCounted) {
    SilenceDetector detector(store, tuning);
    store->append(make_voice_packet(1, 0), t0);
    sinks[1]->request_close();
    EXPECT_EQ(detector.scan_once(t0 + milliseconds(5000)), 0u);
}

TEST_F(SilenceDetectorTest, BackgroundThreadFlushesIdleSource) {
    tuning.silence_threshold_ms = 150;
    tuning.scan_interval_ms = 20;
    SilenceDetector detector(store, tuning);
    store->append(make_voice_packet(1, 0), Clock::now());

    detector.start();
    EXPECT_TRUE(detector.is_running());
    const auto deadline = Clock::now() + milliseconds(2000);
    while (sinks[1]->batches().empty() && Clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    detector.stop();

    EXPECT_EQ(sinks[1]->batches().size(), 1u);
    EXPECT_GT(detector.ticks(), 0u);
    EXPECT_FALSE(detector.is_running());
}

TEST_F(SilenceDetectorTest, StopWithoutStartIsSafe) {
    SilenceDetector detector(store, tuning);
    detector.stop();
    detector.stop();
    EXPECT_FALSE(detector.is_running());
}
