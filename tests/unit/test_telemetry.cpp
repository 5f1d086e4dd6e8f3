/**
 * @file test_telemetry.cpp
 * @brief Unit tests for the logger, log sinks, metrics serialization and
 *        the buffered TelemetryCollector.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/telemetry_collector.hpp"
#include "telemetry/telemetry_pipeline.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace execution_engine;

namespace {

ExecutionMetrics sample_metrics(const std::string& id) {
    ExecutionMetrics m;
    m.request_id = id;
    m.tenant_id = "tenant-a";
    m.node_id = "node-01";
    m.unit_id = "node-01-u1";
    m.runtime = "python3";
    m.outcome = "completed";
    m.served_warm = true;
    m.scheduling_attempts = 1;
    m.phases.queue = Duration{10};
    m.phases.acquisition = Duration{20};
    m.phases.setup = Duration{30};
    m.phases.run = Duration{400};
    m.phases.cleanup = Duration{40};
    m.usage.peak_memory_bytes = 4096;
    m.recorded_at = std::chrono::system_clock::now();
    return m;
}

/// Pipeline that blocks each push until released and can be told to fail.
class GatedPipeline : public ITelemetryPipeline {
public:
    Result<void> push(const ExecutionMetrics& metrics) override {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
        if (fail_) return Error{"sink unavailable"};
        ids_.push_back(metrics.request_id);
        return {};
    }
    void flush() override { flushes_.fetch_add(1); }

    void open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }
    void close() {
        std::lock_guard lock(mutex_);
        open_ = false;
    }
    void set_fail(bool fail) {
        std::lock_guard lock(mutex_);
        fail_ = fail;
    }
    std::vector<std::string> ids() {
        std::lock_guard lock(mutex_);
        return ids_;
    }
    int flushes() const { return flushes_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = true;
    bool fail_ = false;
    std::vector<std::string> ids_;
    std::atomic<int> flushes_{0};
};

}  // namespace

// ─── Logger ──────────────────────────────────

TEST(LoggerTest, FiltersBelowLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown too");

    EXPECT_EQ(buffer->size(), 2u);
    EXPECT_EQ(buffer->count_containing("hidden"), 0u);
}

TEST(LoggerTest, ComponentLoggerSharesSink) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger root(std::move(sink), LogLevel::Debug);
    auto child = root.for_component("pool.node-01");

    root.info("from root");
    child.info("from child");

    auto lines = buffer->snapshot();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].find("component"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("component":"pool.node-01")"), std::string::npos);
}

TEST(LoggerTest, EscapesMessage) {
    EXPECT_EQ(json_escape("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_TRUE(parse_log_level("debug") == LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("error") == LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerTest, NullSinkLoggerIsSafe) {
    Logger logger(nullptr);
    logger.error("nowhere");
    logger.flush();
}

// ─── JsonFileSink ────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ee_test_sink";
        std::filesystem::remove_all(dir_);
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    static size_t line_count(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        std::string line;
        while (std::getline(in, line)) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, WritesLines) {
    {
        JsonFileSink sink(dir_, "test");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
    }
    EXPECT_EQ(line_count(dir_ / "test.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndCapsFileCount) {
    JsonFileSink sink(dir_, "rot", 50, 2);
    sink.set_max_file_size_bytes(20);

    // Each line is 16 bytes with the newline; every second write rotates
    for (int i = 0; i < 10; ++i) {
        sink.write(R"({"line":"xxxx"})");
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
    EXPECT_EQ(line_count(sink.rotated_path(1)), 2u);
}

TEST_F(JsonFileSinkTest, AppendsToExistingFile) {
    {
        JsonFileSink sink(dir_, "app");
        sink.write("{}");
    }
    {
        JsonFileSink sink(dir_, "app");
        sink.write("{}");
    }
    EXPECT_EQ(line_count(dir_ / "app.ndjson"), 2u);
}

// ─── Metrics serialization ───────────────────

TEST(TelemetryPipelineTest, ToJsonCarriesPhasesAndCounters) {
    auto m = sample_metrics("req-\"1\"");
    auto json = to_json(m);

    EXPECT_NE(json.find(R"("event":"execution")"), std::string::npos);
    EXPECT_NE(json.find(R"("request":"req-\"1\"")"), std::string::npos);
    EXPECT_NE(json.find(R"("warm":true)"), std::string::npos);
    EXPECT_NE(json.find(R"("total":500)"), std::string::npos);
    EXPECT_NE(json.find(R"("syscalls":null)"), std::string::npos);
    EXPECT_NE(json.find(R"("host_before":{)"), std::string::npos);

    m.counters.syscalls = 77;
    EXPECT_NE(to_json(m).find(R"("syscalls":77)"), std::string::npos);
}

TEST(TelemetryPipelineTest, NdjsonPipelineWritesOneLinePerRecord) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    NdjsonTelemetryPipeline pipeline(std::move(sink));

    ASSERT_TRUE(pipeline.push(sample_metrics("a")));
    ASSERT_TRUE(pipeline.push(sample_metrics("b")));
    pipeline.flush();

    EXPECT_EQ(buffer->size(), 2u);
    EXPECT_EQ(buffer->count_containing(R"("request":"a")"), 1u);
}

// ─── TelemetryCollector ──────────────────────

TEST(TelemetryCollectorTest, DeliversInOrder) {
    GatedPipeline pipeline;
    TelemetryCollector collector(pipeline, 16, Logger(nullptr));
    collector.start();

    for (int i = 0; i < 5; ++i) collector.record(sample_metrics("r" + std::to_string(i)));
    ASSERT_TRUE(collector.flush());

    EXPECT_EQ(pipeline.ids(), (std::vector<std::string>{"r0", "r1", "r2", "r3", "r4"}));
    EXPECT_EQ(collector.recorded(), 5u);
    EXPECT_EQ(collector.delivered(), 5u);
    EXPECT_EQ(collector.dropped(), 0u);
    EXPECT_GE(pipeline.flushes(), 1);
}

TEST(TelemetryCollectorTest, DropsOldestWhenFull) {
    GatedPipeline pipeline;
    TelemetryCollector collector(pipeline, 3, Logger(nullptr));

    // Not started: nothing drains, so the fourth and fifth evict the oldest
    for (int i = 0; i < 5; ++i) collector.record(sample_metrics("r" + std::to_string(i)));
    EXPECT_EQ(collector.buffered(), 3u);
    EXPECT_EQ(collector.dropped(), 2u);

    collector.start();
    ASSERT_TRUE(collector.flush());
    EXPECT_EQ(pipeline.ids(), (std::vector<std::string>{"r2", "r3", "r4"}));
}

TEST(TelemetryCollectorTest, RecordNeverBlocksOnSlowPipeline) {
    GatedPipeline pipeline;
    pipeline.close();
    TelemetryCollector collector(pipeline, 2, Logger(nullptr));
    collector.start();

    auto begin = SteadyClock::now();
    for (int i = 0; i < 100; ++i) collector.record(sample_metrics("r" + std::to_string(i)));
    EXPECT_LT(SteadyClock::now() - begin, std::chrono::seconds(1));
    EXPECT_GE(collector.dropped(), 97u);

    pipeline.open();
    EXPECT_TRUE(collector.flush());
}

TEST(TelemetryCollectorTest, CountsFailedPushes) {
    GatedPipeline pipeline;
    pipeline.set_fail(true);
    auto sink = std::make_unique<MemorySink>();
    auto log = sink->buffer();
    TelemetryCollector collector(pipeline, 8, Logger(std::move(sink)));
    collector.start();

    collector.record(sample_metrics("lost"));
    ASSERT_TRUE(collector.flush());
    EXPECT_EQ(collector.failed(), 1u);
    EXPECT_EQ(collector.delivered(), 0u);
    EXPECT_EQ(log->count_containing("lost"), 1u);
}

TEST(TelemetryCollectorTest, StopDrainsBuffer) {
    GatedPipeline pipeline;
    pipeline.close();
    TelemetryCollector collector(pipeline, 8, Logger(nullptr));
    collector.start();
    for (int i = 0; i < 4; ++i) collector.record(sample_metrics("r" + std::to_string(i)));

    std::thread opener([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pipeline.open();
    });
    collector.stop();
    opener.join();

    EXPECT_EQ(pipeline.ids().size(), 4u);
    EXPECT_EQ(collector.buffered(), 0u);
}
