#include <gtest/gtest.h>
#include "document.hpp"
#include "exception.hpp"
#include "observability.hpp"
#include "utils/hex.hpp"
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <atomic>

// Mock Logger and Metrics for testing
class MockLogger : public nbtcpp::ILogger {
public:
    struct LogEntry {
        nbtcpp::LogLevel level;
        std::string message;
        std::string operation;
        size_t byte_count;
        std::string key;
    };

    std::atomic<int> log_call_count{0};
    std::vector<LogEntry> logs;

    bool log(nbtcpp::LogLevel level, std::string_view message, std::string_view operation,
             std::chrono::microseconds, size_t byte_count, std::string_view key) override {
        log_call_count++;
        logs.push_back({level, std::string(message), std::string(operation), byte_count, std::string(key)});
        return true;
    }
};

class MockMetrics : public nbtcpp::IMetrics {
public:
    std::atomic<int> metric_call_count{0};
    std::vector<std::string> operations;
    std::vector<std::string> statuses;
    size_t bytes_read = 0;
    size_t bytes_written = 0;
    std::vector<int> errors;

    bool record_latency(std::string_view, double) override { metric_call_count++; return true; }
    bool increment_operation_count(std::string_view operation, std::string_view status) override {
        metric_call_count++;
        operations.emplace_back(operation);
        statuses.emplace_back(status);
        return true;
    }
    bool record_bytes_read(size_t bytes) override { metric_call_count++; bytes_read += bytes; return true; }
    bool record_bytes_written(size_t bytes) override { metric_call_count++; bytes_written += bytes; return true; }
    bool record_error(int error_kind) override { metric_call_count++; errors.push_back(error_kind); return true; }
};

// Test fixture to reset global state
struct ObservabilityTest : public ::testing::Test {
    void SetUp() override {
        nbtcpp::set_logger(nullptr);
        nbtcpp::set_metrics(nullptr);
        nbtcpp::set_log_level_threshold(nbtcpp::LogLevel::Info);
    }

    void TearDown() override {
        nbtcpp::set_logger(nullptr);
        nbtcpp::set_metrics(nullptr);
        nbtcpp::set_log_level_threshold(nbtcpp::LogLevel::Info);
    }
};

TEST_F(ObservabilityTest, ThreadSafetySetLogger) {
    MockLogger mock_logger1;
    MockLogger mock_logger2;
    const int num_threads = 100;
    std::vector<std::thread> threads;

    std::atomic<int> ready_threads = 0;
    std::atomic<bool> start_test = false;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            ready_threads++;
            while (!start_test) {
                std::this_thread::yield(); // Wait for signal to start
            }
            if (i % 2 == 0) {
                nbtcpp::set_logger(&mock_logger1);
            } else {
                nbtcpp::set_logger(&mock_logger2);
            }
        });
    }

    while (ready_threads < num_threads) {
        std::this_thread::yield();
    }
    start_test = true;

    for (auto& t : threads) {
        t.join();
    }

    ASSERT_NE(nbtcpp::g_logger.load(std::memory_order_acquire), nullptr);
}

TEST_F(ObservabilityTest, NullResetsToNoOpSinks) {
    MockLogger logger;
    nbtcpp::set_logger(&logger);
    nbtcpp::set_logger(nullptr);
    ASSERT_NE(nbtcpp::g_logger.load(), nullptr);
    EXPECT_NE(nbtcpp::g_logger.load(), &logger);
    EXPECT_TRUE(nbtcpp::log_if_enabled(nbtcpp::LogLevel::Error, "dropped", "Test",
                                       std::chrono::microseconds(0), 0));
    EXPECT_EQ(logger.log_call_count, 0);
}

TEST_F(ObservabilityTest, ThresholdFiltersDebugRecords) {
    MockLogger logger;
    nbtcpp::set_logger(&logger);

    nbtcpp::Document doc("quiet");
    std::ostringstream out;
    doc.write(out, nbtcpp::Endianness::Big);
    EXPECT_EQ(logger.log_call_count, 0);

    nbtcpp::set_log_level_threshold(nbtcpp::LogLevel::Debug);
    doc.write(out, nbtcpp::Endianness::Big);
    EXPECT_EQ(logger.log_call_count, 1);
}

TEST_F(ObservabilityTest, ReadAndWriteAreReported) {
    MockLogger logger;
    MockMetrics metrics;
    nbtcpp::set_logger(&logger);
    nbtcpp::set_metrics(&metrics);
    nbtcpp::set_log_level_threshold(nbtcpp::LogLevel::Debug);

    nbtcpp::Document doc("world");
    doc.insert("health", nbtcpp::Value(int8_t{100}));
    std::ostringstream out;
    doc.write(out, nbtcpp::Endianness::Big);
    size_t size = out.str().size();

    std::istringstream in(out.str());
    (void)nbtcpp::Document::read(in, nbtcpp::Endianness::Big);

    ASSERT_EQ(logger.logs.size(), 2u);
    EXPECT_EQ(logger.logs[0].operation, "DocumentWrite");
    EXPECT_EQ(logger.logs[0].byte_count, size);
    EXPECT_EQ(logger.logs[0].key, "world");
    EXPECT_EQ(logger.logs[1].operation, "DocumentRead");
    EXPECT_EQ(logger.logs[1].byte_count, size);

    EXPECT_EQ(metrics.operations, (std::vector<std::string>{"DocumentWrite", "DocumentRead"}));
    EXPECT_EQ(metrics.statuses, (std::vector<std::string>{"success", "success"}));
    EXPECT_EQ(metrics.bytes_written, size);
    EXPECT_EQ(metrics.bytes_read, size);
    EXPECT_TRUE(metrics.errors.empty());
}

TEST_F(ObservabilityTest, FailuresAreLoggedAndCounted) {
    MockLogger logger;
    MockMetrics metrics;
    nbtcpp::set_logger(&logger);
    nbtcpp::set_metrics(&metrics);

    std::istringstream in(nbtcpp::utils::hex_decode("01 0000 64"));
    EXPECT_THROW(nbtcpp::Document::read(in, nbtcpp::Endianness::Big), nbtcpp::exception);

    ASSERT_EQ(logger.logs.size(), 1u);
    EXPECT_EQ(logger.logs[0].level, nbtcpp::LogLevel::Error);
    EXPECT_EQ(logger.logs[0].operation, "DocumentRead");
    ASSERT_EQ(metrics.errors.size(), 1u);
    EXPECT_EQ(metrics.errors[0], static_cast<int>(nbtcpp::ErrorKind::MissingRootCompound));
    EXPECT_EQ(metrics.statuses, (std::vector<std::string>{"failure"}));
}
