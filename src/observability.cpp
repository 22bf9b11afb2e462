#include "observability.hpp"

namespace nbtcpp {

#ifndef NBTCPP_DISABLE_OBSERVABILITY

namespace {

// Sinks installed when the caller has not provided one, or resets to nullptr.
struct DiscardLogger final : ILogger {
  bool log(LogLevel, std::string_view, std::string_view,
           std::chrono::microseconds, size_t, std::string_view) override {
    return true;
  }
};

struct DiscardMetrics final : IMetrics {
  bool record_latency(std::string_view, double) override { return true; }
  bool increment_operation_count(std::string_view, std::string_view) override {
    return true;
  }
  bool record_bytes_read(size_t) override { return true; }
  bool record_bytes_written(size_t) override { return true; }
  bool record_error(int) override { return true; }
};

DiscardLogger discard_logger;
DiscardMetrics discard_metrics;

} // namespace

std::atomic<ILogger *> g_logger{&discard_logger};
std::atomic<IMetrics *> g_metrics{&discard_metrics};
std::atomic<LogLevel> g_log_level_threshold{LogLevel::Info};

void set_logger(ILogger *logger) {
  g_logger.store(logger ? logger : &discard_logger, std::memory_order_release);
}

void set_metrics(IMetrics *metrics) {
  g_metrics.store(metrics ? metrics : &discard_metrics,
                  std::memory_order_release);
}

void set_log_level_threshold(LogLevel level) {
  g_log_level_threshold.store(level, std::memory_order_release);
}

#endif // NBTCPP_DISABLE_OBSERVABILITY

} // namespace nbtcpp
