#ifndef NBTCPP_OBSERVABILITY_HPP
#define NBTCPP_OBSERVABILITY_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace nbtcpp {

enum class LogLevel { Debug, Info, Warn, Error };

class ILogger {
public:
  virtual ~ILogger() = default;
  // `byte_count` is the number of stream bytes consumed or produced when the
  // record was emitted; `key` is the document name when there is one.
  virtual bool log(LogLevel level, std::string_view message,
                   std::string_view operation,
                   std::chrono::microseconds duration, size_t byte_count,
                   std::string_view key = "") = 0;
};

class IMetrics {
public:
  virtual ~IMetrics() = default;
  virtual bool record_latency(std::string_view operation, double seconds) = 0;
  virtual bool increment_operation_count(std::string_view operation,
                                         std::string_view status) = 0;
  virtual bool record_bytes_read(size_t bytes) = 0;
  virtual bool record_bytes_written(size_t bytes) = 0;

  // Errors, keyed by ErrorKind value
  virtual bool record_error(int error_kind) = 0;
};

#ifndef NBTCPP_DISABLE_OBSERVABILITY
// Global atomic pointers for the current logger and metrics implementations.
// The nbt-cpp library does NOT take ownership of the objects pointed to by
// g_logger or g_metrics. Their lifetime must be managed by the caller.
extern std::atomic<ILogger *> g_logger;
extern std::atomic<IMetrics *> g_metrics;

// Sets the global logger. Passing nullptr restores the no-op logger.
// The caller is responsible for ensuring the 'logger' object remains valid
// for the entire duration it is set and used by the library.
void set_logger(ILogger *logger);

// Sets the global metrics collector. Passing nullptr restores the no-op
// collector.
void set_metrics(IMetrics *metrics);

// Global atomic log level threshold. Messages with a level lower than this
// threshold will not be processed by the global logger. Defaults to
// LogLevel::Info.
extern std::atomic<LogLevel> g_log_level_threshold;

void set_log_level_threshold(LogLevel level);
#else
// No-op implementations when observability is disabled
inline void set_logger(ILogger *) {}
inline void set_metrics(IMetrics *) {}
inline void set_log_level_threshold(LogLevel) {}
#endif

inline bool log_if_enabled(LogLevel level, std::string_view message,
                           std::string_view operation,
                           std::chrono::microseconds duration,
                           size_t byte_count, std::string_view key = "") {
#ifndef NBTCPP_DISABLE_OBSERVABILITY
  if (level >= g_log_level_threshold.load(std::memory_order_acquire)) {
    ILogger *logger = g_logger.load(std::memory_order_acquire);
    if (logger) {
      return logger->log(level, message, operation, duration, byte_count,
                         key);
    }
  }
#endif
  return true;
}

// Reports one finished read or write to the metrics collector.
inline void record_operation(std::string_view operation, bool ok,
                             std::chrono::microseconds duration,
                             size_t bytes_read, size_t bytes_written) {
#ifndef NBTCPP_DISABLE_OBSERVABILITY
  IMetrics *metrics = g_metrics.load(std::memory_order_acquire);
  if (!metrics) {
    return;
  }
  metrics->record_latency(operation, std::chrono::duration<double>(duration).count());
  metrics->increment_operation_count(operation, ok ? "success" : "failure");
  if (bytes_read) {
    metrics->record_bytes_read(bytes_read);
  }
  if (bytes_written) {
    metrics->record_bytes_written(bytes_written);
  }
#else
  (void)operation;
  (void)ok;
  (void)duration;
  (void)bytes_read;
  (void)bytes_written;
#endif
}

inline void record_error(int error_kind) {
#ifndef NBTCPP_DISABLE_OBSERVABILITY
  IMetrics *metrics = g_metrics.load(std::memory_order_acquire);
  if (metrics) {
    metrics->record_error(error_kind);
  }
#else
  (void)error_kind;
#endif
}

} // namespace nbtcpp

#endif // NBTCPP_OBSERVABILITY_HPP
