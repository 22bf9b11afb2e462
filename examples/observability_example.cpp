#include "observability.hpp"
#include "document.hpp"
#include "exception.hpp"
#include <iostream>
#include <sstream>

class ConsoleLogger : public nbtcpp::ILogger {
public:
    bool log(nbtcpp::LogLevel level,
           std::string_view message,
           std::string_view operation,
           std::chrono::microseconds duration,
           size_t byte_count,
           std::string_view key) override {
        std::cout << "[LogLevel::" << static_cast<int>(level) << "] "
                  << message << " | "
                  << "operation: " << operation << " | "
                  << "duration: " << duration.count() << "us | "
                  << "bytes: " << byte_count << " | "
                  << "key: " << key
                  << std::endl;
        return true;
    }
};


class ConsoleMetrics : public nbtcpp::IMetrics {
public:
    bool record_latency(std::string_view operation, double seconds) override {
        std::cout << "Metric: " << operation << " latency: " << seconds << "s" << std::endl;
        return true;
    }
    bool increment_operation_count(std::string_view operation, std::string_view status) override {
        std::cout << "Metric: " << operation << " count: 1, status: " << status << std::endl;
        return true;
    }
    bool record_bytes_read(size_t bytes) override {
        std::cout << "Metric: bytes read: " << bytes << std::endl;
        return true;
    }
    bool record_bytes_written(size_t bytes) override {
        std::cout << "Metric: bytes written: " << bytes << std::endl;
        return true;
    }
    bool record_error(int error_kind) override {
        std::cout << "Metric: error: "
                  << nbtcpp::error_kind_name(static_cast<nbtcpp::ErrorKind>(error_kind)) << std::endl;
        return true;
    }
};

int main() {
    ConsoleLogger logger;
    ConsoleMetrics metrics;
    nbtcpp::set_logger(&logger);
    nbtcpp::set_metrics(&metrics);

    nbtcpp::Document doc("player");
    doc.insert("health", nbtcpp::Value(int8_t{20}));
    doc.insert("name", nbtcpp::Value("Steve"));
    doc.insert("pos", nbtcpp::Value(nbtcpp::List({nbtcpp::Value(1.5), nbtcpp::Value(64.0), nbtcpp::Value(-3.25)})));

    std::cout << "--- Write with default threshold (Info: success records are filtered) ---" << std::endl;
    std::stringstream buffer;
    doc.write(buffer, nbtcpp::Endianness::Big);

    std::cout << "\n--- Setting log level to Debug ---" << std::endl;
    nbtcpp::set_log_level_threshold(nbtcpp::LogLevel::Debug);
    nbtcpp::Document copy = nbtcpp::Document::read(buffer, nbtcpp::Endianness::Big);
    std::cout << copy << std::endl;

    std::cout << "\n--- Reading a document whose root is not a compound ---" << std::endl;
    std::istringstream bad(std::string("\x01\x00\x00\x64", 4));
    try {
        nbtcpp::Document::read(bad, nbtcpp::Endianness::Big);
    } catch (const nbtcpp::exception& e) {
        std::cout << "Caught: " << e.what() << std::endl;
    }

    nbtcpp::set_logger(nullptr);
    nbtcpp::set_metrics(nullptr);
    return 0;
}
