#include "document.hpp"
#include <iostream>
#include <chrono>
#include <sstream>
#include <vector>

nbtcpp::Document make_document(int entries) {
    nbtcpp::Document doc("benchmark");
    for (int i = 0; i < entries; ++i) {
        nbtcpp::Compound entry;
        entry.insert("id", nbtcpp::Value(int32_t{i}));
        entry.insert("name", nbtcpp::Value("value" + std::to_string(i)));
        entry.insert("position", nbtcpp::Value(nbtcpp::List(
            {nbtcpp::Value(double(i)), nbtcpp::Value(64.0), nbtcpp::Value(-double(i))})));
        entry.insert("data", nbtcpp::Value(nbtcpp::IntArray(16, i)));
        doc.insert("key" + std::to_string(i), nbtcpp::Value(std::move(entry)));
    }
    return doc;
}

void benchmark_insert() {
    auto start = std::chrono::high_resolution_clock::now();
    nbtcpp::Document doc = make_document(1000);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_insert: " << diff.count() << " s" << std::endl;
}

void benchmark_lookup() {
    nbtcpp::Document doc = make_document(1000);
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 1000; ++i) {
        doc.get("key" + std::to_string(i));
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_lookup: " << diff.count() << " s" << std::endl;
}

void benchmark_encode(nbtcpp::Endianness endian, const char* label) {
    nbtcpp::Document doc = make_document(1000);
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 100; ++i) {
        std::ostringstream out;
        doc.write(out, endian);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_encode_" << label << ": " << diff.count() << " s" << std::endl;
}

void benchmark_decode(nbtcpp::Endianness endian, const char* label) {
    std::ostringstream out;
    make_document(1000).write(out, endian);
    std::string bytes = out.str();
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 100; ++i) {
        std::istringstream in(bytes);
        nbtcpp::Document doc = nbtcpp::Document::read(in, endian);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_decode_" << label << ": " << diff.count() << " s" << std::endl;
}

void benchmark_gzip_round_trip() {
    nbtcpp::Document doc = make_document(1000);
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < 20; ++i) {
        std::stringstream buffer;
        doc.write_gzip(buffer, nbtcpp::Endianness::Big);
        nbtcpp::Document copy = nbtcpp::Document::read_gzip(buffer, nbtcpp::Endianness::Big);
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_gzip_round_trip: " << diff.count() << " s" << std::endl;
}

int main() {
    try {
        benchmark_insert();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_insert failed: " << e.what() << std::endl;
    }
    try {
        benchmark_lookup();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_lookup failed: " << e.what() << std::endl;
    }
    try {
        benchmark_encode(nbtcpp::Endianness::Big, "big");
        benchmark_encode(nbtcpp::Endianness::Little, "little");
    } catch (const std::exception& e) {
        std::cerr << "benchmark_encode failed: " << e.what() << std::endl;
    }
    try {
        benchmark_decode(nbtcpp::Endianness::Big, "big");
        benchmark_decode(nbtcpp::Endianness::Little, "little");
    } catch (const std::exception& e) {
        std::cerr << "benchmark_decode failed: " << e.what() << std::endl;
    }
    try {
        benchmark_gzip_round_trip();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_gzip_round_trip failed: " << e.what() << std::endl;
    }
    return 0;
}
