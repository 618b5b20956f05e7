/**
 * @file bench.cpp
 * @brief Performance benchmarks for xdrin decoding.
 *
 * Measures decode throughput on synthetic record streams for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/xdrin_bench              # Run with default 100 iterations
 *   ./build/xdrin_bench 1000         # Run with custom iteration count
 */

#include <xdrin/xdrin.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace xdrin;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t RECORD_COUNT = 10000;

namespace {

// struct Record { unsigned hyper id; string name<32>; float samples<8>; bool valid; };
struct Record {
    std::uint64_t id = 0;
    std::string name;
    std::vector<float> samples;
    bool valid = false;
};

} // namespace

namespace xdrin {

template <> struct XdrIn<Record> {
    static Error read(const std::uint8_t* data, std::size_t size, Record& value,
                      std::size_t& consumed) {
        return read_struct(data, size, value, consumed, [](FieldReader& r, Record& rec) {
            r.field(rec.id).var_string(32, rec.name).var_array(8, rec.samples).field(rec.valid);
        });
    }
};

} // namespace xdrin

static void put_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 24));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

static std::vector<std::uint8_t> make_records(std::size_t count) {
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i < count; ++i) {
        put_u32(out, 0);
        put_u32(out, static_cast<std::uint32_t>(i));

        std::string name = "sensor-" + std::to_string(i % 97);
        put_u32(out, static_cast<std::uint32_t>(name.size()));
        out.insert(out.end(), name.begin(), name.end());
        out.resize(out.size() + padding_size(name.size()), 0);

        std::uint32_t samples = static_cast<std::uint32_t>(i % 9);
        put_u32(out, samples);
        for (std::uint32_t s = 0; s < samples; ++s) {
            put_u32(out, 0x3F800000U); // 1.0f
        }

        put_u32(out, static_cast<std::uint32_t>(i & 1U));
    }
    return out;
}

template <typename T>
static void bench_decode(const char* name, const std::vector<std::uint8_t>& input,
                         int iterations) {
    std::vector<T> values;
    std::size_t consumed = 0;

    // Warmup run
    auto status = decode_sequence(input.data(), input.size(), values, consumed);
    if (status != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(status));
        return;
    }
    std::size_t num_values = values.size();

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        status = decode_sequence(input.data(), input.size(), values, consumed);
        if (status != Error::Ok) {
            std::printf("%-20s FAIL (%s)\n", name, error_string(status));
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_value_ns = per_iter_us * 1000.0 / static_cast<double>(num_values);
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.2f ns/val  %8.1f MB/s  (%zu vals)\n", name,
                per_iter_us, per_value_ns, throughput_mbps, num_values);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("xdrin Benchmarks (v%s)\n", version());
    std::printf("========================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %14s  %12s  %s\n", "Test", "Time", "Per-Value", "Throughput",
                "Values");
    std::printf("%-20s %16s  %14s  %12s  %s\n", "----", "----", "---------", "----------",
                "------");

    std::vector<std::uint8_t> words;
    for (std::size_t i = 0; i < RECORD_COUNT * 4; ++i) {
        put_u32(words, static_cast<std::uint32_t>(i * 2654435761U));
    }
    bench_decode<std::uint32_t>("uint32", words, iterations);
    bench_decode<std::uint64_t>("uint64", words, iterations);
    bench_decode<double>("double", words, iterations);

    bench_decode<Record>("records", make_records(RECORD_COUNT), iterations);

    return 0;
}
