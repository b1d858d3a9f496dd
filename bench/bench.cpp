/**
 * @file bench.cpp
 * @brief Performance benchmarks for NELF encoding and decoding.
 *
 * Measures throughput on synthetic lists for regression testing during
 * development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/nelf_bench          # Run with default 100 iterations
 *   ./build/nelf_bench 1000     # Run with custom iteration count
 */

#include <nelf/nelf.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace nelf;

static constexpr int DEFAULT_ITERATIONS = 100;

/**
 * @brief Build a list of @p count elements of @p length bytes each.
 *
 * Content deliberately contains separator, terminator and digit bytes.
 */
static std::vector<std::string> make_list(std::size_t count, std::size_t length) {
    static constexpr char pattern[] = "ab:c,12 x";
    std::vector<std::string> list;
    list.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::string element;
        element.reserve(length);
        for (std::size_t j = 0; j < length; ++j) {
            element.push_back(pattern[(i + j) % (sizeof(pattern) - 1)]);
        }
        list.push_back(std::move(element));
    }
    return list;
}

static double elapsed_ms(std::chrono::high_resolution_clock::time_point start,
                         std::chrono::high_resolution_clock::time_point end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

static void bench_case(const char* name, std::size_t count, std::size_t length, int iterations) {
    auto list = make_list(count, length);

    std::vector<std::uint8_t> encoded;
    encoded.reserve(encoded_size(list));
    ParseError error;

    // Warmup run
    if (encode(list, encoded, error) != Error::Ok) {
        std::printf("%-20s FAIL (encode: %s)\n", name, error.message());
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        encoded.clear();
        if (encode(list, encoded, error) != Error::Ok) {
            std::printf("%-20s FAIL (encode: %s)\n", name, error.message());
            return;
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    double encode_ms = elapsed_ms(start, end);

    DecodedList decoded;
    decoded.reserve(count);

    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        decoded.clear();
        if (decode(encoded.data(), encoded.size(), decoded, error) != Error::Ok) {
            std::printf("%-20s FAIL (decode: %s at %zu)\n", name, error.message(), error.offset);
            return;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    double decode_ms = elapsed_ms(start, end);

    double mb = static_cast<double>(encoded.size()) * iterations / (1024.0 * 1024.0);
    std::printf("%-20s %8zu B  encode %8.1f MB/s  decode %8.1f MB/s\n", name, encoded.size(),
                mb / (encode_ms / 1000.0), mb / (decode_ms / 1000.0));
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("NELF C++ Benchmark (%s)\n", version());
    std::printf("Iterations: %d\n\n", iterations);

    bench_case("tiny x 100000", 100000, 1, iterations);
    bench_case("short x 10000", 10000, 32, iterations);
    bench_case("medium x 1000", 1000, 1024, iterations);
    bench_case("large x 10", 10, 1024 * 1024, iterations);

    return 0;
}
