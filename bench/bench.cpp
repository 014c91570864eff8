/**
 * @file bench.cpp
 * @brief Performance benchmarks for unravel decode runs.
 *
 * Measures end-to-end Controller::decode time on fixed layered inputs,
 * for regression testing during development.
 *
 * Usage:
 *   ./build/unravel-bench          # Run with default 1000 iterations
 *   ./build/unravel-bench 5000     # Run with custom iteration count
 */

#include <unravel/unravel.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace unravel;

static constexpr int DEFAULT_ITERATIONS = 1000;

static std::string rot13(const std::string& text) {
    return decode_rot13(text).text;
}

static void bench_decode(const char* name, const std::string& input, int iterations) {
    Controller controller;

    // Warmup run
    RunResult warmup = controller.decode(input);

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        RunResult result = controller.decode(input);
        if (result.iterations != warmup.iterations) {
            std::printf("%-24s FAIL (non-deterministic run)\n", name);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_run_us = total_us / static_cast<double>(iterations);
    double per_step_us = per_run_us / static_cast<double>(warmup.iterations > 0 ? warmup.iterations : 1);

    std::printf("%-24s %10.2f us/run  %8.2f us/step  %5zu bytes  %-16s (%zu steps)\n",
                name, per_run_us, per_step_us, input.size(), session_status_name(warmup.status),
                warmup.iterations);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("unravel Benchmarks (C++ Implementation)\n");
    std::printf("=======================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-24s %17s  %15s  %11s  %-16s %s\n",
                "Test", "Time", "Per-Step", "Input", "Status", "Steps");
    std::printf("%-24s %17s  %15s  %11s  %-16s %s\n",
                "----", "----", "--------", "-----", "------", "-----");

    const std::string flag = "flag{complex_encoding}";
    const std::string prose =
        "The quick brown fox jumps over the lazy dog while the decoder peels layers.";

    std::string long_prose;
    for (int i = 0; i < 64; ++i) {
        long_prose += prose;
        long_prose += ' ';
    }

    bench_decode("base64", encode_base64(prose), iterations);
    bench_decode("base64+hex", encode_base64(encode_hex(flag)), iterations);
    bench_decode("base64+hex+rot13", encode_base64(encode_hex(rot13(flag))), iterations);
    bench_decode("url", "flag%7Bhello%20world%7D", iterations);
    bench_decode("base64 (4.8 KB)", encode_base64(long_prose), iterations);
    bench_decode("undecodable", "!@#$^&*()_-[]<>?~", iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
