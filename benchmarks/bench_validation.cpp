// Bastion Validation Benchmark
// Measures cold, cached and serial validation latency across rule-set sizes

#include "../src/validation/validation_engine.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace bastion::validation;

// Benchmark helper
template<typename Func>
double benchmark(Func&& func, size_t iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    return static_cast<double>(duration.count()) / 1000.0 / iterations;
}

// Disjoint deny/allow rule sets with a mix of globs and literals
nlohmann::json generate_config(size_t rule_count, std::mt19937& rng) {
    static const char* extensions[] = {"js", "ts", "py", "sh", "log", "tmp"};
    std::uniform_int_distribution<size_t> ext(0, 5);

    std::vector<std::string> deny;
    std::vector<std::string> allow;
    for (size_t i = 0; i < rule_count; i++) {
        if (i % 2 == 0) {
            deny.push_back("/deny/" + std::to_string(i) + "/*." + extensions[ext(rng)]);
        } else if (i % 3 == 0) {
            allow.push_back("/allow/" + std::to_string(i) + "/file");
        } else {
            allow.push_back("/allow/" + std::to_string(i) + "/*");
        }
    }
    return make_config(deny, allow);
}

void benchmark_rule_counts() {
    std::cout << "\n=== Validation Latency ===\n";
    std::mt19937 rng(42);

    std::vector<size_t> sizes = {10, 100, 1000};

    std::cout << std::setw(10) << "Rules"
              << std::setw(15) << "Cold (ms)"
              << std::setw(15) << "Cached (ms)"
              << std::setw(15) << "Serial (ms)"
              << std::setw(12) << "Target" << "\n";
    std::cout << std::string(67, '-') << "\n";

    for (size_t size : sizes) {
        auto config = generate_config(size, rng);
        const size_t iterations = size >= 1000 ? 3 : 20;

        ValidationEngine engine;

        ValidationOptions uncached;
        uncached.skip_cache = true;
        ValidationResult last;

        double cold_time = benchmark([&]() {
            last = engine.validate(config, uncached);
        }, iterations);

        (void)engine.validate(config);
        double cached_time = benchmark([&]() {
            volatile bool hit = engine.validate(config).performance.cache_hit;
            (void)hit;
        }, iterations * 10);

        ValidationOptions serial = uncached;
        serial.parallel = false;
        double serial_time = benchmark([&]() {
            (void)engine.validate(config, serial);
        }, iterations);

        std::cout << std::setw(10) << size
                  << std::setw(15) << std::fixed << std::setprecision(3) << cold_time
                  << std::setw(15) << std::fixed << std::setprecision(3) << cached_time
                  << std::setw(15) << std::fixed << std::setprecision(3) << serial_time
                  << std::setw(12) << (last.performance.achieved ? "met" : "missed") << "\n";
    }
}

void benchmark_batch() {
    std::cout << "\n=== Batch Validation ===\n";
    std::mt19937 rng(7);

    std::vector<nlohmann::json> configs;
    for (size_t i = 0; i < 32; i++) {
        configs.push_back(generate_config(50, rng));
    }

    ValidationEngine engine;
    ValidationOptions options;
    options.skip_cache = true;

    BatchResult batch = engine.validate_batch("bench", configs, options);
    std::cout << "  Configs: " << batch.results.size() << "\n";
    std::cout << "  Total:   " << std::fixed << std::setprecision(2) << batch.total_ms << " ms\n";
    std::cout << "  Valid:   " << batch.success_count << "\n";
}

int main() {
    std::cout << "Bastion Validation Performance Benchmark\n";
    std::cout << "========================================\n";

    benchmark_rule_counts();
    benchmark_batch();

    std::cout << "\n";
    return 0;
}
