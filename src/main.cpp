/*
 * Copyright 2025 Bastion Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bastion Ruleset Validator - Main Entry Point
#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "validation/validation_engine.hpp"

namespace {

constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

// Set by SIGINT/SIGTERM; running validations observe it through ValidationOptions::cancel
std::atomic<bool> g_cancel_requested{false};

struct CliOptions {
    std::optional<std::string> engine_config_path;
    std::optional<std::string> cache_file;
    bool strict = false;
    bool no_cache = false;
    bool stats = false;
    std::optional<uint64_t> timeout_ms;
    std::vector<std::string> inputs;
};

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s [--engine-config FILE] [--strict] [--no-cache] [--timeout MS]\n"
            "          [--stats] [--cache-file FILE] CONFIG.json...\n",
            program);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fprintf(stderr, "Missing value for %s\n", arg.c_str());
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--engine-config") {
            options.engine_config_path = next();
            if (!options.engine_config_path)
                return std::nullopt;
        } else if (arg == "--cache-file") {
            options.cache_file = next();
            if (!options.cache_file)
                return std::nullopt;
        } else if (arg == "--timeout") {
            auto value = next();
            if (!value)
                return std::nullopt;
            // from_chars rejects signs, whitespace and out-of-range values
            uint64_t timeout = 0;
            const char* first = value->data();
            const char* last = first + value->size();
            auto [ptr, ec] = std::from_chars(first, last, timeout);
            if (value->empty() || ec != std::errc{} || ptr != last) {
                fprintf(stderr, "Invalid --timeout value: %s\n", value->c_str());
                return std::nullopt;
            }
            options.timeout_ms = timeout;
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--no-cache") {
            options.no_cache = true;
        } else if (arg == "--stats") {
            options.stats = true;
        } else if (arg.starts_with("--")) {
            fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            return std::nullopt;
        } else {
            options.inputs.push_back(std::move(arg));
        }
    }

    if (options.inputs.empty()) {
        return std::nullopt;
    }
    return options;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel_requested.store(true, std::memory_order_release);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    bastion::control::EngineConfig engine_config;
    if (cli->engine_config_path) {
        std::string error;
        auto loaded = bastion::control::ConfigLoader::load_from_file(*cli->engine_config_path, error);
        if (!loaded) {
            fprintf(stderr, "Failed to load engine configuration: %s\n", error.c_str());
            return EXIT_USAGE;
        }
        engine_config = std::move(*loaded);
    }

    bastion::logging::init_logging_system();
    bastion::logging::init_logger(engine_config.logging);

    // Read every input before validating anything
    std::vector<nlohmann::json> documents;
    documents.reserve(cli->inputs.size());
    for (const auto& path : cli->inputs) {
        auto text = read_file(path);
        if (!text) {
            fprintf(stderr, "Cannot read %s\n", path.c_str());
            bastion::logging::shutdown_logging();
            return EXIT_USAGE;
        }
        try {
            documents.push_back(nlohmann::json::parse(*text));
        } catch (const nlohmann::json::exception&) {
            // Unparseable input still goes through the engine so it is reported as InvalidSyntax
            documents.push_back(nlohmann::json(*text));
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    bastion::validation::ValidationEngine engine(engine_config);

    if (cli->cache_file) {
        if (auto saved = read_file(*cli->cache_file)) {
            std::string error;
            if (!engine.import_cache(*saved, error)) {
                fprintf(stderr, "Ignoring cache file %s: %s\n", cli->cache_file->c_str(), error.c_str());
            }
        }
    }

    bastion::validation::ValidationOptions options;
    options.strict_mode = cli->strict;
    options.skip_cache = cli->no_cache;
    options.timeout_ms = cli->timeout_ms;
    options.cancel = &g_cancel_requested;

    bool all_valid = true;
    nlohmann::json output;

    if (documents.size() == 1) {
        auto result = engine.validate(documents.front(), options);
        all_valid = result.is_valid;
        output = result;
        if (cli->stats) {
            output = nlohmann::json{{"result", std::move(output)},
                                    {"statistics", engine.get_rule_statistics(documents.front())}};
        }
    } else {
        auto batch = engine.validate_batch("cli", documents, options);
        all_valid = batch.failure_count == 0;
        output = batch;
        if (cli->stats) {
            nlohmann::json statistics = nlohmann::json::array();
            for (const auto& document : documents) {
                statistics.push_back(engine.get_rule_statistics(document));
            }
            output["statistics"] = std::move(statistics);
        }
    }

    printf("%s\n", output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace).c_str());

    if (cli->cache_file) {
        std::ofstream out{*cli->cache_file, std::ios::trunc};
        if (out.is_open()) {
            out << engine.export_cache();
        } else {
            fprintf(stderr, "Cannot write cache file %s\n", cli->cache_file->c_str());
        }
    }

    bastion::logging::shutdown_logging();
    return all_valid ? EXIT_SUCCESS : EXIT_INVALID;
}
