/*
 * Copyright 2025 TierOne Software
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

/**
 * stash - Archive a directory tree into size-bounded tar chunks with an
 * SQLite index, optionally shipping everything to HPSS.
 *
 * Usage:
 *   stash create <path> --hpss <dest|none> [--exclude p1,p2] [--maxsize GB]
 *                [--keep] [--cache <dir>] [-v]
 *   stash verify [--cache <dir>] [-v]
 */

#include <tierone/stash/stash.hpp>
#include <tierone/stash/log.hpp>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
namespace stash = tierone::stash;

namespace {

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* program) {
    std::println(stderr, "Usage: {} create <path> --hpss <dest|none> [--exclude p1,p2,...]", program);
    std::println(stderr, "           [--maxsize <GB>] [--keep] [--cache <dir>] [-v]");
    std::println(stderr, "       {} verify [--cache <dir>] [-v]", program);
}

struct create_options {
    std::optional<std::string> path;
    std::optional<std::string> hpss;
    std::string exclude;
    double maxsize_gb = 256;
    bool keep = false;
    std::optional<std::string> cache;
    bool verbose = false;
};

// Returns nullopt after printing a message when the arguments are unusable
std::optional<create_options> parse_create(const std::vector<std::string_view>& args) {
    create_options options;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto arg = args[i];
        const auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                std::println(stderr, "Missing value for {}", arg);
                return std::nullopt;
            }
            return std::string{args[++i]};
        };

        if (arg == "--hpss") {
            if (!(options.hpss = value())) return std::nullopt;
        } else if (arg == "--exclude") {
            auto v = value();
            if (!v) return std::nullopt;
            options.exclude = std::move(*v);
        } else if (arg == "--maxsize") {
            auto v = value();
            if (!v) return std::nullopt;
            const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), options.maxsize_gb);
            if (ec != std::errc{} || ptr != v->data() + v->size()) {
                std::println(stderr, "Invalid --maxsize: {}", *v);
                return std::nullopt;
            }
        } else if (arg == "--keep") {
            options.keep = true;
        } else if (arg == "--cache") {
            if (!(options.cache = value())) return std::nullopt;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg.starts_with("-")) {
            std::println(stderr, "Unknown option: {}", arg);
            return std::nullopt;
        } else if (!options.path) {
            options.path = std::string{arg};
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            return std::nullopt;
        }
    }

    if (!options.path) {
        std::println(stderr, "Missing path to archive");
        return std::nullopt;
    }
    if (!options.hpss) {
        std::println(stderr, "--hpss is required (use \"none\" for local archiving)");
        return std::nullopt;
    }
    return options;
}

int run_create(const std::vector<std::string_view>& args) {
    auto options = parse_create(args);
    if (!options) {
        return EXIT_USAGE;
    }
    if (options->verbose) {
        stash::log::set_threshold(stash::log::level::debug);
    }

    auto maxsize = stash::gib_to_bytes(options->maxsize_gb);
    if (!maxsize) {
        stash::log::error("{}", maxsize.error().message());
        return EXIT_USAGE;
    }

    std::error_code ec;
    stash::session_config config;
    config.path = fs::absolute(*options->path, ec).lexically_normal();
    if (ec) {
        stash::log::error("Cannot resolve {}: {}", *options->path, ec.message());
        return EXIT_FATAL;
    }
    if (config.path.has_relative_path() && !config.path.has_filename()) {
        config.path = config.path.parent_path();
    }
    config.hpss = stash::normalize_destination(*options->hpss);
    config.maxsize = *maxsize;
    config.keep = options->keep;
    if (options->cache) {
        config.cache = *options->cache;
    }

    stash::log::debug("Running stash create");
    auto tier = stash::make_remote_tier(config);
    auto report = stash::create_archive(config, *tier, options->exclude);
    if (!report) {
        stash::log::error("{}: {}", stash::to_string(report.error().code()), report.error().message());
        return EXIT_FATAL;
    }

    stash::log::info("Archived {} entries in {} chunk{}", report->records, report->chunks,
                     report->chunks == 1 ? "" : "s");
    return EXIT_SUCCESS;
}

int run_verify(const std::vector<std::string_view>& args) {
    fs::path cache{stash::DEFAULT_CACHE};

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--cache" && i + 1 < args.size()) {
            cache = std::string{args[++i]};
        } else if (args[i] == "-v" || args[i] == "--verbose") {
            stash::log::set_threshold(stash::log::level::debug);
        } else {
            std::println(stderr, "Unexpected argument: {}", args[i]);
            return EXIT_USAGE;
        }
    }

    auto report = stash::verify_archive(cache);
    if (!report) {
        stash::log::error("{}: {}", stash::to_string(report.error().code()), report.error().message());
        return EXIT_FATAL;
    }

    for (const auto& chunk : report->missing_chunks) {
        stash::log::warning("Chunk {} is not in the local cache, its entries were skipped", chunk);
    }
    for (const auto& mismatch : report->mismatches) {
        stash::log::error("{} in {}: {}", mismatch.name, mismatch.tar, mismatch.reason);
    }

    stash::log::info("Verified {} entries, {} skipped, {} without content, {} failed",
                     report->verified, report->skipped, report->without_digest, report->mismatches.size());
    return report->ok() ? EXIT_SUCCESS : EXIT_FATAL;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    const std::string_view command{argv[1]};
    std::vector<std::string_view> args(argv + 2, argv + argc);

    if (command == "create") {
        return run_create(args);
    }
    if (command == "verify") {
        return run_verify(args);
    }

    print_usage(argv[0]);
    return EXIT_USAGE;
}
