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

#include <tierone/stash/session.hpp>
#include <tierone/stash/archive_builder.hpp>
#include <tierone/stash/enumerator.hpp>
#include <tierone/stash/exclusion.hpp>
#include <tierone/stash/index_store.hpp>
#include <tierone/stash/log.hpp>

namespace tierone::stash {

namespace fs = std::filesystem;

auto create_archive(
    const session_config& config,
    remote_tier& tier,
    const std::string& exclude
) -> std::expected<session_report, error> {
    log::debug("Local path : {}", config.path.string());
    log::debug("HPSS path  : {}", config.hpss);
    log::debug("Max size   : {}", config.maxsize);
    log::debug("Keep local tar files : {}", config.keep);

    std::error_code ec;
    if (!config.path.is_absolute() || !fs::is_directory(config.path, ec)) {
        return std::unexpected(error{error_code::setup_error,
            "Input path should be a directory: " + config.path.string()});
    }
    if (config.maxsize == 0) {
        return std::unexpected(error{error_code::setup_error, "Maximum chunk size must be positive"});
    }

    if (config.remote_enabled()) {
        log::debug("Making sure target HPSS directory exists and is empty");
    }
    if (auto prepared = tier.prepare(); !prepared) {
        return std::unexpected(error{error_code::setup_error, prepared.error().message()});
    }

    const fs::path cache_dir = config.cache_dir();
    log::debug("Creating local cache directory {}", cache_dir.string());
    fs::create_directories(cache_dir, ec);
    if (ec) {
        return std::unexpected(error{error_code::setup_error,
            "Cannot create local cache directory " + cache_dir.string() + ": " + ec.message()});
    }

    log::debug("Creating index database");
    auto index = index_store::create(config.index_path());
    if (!index) {
        return std::unexpected(error{error_code::setup_error, index.error().message()});
    }
    if (auto stored = index->write_config(config); !stored) {
        return std::unexpected(error{error_code::setup_error, stored.error().message()});
    }

    log::info("Gathering list of files to archive");
    auto listing = enumerate_files(config.path, cache_dir);
    if (!listing) {
        return std::unexpected(error{error_code::setup_error, listing.error().message()});
    }

    const auto filter = exclusion_filter::parse(exclude);

    failure_tracker failures;
    for (const auto& unreadable : listing->errors) {
        if (!filter.excluded_directory(unreadable.path)) {
            failures.record(unreadable.path, unreadable.reason);
        }
    }

    const auto files = filter.apply(listing->entries);
    log::debug("{} entries to archive", files.size());

    archive_session session{config, *index, tier, failures};
    archive_builder builder{session};
    auto built = builder.add_files(files);
    if (!built) {
        return std::unexpected(built.error());
    }

    if (auto closed = index->close(); !closed) {
        return std::unexpected(closed.error());
    }

    // The index is small; its local copy is always kept
    if (auto sent = tier.put(config.index_path(), true); !sent) {
        return std::unexpected(error{error_code::transfer_error,
            "Transfer of the index failed: " + sent.error().message()});
    }

    failures.log_summary();

    return session_report{
        .chunks = built->chunks,
        .records = built->records,
        .failures = failures.failures()
    };
}

} // namespace tierone::stash
