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

#pragma once

#include <tierone/stash/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tierone::stash {

// Default size bound of a chunk: 256 GiB
constexpr uint64_t DEFAULT_MAX_CHUNK_SIZE = uint64_t{256} * 1024 * 1024 * 1024;

// Default name of the local staging directory, relative to the source root
constexpr std::string_view DEFAULT_CACHE = "stash";

// Index file name inside the staging directory
constexpr std::string_view INDEX_FILENAME = "index.db";

// Remote destination that disables the remote tier
constexpr std::string_view NO_REMOTE = "none";

// Settings of one archiving session. Snapshotted into the index when the
// session starts and never changed afterwards.
struct session_config {
    std::filesystem::path path;               // Source root, absolute
    std::string hpss{NO_REMOTE};              // Remote destination or "none"
    uint64_t maxsize = DEFAULT_MAX_CHUNK_SIZE;
    bool keep = false;                        // Keep local chunk copies after transfer
    std::filesystem::path cache{DEFAULT_CACHE};

    [[nodiscard]] bool remote_enabled() const noexcept { return hpss != NO_REMOTE; }

    // Staging directory, resolved against the source root when relative
    [[nodiscard]] std::filesystem::path cache_dir() const {
        return cache.is_absolute() ? cache : path / cache;
    }

    [[nodiscard]] std::filesystem::path index_path() const {
        return cache_dir() / INDEX_FILENAME;
    }

    // key/value rows persisted in the index's config table
    [[nodiscard]] std::map<std::string, std::string> to_entries() const;
    [[nodiscard]] static std::expected<session_config, error> from_entries(
        const std::map<std::string, std::string>& entries);
};

// Convert a size given in (possibly fractional) GiB into bytes
[[nodiscard]] std::expected<uint64_t, error> gib_to_bytes(double gib);

// "none" is accepted in any letter case
[[nodiscard]] std::string normalize_destination(std::string_view hpss);

} // namespace tierone::stash
