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
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace tierone::stash {

struct verify_mismatch {
    std::string name;
    std::string tar;
    std::string reason;
};

struct verify_report {
    size_t verified = 0;          // Records whose digest matched
    size_t without_digest = 0;    // Directories, links and special files
    size_t skipped = 0;           // Records whose chunk is not in the cache
    std::vector<std::string> missing_chunks;
    std::vector<verify_mismatch> mismatches;

    [[nodiscard]] bool ok() const noexcept { return mismatches.empty(); }
};

// Re-read every digest-bearing record of the index in cache_dir at its
// (chunk, offset) and compare the recomputed MD5 against the stored one.
// Chunks that were removed from the cache after transfer are skipped.
[[nodiscard]] std::expected<verify_report, error> verify_archive(const std::filesystem::path& cache_dir);

} // namespace tierone::stash
