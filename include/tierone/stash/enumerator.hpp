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
#include <optional>
#include <string>
#include <vector>

namespace tierone::stash {

// A directory the walk could not descend into
struct enumeration_error {
    std::string path;
    std::string reason;
};

struct enumeration {
    // Root-relative, normalised paths in archive order
    std::vector<std::string> entries;
    std::vector<enumeration_error> errors;
};

// Walk root recursively and list what to archive. Empty directories are
// listed as themselves, other directories contribute their non-directory
// children. Entries are ordered by (directory, file name). exclude_dir and
// everything beneath it are skipped. Fails only if root itself cannot be read.
[[nodiscard]] std::expected<enumeration, error> enumerate_files(
    const std::filesystem::path& root,
    const std::optional<std::filesystem::path>& exclude_dir = std::nullopt
);

} // namespace tierone::stash
