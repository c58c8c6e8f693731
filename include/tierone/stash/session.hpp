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

#include <tierone/stash/config.hpp>
#include <tierone/stash/error.hpp>
#include <tierone/stash/failure_tracker.hpp>
#include <tierone/stash/remote_tier.hpp>
#include <expected>
#include <string>
#include <vector>

namespace tierone::stash {

struct session_report {
    size_t chunks = 0;
    size_t records = 0;
    std::vector<entry_failure> failures;

    // True when some entries could not be archived; the run itself completed
    [[nodiscard]] bool has_failures() const noexcept { return !failures.empty(); }
};

// Archive config.path into a new set of chunks and a fresh index.
//
// Setup faults (source is not a directory, the remote destination cannot be
// prepared, the cache or index cannot be created) abort before any chunk is
// written. Transfer and index faults abort the run; chunks committed before
// the fault remain valid and indexed. Per-entry faults end up in the report.
[[nodiscard]] std::expected<session_report, error> create_archive(
    const session_config& config,
    remote_tier& tier,
    const std::string& exclude = {}
);

} // namespace tierone::stash
