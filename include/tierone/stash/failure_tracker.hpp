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

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace tierone::stash {

struct entry_failure {
    std::string path;
    std::string reason;
};

// Entries that could not be archived during a session. A non-empty tracker
// at the end of a run is a soft failure: everything else was archived.
class failure_tracker {
private:
    std::vector<entry_failure> failures_;

public:
    void record(std::string path, std::string reason) {
        failures_.push_back({std::move(path), std::move(reason)});
    }

    [[nodiscard]] const std::vector<entry_failure>& failures() const noexcept { return failures_; }
    [[nodiscard]] size_t size() const noexcept { return failures_.size(); }
    [[nodiscard]] bool empty() const noexcept { return failures_.empty(); }

    // Warning line with the count, then one error line per failed path
    void log_summary() const;
};

} // namespace tierone::stash
