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

#include <tierone/stash/failure_tracker.hpp>
#include <tierone/stash/log.hpp>

namespace tierone::stash {

void failure_tracker::log_summary() const {
    if (failures_.empty()) {
        return;
    }

    log::warning("Completed with {} failure{}; some files could not be archived",
                 failures_.size(), failures_.size() == 1 ? "" : "s");
    for (const auto& failure : failures_) {
        log::error("Archiving {}: {}", failure.path, failure.reason);
    }
}

} // namespace tierone::stash
