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

#include <string>
#include <string_view>
#include <vector>

namespace tierone::stash {

// Set of glob patterns matched against archive-relative paths with fnmatch(3).
// '*' also matches '/', and a pattern ending in '/' covers the whole subtree.
class exclusion_filter {
private:
    std::vector<std::string> patterns_;

public:
    exclusion_filter() = default;
    explicit exclusion_filter(std::vector<std::string> patterns);

    // Build from a comma separated list; empty items are ignored
    [[nodiscard]] static exclusion_filter parse(std::string_view csv);

    [[nodiscard]] bool excluded(const std::string& path) const;

    // True if path names a directory whose subtree is excluded, either by a
    // pattern matching the directory itself or by one ending in '/'
    [[nodiscard]] bool excluded_directory(const std::string& path) const;

    // Paths that match no pattern, in their original order
    [[nodiscard]] std::vector<std::string> apply(const std::vector<std::string>& paths) const;

    [[nodiscard]] const std::vector<std::string>& patterns() const noexcept { return patterns_; }
    [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
};

} // namespace tierone::stash
