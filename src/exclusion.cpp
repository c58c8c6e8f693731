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

#include <tierone/stash/exclusion.hpp>
#include <algorithm>
#include <iterator>
#include <ranges>
#include <utility>

#include <fnmatch.h>

namespace tierone::stash {

exclusion_filter::exclusion_filter(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {
    for (auto& pattern : patterns_) {
        if (!pattern.empty() && pattern.back() == '/') {
            pattern.push_back('*');
        }
    }
    std::erase_if(patterns_, [](const std::string& p) { return p.empty(); });
}

exclusion_filter exclusion_filter::parse(std::string_view csv) {
    std::vector<std::string> patterns;
    for (auto part : csv | std::views::split(',')) {
        patterns.emplace_back(part.begin(), part.end());
    }
    return exclusion_filter{std::move(patterns)};
}

bool exclusion_filter::excluded(const std::string& path) const {
    return std::ranges::any_of(patterns_, [&](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
    });
}

bool exclusion_filter::excluded_directory(const std::string& path) const {
    return excluded(path) || excluded(path + "/");
}

std::vector<std::string> exclusion_filter::apply(const std::vector<std::string>& paths) const {
    if (patterns_.empty()) {
        return paths;
    }

    std::vector<std::string> kept;
    kept.reserve(paths.size());
    std::ranges::copy_if(paths, std::back_inserter(kept),
                         [this](const std::string& path) { return !excluded(path); });
    return kept;
}

} // namespace tierone::stash
