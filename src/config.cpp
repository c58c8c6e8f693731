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

#include <tierone/stash/config.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace tierone::stash {

std::map<std::string, std::string> session_config::to_entries() const {
    return {
        {"path", path.string()},
        {"hpss", hpss},
        {"maxsize", std::to_string(maxsize)},
        {"keep", keep ? "1" : "0"}
    };
}

auto session_config::from_entries(const std::map<std::string, std::string>& entries)
    -> std::expected<session_config, error> {
    session_config cfg;

    const auto get = [&](const std::string& key) -> const std::string* {
        auto it = entries.find(key);
        return it != entries.end() ? &it->second : nullptr;
    };

    const auto* path = get("path");
    const auto* hpss = get("hpss");
    const auto* maxsize = get("maxsize");
    if (!path || !hpss || !maxsize) {
        return std::unexpected(error{error_code::index_error, "Index config is incomplete"});
    }

    cfg.path = *path;
    cfg.hpss = *hpss;

    const auto [ptr, ec] = std::from_chars(maxsize->data(), maxsize->data() + maxsize->size(), cfg.maxsize);
    if (ec != std::errc{} || ptr != maxsize->data() + maxsize->size()) {
        return std::unexpected(error{error_code::index_error, "Invalid maxsize in index config: " + *maxsize});
    }

    if (const auto* keep = get("keep")) {
        cfg.keep = *keep == "1" || *keep == "True" || *keep == "true";
    }

    return cfg;
}

auto gib_to_bytes(const double gib) -> std::expected<uint64_t, error> {
    if (!std::isfinite(gib) || gib <= 0) {
        return std::unexpected(error{error_code::setup_error, "Maximum chunk size must be positive"});
    }

    const double bytes = std::floor(gib * 1024.0 * 1024.0 * 1024.0);
    if (bytes < 1 || bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::unexpected(error{error_code::setup_error, "Maximum chunk size out of range"});
    }
    return static_cast<uint64_t>(bytes);
}

std::string normalize_destination(std::string_view hpss) {
    std::string lowered{hpss};
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == NO_REMOTE) {
        return std::string{NO_REMOTE};
    }
    return std::string{hpss};
}

} // namespace tierone::stash
