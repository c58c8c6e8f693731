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
#include <tierone/stash/metadata.hpp>
#include <tierone/stash/stream.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace tierone::stash::gnu {

// Name GNU tar gives to the records carrying long names and link targets
constexpr std::string_view LONGLINK_NAME = "././@LongLink";

// Header magic and version written by GNU tar
constexpr std::string_view MAGIC{"ustar ", 6};
constexpr std::string_view VERSION{" \0", 2};

// Upper bound on an 'L' or 'K' payload
constexpr uint64_t MAX_LONG_NAME = 64 * 1024;

// Long name and link target announced ahead of the next real header
struct long_names {
    std::optional<std::string> path;
    std::optional<std::string> link_target;
};

// Read an 'L'/'K' payload of size bytes and the padding after it.
// The returned text stops at the first NUL.
[[nodiscard]] std::expected<std::string, error> read_long_name(byte_source& source, uint64_t size);

// Replace the truncated header fields of meta with the long forms
void apply_long_names(file_metadata& meta, long_names names);

[[nodiscard]] bool has_gnu_magic(const gnu_header& header) noexcept;

} // namespace tierone::stash::gnu
