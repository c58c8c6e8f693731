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
#include <tierone/stash/header_parser.hpp>
#include <tierone/stash/metadata.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

namespace tierone::stash::detail {

using header_block = std::array<std::byte, BLOCK_SIZE>;

// Store value as zero-padded octal followed by NUL. Values that do not fit
// in field.size() - 1 octal digits use the GNU base-256 encoding.
void encode_numeric(std::span<char> field, uint64_t value) noexcept;

// Copy text into a fixed-size field, truncating if necessary
void encode_string(std::span<char> field, std::string_view text) noexcept;

// Fill in the checksum field of a fully populated header block
void write_checksum(header_block& block) noexcept;

// Encode the GNU format header(s) for one entry. Names or link targets that
// do not fit in the ustar fields are preceded by a GNU 'L' or 'K' entry, so
// the result is always a whole number of blocks.
[[nodiscard]] std::expected<std::vector<std::byte>, error> encode_header(const file_metadata& meta);

} // namespace tierone::stash::detail
