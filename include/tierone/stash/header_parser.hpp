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
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace tierone::stash::detail {

constexpr size_t BLOCK_SIZE = 512;

// Chunks are padded to a whole number of 20-block records
constexpr size_t RECORD_SIZE = 20 * BLOCK_SIZE;

// Bytes of zero padding that follow size bytes of entry data
[[nodiscard]] constexpr size_t padding_size(const uint64_t size) noexcept {
    return static_cast<size_t>((BLOCK_SIZE - (size % BLOCK_SIZE)) % BLOCK_SIZE);
}

// Decode a numeric header field: octal text, or GNU base-256 when the
// high bit of the first byte is set
[[nodiscard]] std::expected<uint64_t, error> parse_numeric(std::span<const char> field);

// Unsigned byte sum of the block with the checksum field read as spaces
[[nodiscard]] uint32_t header_checksum(std::span<const std::byte, BLOCK_SIZE> block) noexcept;

// Decode one header block. GNU 'L'/'K' records come back as entries of
// their own type; the caller reads their payload.
[[nodiscard]] std::expected<file_metadata, error> parse_header(std::span<const std::byte, BLOCK_SIZE> block);

[[nodiscard]] bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block) noexcept;

// Text of a fixed-size field up to its first NUL
[[nodiscard]] std::string_view field_text(std::span<const char> field) noexcept;

// Drop the trailing '/' that marks directory names in the archive
void strip_directory_slash(std::string& path) noexcept;

} // namespace tierone::stash::detail
