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

#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace tierone::stash {

// Width of the hexadecimal ordinal in chunk file names
constexpr int CHUNK_NAME_DIGITS = 6;

constexpr const char* CHUNK_EXTENSION = ".tar";

// "00002a.tar" for ordinal 42
[[nodiscard]] inline std::string chunk_name(const uint64_t ordinal) {
    return std::format("{:0{}x}{}", ordinal, CHUNK_NAME_DIGITS, CHUNK_EXTENSION);
}

// Decide whether the open chunk closes after the entry just appended.
// next_size is the pre-measured size of the following entry, or nullopt when
// the entry just appended was the last one. A chunk closes once taking the
// next entry would push it over max_size, so a single oversized entry still
// gets a chunk of its own and is never split.
[[nodiscard]] constexpr bool should_close_chunk(
    const uint64_t accumulated_size,
    const std::optional<uint64_t> next_size,
    const uint64_t max_size
) noexcept {
    if (!next_size) {
        return true;
    }
    return accumulated_size + *next_size > max_size;
}

} // namespace tierone::stash
