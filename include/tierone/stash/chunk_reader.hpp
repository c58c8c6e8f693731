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
#include <tierone/stash/stream.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tierone::stash {

// An entry found in a chunk
struct located_entry {
    file_metadata metadata;
    uint64_t offset = 0;        // First header block, including GNU extension blocks
    uint64_t data_offset = 0;   // First content byte
};

// Receives entry content in order, one block at a time
using data_sink = std::function<std::expected<void, error>(std::span<const std::byte>)>;

// Random-access reader over a finished chunk. Entries are addressed by the
// offsets the index records, so no scan from the start of the chunk is needed.
class chunk_reader {
private:
    std::unique_ptr<byte_source> source_;

    // Read one block; end_of_archive if the chunk ends first
    [[nodiscard]] std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> read_block();

    // Skip the zero fill after data_size content bytes
    [[nodiscard]] std::expected<void, error> skip_padding(uint64_t data_size);

public:
    explicit chunk_reader(std::unique_ptr<byte_source> source)
        : source_(std::move(source)) {}

    [[nodiscard]] static std::expected<chunk_reader, error> from_file(const std::filesystem::path& path);
    [[nodiscard]] static std::expected<chunk_reader, error> from_source(std::unique_ptr<byte_source> source);

    // Parse the entry whose headers start at the current position. Returns
    // nullopt at the end-of-archive marker. The source is left at the
    // entry's first content byte.
    [[nodiscard]] std::expected<std::optional<located_entry>, error> next_entry();

    // Seek to offset and parse the entry that starts there
    [[nodiscard]] std::expected<located_entry, error> read_entry_at(uint64_t offset);

    // Pass size content bytes to sink, then skip the padding after them
    [[nodiscard]] std::expected<void, error> read_data(uint64_t size, const data_sink& sink);

    // Skip size content bytes and their padding
    [[nodiscard]] std::expected<void, error> skip_data(uint64_t size);

    // MD5 of the content of the entry at offset
    [[nodiscard]] std::expected<std::string, error> digest_entry_at(uint64_t offset);

    // Every entry from the start of the chunk to the end-of-archive marker
    [[nodiscard]] std::expected<std::vector<located_entry>, error> list_entries();
};

} // namespace tierone::stash
