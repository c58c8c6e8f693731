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
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace tierone::stash {

// Unit of source reads, digest updates and chunk writes
constexpr size_t DEFAULT_COPY_BLOCK_SIZE = 1024 * 1024;

// What one successful append recorded about an entry
struct appended_entry {
    std::string name;
    uint64_t offset = 0;       // Start of the entry's first header block in the chunk
    uint64_t size = 0;         // Content bytes stored (0 for non-regular entries)
    std::chrono::system_clock::time_point modification_time;
    std::optional<std::string> md5;   // Hex digest of the stored content, regular files only
};

// Writes one chunk: a GNU tar stream built from filesystem entries.
//
// The writer tracks the logical end of the stream and the pre-archive size of
// what it holds (the sum of the measured source sizes, which ignores header
// and padding overhead). A failed append truncates the chunk back to where the
// entry started, so the chunk stays valid and open for the next entry.
class chunk_writer {
private:
    file_sink out_;
    std::string name_;
    size_t block_size_;
    uint64_t accumulated_size_ = 0;
    size_t entry_count_ = 0;
    bool finalized_ = false;
    bool usable_ = true;

    // (device, inode)
    using inode_key = std::pair<uint64_t, uint64_t>;

    // First archived name of each multiply-linked inode in this chunk
    std::map<inode_key, std::string> hard_links_;
    std::map<uint32_t, std::string> user_names_;
    std::map<uint32_t, std::string> group_names_;

    chunk_writer(file_sink out, std::string name, size_t block_size);

    // lstat source into header metadata. link_key is set for regular files
    // with more than one link that are not yet in this chunk.
    [[nodiscard]] std::expected<file_metadata, error> describe(
        const std::filesystem::path& source, const std::string& name,
        std::optional<inode_key>& link_key);
    [[nodiscard]] std::expected<std::optional<std::string>, error> write_entry(
        const file_metadata& meta, const std::filesystem::path& source);
    [[nodiscard]] std::expected<void, error> write_zeros(size_t count);

public:
    // Create <directory>/<chunk_name(ordinal)>, replacing any stale file
    [[nodiscard]] static std::expected<chunk_writer, error> create(
        const std::filesystem::path& directory,
        uint64_t ordinal,
        size_t block_size = DEFAULT_COPY_BLOCK_SIZE
    );

    // Append source under the archive name name. measured_size is the size
    // the caller used for its boundary decisions; it is added to the
    // accumulated size only when the append succeeds.
    [[nodiscard]] std::expected<appended_entry, error> append(
        const std::filesystem::path& source,
        const std::string& name,
        uint64_t measured_size
    );

    // Write the end-of-archive blocks, pad to a whole record and sync to disk
    [[nodiscard]] std::expected<void, error> finalize();

    [[nodiscard]] uint64_t logical_offset() const noexcept { return out_.position(); }
    [[nodiscard]] uint64_t accumulated_size() const noexcept { return accumulated_size_; }
    [[nodiscard]] size_t entry_count() const noexcept { return entry_count_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return out_.path(); }
    [[nodiscard]] bool finalized() const noexcept { return finalized_; }

    // False once a failed append could not be rolled back; the chunk
    // contents are then undefined and it must not be finalized or shipped.
    [[nodiscard]] bool usable() const noexcept { return usable_; }
};

} // namespace tierone::stash
