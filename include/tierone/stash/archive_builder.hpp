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

#include <tierone/stash/chunk_writer.hpp>
#include <tierone/stash/config.hpp>
#include <tierone/stash/error.hpp>
#include <tierone/stash/failure_tracker.hpp>
#include <tierone/stash/index_store.hpp>
#include <tierone/stash/remote_tier.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace tierone::stash {

// Live state of one archiving session, owned by the caller and shared by
// reference with everything that works on the session
struct archive_session {
    const session_config& config;
    index_store& index;
    remote_tier& tier;
    failure_tracker& failures;
};

struct build_summary {
    size_t chunks = 0;          // Chunks closed, transferred and indexed
    size_t records = 0;         // Records committed to the index
    uint64_t next_ordinal = 0;  // Ordinal the next chunk would take
};

// Per-entry outcome: the appended metadata or the reason it was skipped
using entry_result = std::expected<appended_entry, error>;

// Streams entries into size-bounded chunks. A chunk's records are committed
// to the index in one transaction, and only after the chunk has been
// finalized and transferred.
class archive_builder {
private:
    archive_session& session_;
    size_t block_size_;

    [[nodiscard]] std::expected<void, error> close_chunk(
        chunk_writer& writer, std::vector<file_record>& pending, build_summary& summary);

public:
    explicit archive_builder(archive_session& session, size_t block_size = DEFAULT_COPY_BLOCK_SIZE)
        : session_(session), block_size_(block_size) {}

    // Archive files (paths relative to the session's source root) in order,
    // numbering chunks from first_ordinal. Unreadable entries are recorded in
    // the session's failure tracker; transfer and index faults abort.
    [[nodiscard]] std::expected<build_summary, error> add_files(
        const std::vector<std::string>& files,
        uint64_t first_ordinal = 0
    );
};

// Size used for chunk boundary decisions: the file size of regular files,
// 0 for everything else and for entries that cannot be stat'ed
[[nodiscard]] uint64_t measure_entry(const std::filesystem::path& path);

// Index row for an entry appended to the chunk named tar
[[nodiscard]] file_record make_record(const appended_entry& entry, const std::string& tar);

} // namespace tierone::stash
