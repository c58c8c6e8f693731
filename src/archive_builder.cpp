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

#include <tierone/stash/archive_builder.hpp>
#include <tierone/stash/chunk_boundary.hpp>
#include <tierone/stash/log.hpp>
#include <optional>

namespace tierone::stash {

namespace fs = std::filesystem;

uint64_t measure_entry(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return 0;
    }
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

file_record make_record(const appended_entry& entry, const std::string& tar) {
    file_record record;
    record.name = entry.name;
    record.size = entry.size;
    record.mtime = format_index_time(entry.modification_time);
    record.md5 = entry.md5;
    record.tar = tar;
    record.offset = entry.offset;
    return record;
}

auto archive_builder::close_chunk(
    chunk_writer& writer,
    std::vector<file_record>& pending,
    build_summary& summary
) -> std::expected<void, error> {
    log::debug("Closing tar archive {}", writer.name());
    if (auto result = writer.finalize(); !result) {
        return std::unexpected(error{result.error().code(),
            "Cannot finalize " + writer.name() + ": " + result.error().message()});
    }

    if (auto result = session_.tier.put(writer.path(), session_.config.keep); !result) {
        return std::unexpected(error{error_code::transfer_error,
            "Transfer of " + writer.name() + " failed: " + result.error().message()});
    }

    if (auto result = session_.index.commit_records(pending); !result) {
        return std::unexpected(error{error_code::index_error,
            "Cannot index " + writer.name() + ": " + result.error().message()});
    }

    log::debug("Indexed {} entries of {}", pending.size(), writer.name());
    ++summary.chunks;
    summary.records += pending.size();
    pending.clear();
    return {};
}

auto archive_builder::add_files(
    const std::vector<std::string>& files,
    const uint64_t first_ordinal
) -> std::expected<build_summary, error> {
    const fs::path& root = session_.config.path;
    const fs::path cache_dir = session_.config.cache_dir();

    std::vector<uint64_t> sizes;
    sizes.reserve(files.size());
    for (const auto& file : files) {
        sizes.push_back(measure_entry(root / file));
    }

    build_summary summary;
    summary.next_ordinal = first_ordinal;

    std::optional<chunk_writer> writer;
    std::vector<file_record> pending;

    for (size_t i = 0; i < files.size(); ++i) {
        if (!writer) {
            auto created = chunk_writer::create(cache_dir, summary.next_ordinal, block_size_);
            if (!created) {
                return std::unexpected(created.error());
            }
            writer.emplace(std::move(*created));
            ++summary.next_ordinal;
            log::info("Creating new tar archive {}", writer->name());
        }

        const std::string& name = files[i];
        log::info("Archiving {}", name);

        entry_result result = writer->append(root / name, name, sizes[i]);
        if (result) {
            pending.push_back(make_record(*result, writer->name()));
        } else {
            if (!writer->usable()) {
                return std::unexpected(result.error());
            }
            log::error("Archiving {}: {}", name, result.error().message());
            session_.failures.record(name, result.error().message());
        }

        const auto next_size = i + 1 < files.size() ? std::optional<uint64_t>{sizes[i + 1]} : std::nullopt;
        if (should_close_chunk(writer->accumulated_size(), next_size, session_.config.maxsize)) {
            if (auto closed = close_chunk(*writer, pending, summary); !closed) {
                return std::unexpected(closed.error());
            }
            writer.reset();
        }
    }

    return summary;
}

} // namespace tierone::stash
