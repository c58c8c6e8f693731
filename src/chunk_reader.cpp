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

#include <tierone/stash/chunk_reader.hpp>
#include <tierone/stash/digest.hpp>
#include <tierone/stash/gnu_tar.hpp>
#include <algorithm>

namespace tierone::stash {

auto chunk_reader::from_file(const std::filesystem::path& path) -> std::expected<chunk_reader, error> {
    auto source = file_source::open(path);
    if (!source) {
        return std::unexpected(source.error());
    }
    return chunk_reader{std::make_unique<file_source>(std::move(*source))};
}

auto chunk_reader::from_source(std::unique_ptr<byte_source> source) -> std::expected<chunk_reader, error> {
    if (!source) {
        return std::unexpected(error{error_code::invalid_operation, "Null source provided"});
    }
    return chunk_reader{std::move(source)};
}

auto chunk_reader::read_block() -> std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> {
    if (source_->at_end()) {
        return std::unexpected(error{error_code::end_of_archive, "Chunk ends without a trailer"});
    }
    std::array<std::byte, detail::BLOCK_SIZE> block{};
    if (auto result = source_->read_exact(block); !result) {
        return std::unexpected(result.error());
    }
    return block;
}

auto chunk_reader::skip_padding(const uint64_t data_size) -> std::expected<void, error> {
    return source_->skip(detail::padding_size(data_size));
}

auto chunk_reader::next_entry() -> std::expected<std::optional<located_entry>, error> {
    const uint64_t offset = source_->position();
    gnu::long_names names;

    while (true) {
        auto block = read_block();
        if (!block) {
            return std::unexpected(block.error());
        }

        // The trailer is two zero blocks
        if (detail::is_zero_block(*block)) {
            auto second = read_block();
            if (second && detail::is_zero_block(*second)) {
                return std::nullopt;
            }
            return std::unexpected(error{error_code::corrupt_archive, "Lone zero block in chunk"});
        }

        auto meta = detail::parse_header(*block);
        if (!meta) {
            return std::unexpected(meta.error());
        }

        if (meta->is_gnu_longname() || meta->is_gnu_longlink()) {
            auto text = gnu::read_long_name(*source_, meta->size);
            if (!text) {
                return std::unexpected(text.error());
            }
            (meta->is_gnu_longname() ? names.path : names.link_target) = std::move(*text);
            continue;
        }

        gnu::apply_long_names(*meta, std::move(names));

        // Only regular files carry content in a chunk
        if (!meta->is_regular_file()) {
            meta->size = 0;
        }

        return located_entry{
            .metadata = std::move(*meta),
            .offset = offset,
            .data_offset = source_->position()
        };
    }
}

auto chunk_reader::read_entry_at(const uint64_t offset) -> std::expected<located_entry, error> {
    if (offset % detail::BLOCK_SIZE != 0) {
        return std::unexpected(error{error_code::invalid_operation,
            "Entry offset " + std::to_string(offset) + " is not block aligned"});
    }
    if (auto result = source_->seek(offset); !result) {
        return std::unexpected(result.error());
    }

    auto entry = next_entry();
    if (!entry) {
        return std::unexpected(entry.error());
    }
    if (!*entry) {
        return std::unexpected(error{error_code::end_of_archive,
            "No entry at offset " + std::to_string(offset)});
    }
    return std::move(**entry);
}

auto chunk_reader::read_data(const uint64_t size, const data_sink& sink) -> std::expected<void, error> {
    std::vector<std::byte> buffer(64 * detail::BLOCK_SIZE);

    for (uint64_t remaining = size; remaining > 0;) {
        const auto piece = std::span{buffer}.first(static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size())));
        if (auto result = source_->read_exact(piece); !result) {
            return std::unexpected(result.error());
        }
        if (auto result = sink(piece); !result) {
            return result;
        }
        remaining -= piece.size();
    }

    return skip_padding(size);
}

auto chunk_reader::skip_data(const uint64_t size) -> std::expected<void, error> {
    if (auto result = source_->skip(size); !result) {
        return std::unexpected(error{error_code::corrupt_archive, "Entry data truncated"});
    }
    return skip_padding(size);
}

auto chunk_reader::digest_entry_at(const uint64_t offset) -> std::expected<std::string, error> {
    auto entry = read_entry_at(offset);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    if (!entry->metadata.is_regular_file()) {
        return std::unexpected(error{error_code::invalid_operation,
            "Entry " + entry->metadata.path + " has no content"});
    }

    auto digest = md5_digest::create();
    if (!digest) {
        return std::unexpected(digest.error());
    }

    auto read = read_data(entry->metadata.size, [&digest](std::span<const std::byte> data) {
        return digest->update(data);
    });
    if (!read) {
        return std::unexpected(read.error());
    }

    return digest->finish();
}

auto chunk_reader::list_entries() -> std::expected<std::vector<located_entry>, error> {
    if (auto result = source_->seek(0); !result) {
        return std::unexpected(result.error());
    }

    std::vector<located_entry> entries;
    while (true) {
        auto entry = next_entry();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!*entry) {
            return entries;
        }
        if (auto skipped = skip_data((*entry)->metadata.size); !skipped) {
            return std::unexpected(skipped.error());
        }
        entries.push_back(std::move(**entry));
    }
}

} // namespace tierone::stash
