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

#include <tierone/stash/verifier.hpp>
#include <tierone/stash/chunk_reader.hpp>
#include <tierone/stash/config.hpp>
#include <tierone/stash/index_store.hpp>
#include <tierone/stash/log.hpp>
#include <map>
#include <optional>

namespace tierone::stash {

namespace fs = std::filesystem;

auto verify_archive(const fs::path& cache_dir) -> std::expected<verify_report, error> {
    auto index = index_store::open(cache_dir / INDEX_FILENAME, true);
    if (!index) {
        return std::unexpected(index.error());
    }

    auto records = index->records();
    if (!records) {
        return std::unexpected(records.error());
    }

    verify_report report;
    std::map<std::string, std::optional<chunk_reader>> readers;

    for (const auto& record : *records) {
        if (!record.md5) {
            ++report.without_digest;
            continue;
        }

        auto it = readers.find(record.tar);
        if (it == readers.end()) {
            const fs::path chunk_path = cache_dir / record.tar;
            std::error_code ec;
            std::optional<chunk_reader> reader;
            if (fs::is_regular_file(chunk_path, ec)) {
                auto opened = chunk_reader::from_file(chunk_path);
                if (!opened) {
                    return std::unexpected(opened.error());
                }
                reader.emplace(std::move(*opened));
            } else {
                log::debug("Chunk {} is not in the local cache", record.tar);
                report.missing_chunks.push_back(record.tar);
            }
            it = readers.emplace(record.tar, std::move(reader)).first;
        }

        if (!it->second) {
            ++report.skipped;
            continue;
        }

        auto& reader = *it->second;
        auto entry = reader.read_entry_at(record.offset);
        if (!entry) {
            report.mismatches.push_back({record.name, record.tar, entry.error().message()});
            continue;
        }
        if (entry->metadata.path != record.name || entry->metadata.size != record.size) {
            report.mismatches.push_back({record.name, record.tar,
                "Header at offset " + std::to_string(record.offset) + " describes " + entry->metadata.path});
            continue;
        }

        auto digest = reader.digest_entry_at(record.offset);
        if (!digest) {
            report.mismatches.push_back({record.name, record.tar, digest.error().message()});
            continue;
        }
        if (*digest != *record.md5) {
            report.mismatches.push_back({record.name, record.tar,
                "MD5 mismatch: index " + *record.md5 + ", chunk " + *digest});
            continue;
        }

        log::debug("Verified {}", record.name);
        ++report.verified;
    }

    return report;
}

} // namespace tierone::stash
