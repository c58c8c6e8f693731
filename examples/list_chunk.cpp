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

/**
 * list_chunk - Lists the entries of a chunk with the offsets an index records for them.
 *
 * Usage: ./list_chunk <chunk.tar>
 */

#include <tierone/stash/chunk_reader.hpp>
#include <chrono>
#include <format>
#include <print>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::println(stderr, "Usage: {} <chunk.tar>", argv[0]);
        return 1;
    }

    auto reader = tierone::stash::chunk_reader::from_file(argv[1]);
    if (!reader) {
        std::println(stderr, "Failed to open chunk: {}", reader.error().message());
        return 1;
    }

    auto entries = reader->list_entries();
    if (!entries) {
        std::println(stderr, "Failed to read chunk: {}", entries.error().message());
        return 1;
    }

    std::println("{:>12} {:>12} {:>16}  {}", "offset", "size", "mtime", "name");
    for (const auto& entry : *entries) {
        const auto& meta = entry.metadata;

        char type_char = 'f';
        if (meta.is_directory()) type_char = 'd';
        else if (meta.is_symbolic_link()) type_char = 'l';
        else if (meta.is_hard_link()) type_char = 'h';
        else if (!meta.is_regular_file()) type_char = 's';

        std::println("{:>12} {:>12} {:>16}  {} {}",
            entry.offset,
            meta.size,
            std::format("{:%Y-%m-%d %H:%M}", std::chrono::floor<std::chrono::minutes>(meta.modification_time)),
            type_char,
            meta.path);
    }

    std::println("{} entries", entries->size());
    return 0;
}
