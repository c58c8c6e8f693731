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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tierone::stash {

// Type flags of the entries a chunk can hold
enum class entry_type : char {
    regular_file = '0',
    hard_link = '1',
    symbolic_link = '2',
    character_device = '3',
    block_device = '4',
    directory = '5',
    fifo = '6',
    // GNU records carrying the long name or link target of the next entry
    gnu_longname = 'L',
    gnu_longlink = 'K'
};

// One archived filesystem entry, as encoded in or decoded from a chunk header
struct file_metadata {
    std::string path;                 // Archive name, no trailing '/' for directories
    entry_type type = entry_type::regular_file;
    std::filesystem::perms permissions = std::filesystem::perms::owner_read;
    uint32_t owner_id = 0;
    uint32_t group_id = 0;
    uint64_t size = 0;                // Content bytes following the header
    std::chrono::system_clock::time_point modification_time;
    std::string owner_name;
    std::string group_name;
    std::optional<std::string> link_target;
    uint32_t device_major = 0;
    uint32_t device_minor = 0;

    [[nodiscard]] bool is_regular_file() const noexcept { return type == entry_type::regular_file; }
    [[nodiscard]] bool is_directory() const noexcept { return type == entry_type::directory; }
    [[nodiscard]] bool is_symbolic_link() const noexcept { return type == entry_type::symbolic_link; }
    [[nodiscard]] bool is_hard_link() const noexcept { return type == entry_type::hard_link; }
    [[nodiscard]] bool is_gnu_longname() const noexcept { return type == entry_type::gnu_longname; }
    [[nodiscard]] bool is_gnu_longlink() const noexcept { return type == entry_type::gnu_longlink; }

    [[nodiscard]] bool is_device() const noexcept {
        return type == entry_type::character_device || type == entry_type::block_device;
    }
};

// GNU tar header block. Identical to ustar up to devminor; the tail holds
// GNU-only fields that chunks leave zeroed.
struct gnu_header {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];      // "ustar "
    char version[2];    // " \0"
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char atime[12];
    char ctime[12];
    char offset[12];
    char longnames[4];
    char unused;
    char sparse[4][24];
    char isextended;
    char realsize[12];
    char padding[17];
};

static_assert(sizeof(gnu_header) == 512, "GNU tar header must fill exactly one block");

} // namespace tierone::stash
