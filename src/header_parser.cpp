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

#include <tierone/stash/header_parser.hpp>
#include <tierone/stash/gnu_tar.hpp>
#include <algorithm>
#include <bit>
#include <charconv>
#include <ctime>
#include <format>

namespace tierone::stash::detail {

namespace {

bool known_type(const char flag) noexcept {
    switch (static_cast<entry_type>(flag)) {
        case entry_type::regular_file:
        case entry_type::hard_link:
        case entry_type::symbolic_link:
        case entry_type::character_device:
        case entry_type::block_device:
        case entry_type::directory:
        case entry_type::fifo:
        case entry_type::gnu_longname:
        case entry_type::gnu_longlink:
            return true;
    }
    return false;
}

std::expected<uint64_t, error> parse_base256(std::span<const char> field) {
    if (static_cast<unsigned char>(field[0]) == 0xff) {
        return std::unexpected(error{error_code::invalid_header, "Negative base-256 value"});
    }
    uint64_t value = 0;
    for (const char c : field.subspan(1)) {
        if (value > (UINT64_MAX >> 8)) {
            return std::unexpected(error{error_code::invalid_header, "Base-256 value overflow"});
        }
        value = (value << 8) | static_cast<unsigned char>(c);
    }
    return value;
}

} // anonymous namespace

auto parse_numeric(std::span<const char> field) -> std::expected<uint64_t, error> {
    if (field.empty()) {
        return 0;
    }
    if ((static_cast<unsigned char>(field[0]) & 0x80) != 0) {
        return parse_base256(field);
    }

    const char* first = field.data();
    const char* last = first + field.size();
    while (first != last && *first == ' ') {
        ++first;
    }
    const char* end = std::find_if(first, last, [](const char c) { return c == '\0' || c == ' '; });
    if (first == end) {
        return 0;
    }

    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(first, end, value, 8);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(error{error_code::invalid_header, "Octal value overflow"});
    }
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(error{error_code::invalid_header, "Invalid octal digit"});
    }
    return value;
}

uint32_t header_checksum(std::span<const std::byte, BLOCK_SIZE> block) noexcept {
    constexpr size_t field_begin = offsetof(gnu_header, checksum);
    constexpr size_t field_end = field_begin + sizeof(gnu_header::checksum);

    uint32_t sum = ' ' * sizeof(gnu_header::checksum);
    for (size_t i = 0; i < block.size(); ++i) {
        if (i < field_begin || i >= field_end) {
            sum += std::to_integer<uint32_t>(block[i]);
        }
    }
    return sum;
}

bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block) noexcept {
    return std::ranges::all_of(block, [](const std::byte b) { return b == std::byte{0}; });
}

std::string_view field_text(std::span<const char> field) noexcept {
    const std::string_view raw{field.data(), field.size()};
    return raw.substr(0, raw.find('\0'));
}

void strip_directory_slash(std::string& path) noexcept {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
}

auto parse_header(std::span<const std::byte, BLOCK_SIZE> block) -> std::expected<file_metadata, error> {
    const auto* header = std::bit_cast<const gnu_header*>(block.data());

    if (!gnu::has_gnu_magic(*header)) {
        return std::unexpected(error{error_code::invalid_header, "Not a GNU tar header"});
    }

    auto stored = parse_numeric(header->checksum);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (*stored != header_checksum(block)) {
        return std::unexpected(error{error_code::corrupt_archive, "Header checksum mismatch"});
    }

    if (!known_type(header->typeflag)) {
        return std::unexpected(error{error_code::invalid_header,
            std::format("Unsupported entry type {:#04x}", static_cast<unsigned char>(header->typeflag))});
    }

    file_metadata meta;
    meta.type = static_cast<entry_type>(header->typeflag);
    meta.path = std::string{field_text(header->name)};
    if (meta.path.empty()) {
        return std::unexpected(error{error_code::invalid_header, "Empty file path"});
    }

    struct numeric_field {
        std::span<const char> text;
        uint64_t* value;
    };

    uint64_t mode = 0;
    uint64_t uid = 0;
    uint64_t gid = 0;
    uint64_t mtime = 0;
    const numeric_field fields[] = {
        {header->mode, &mode},
        {header->uid, &uid},
        {header->gid, &gid},
        {header->size, &meta.size},
        {header->mtime, &mtime},
    };
    for (const auto& [text, value] : fields) {
        auto parsed = parse_numeric(text);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        *value = *parsed;
    }

    meta.permissions = static_cast<std::filesystem::perms>(mode & 07777);
    meta.owner_id = static_cast<uint32_t>(uid);
    meta.group_id = static_cast<uint32_t>(gid);
    meta.modification_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(mtime));
    meta.owner_name = std::string{field_text(header->uname)};
    meta.group_name = std::string{field_text(header->gname)};

    if (meta.is_device()) {
        auto major = parse_numeric(header->devmajor);
        auto minor = parse_numeric(header->devminor);
        if (!major || !minor) {
            return std::unexpected(error{error_code::invalid_header, "Invalid device numbers"});
        }
        meta.device_major = static_cast<uint32_t>(*major);
        meta.device_minor = static_cast<uint32_t>(*minor);
    }

    if (meta.is_symbolic_link() || meta.is_hard_link()) {
        if (const auto target = field_text(header->linkname); !target.empty()) {
            meta.link_target = std::string{target};
        }
    }

    if (meta.is_directory()) {
        strip_directory_slash(meta.path);
    }

    return meta;
}

} // namespace tierone::stash::detail
