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

#include <tierone/stash/header_writer.hpp>
#include <tierone/stash/gnu_tar.hpp>
#include <algorithm>
#include <bit>
#include <string>
#include <utility>

namespace tierone::stash::detail {

namespace {

// Largest value representable by digits octal digits
constexpr uint64_t octal_limit(const size_t digits) noexcept {
    return digits >= 22 ? UINT64_MAX : (uint64_t{1} << (3 * digits)) - 1;
}

header_block make_block(const file_metadata& meta, std::string_view name, std::string_view linkname) {
    header_block block{};
    auto* header = std::bit_cast<gnu_header*>(block.data());

    encode_string(std::span{header->name}, name);
    encode_numeric(std::span{header->mode}, static_cast<uint64_t>(meta.permissions) & 07777);
    encode_numeric(std::span{header->uid}, meta.owner_id);
    encode_numeric(std::span{header->gid}, meta.group_id);
    encode_numeric(std::span{header->size}, meta.size);

    const auto mtime = std::chrono::system_clock::to_time_t(meta.modification_time);
    encode_numeric(std::span{header->mtime}, mtime > 0 ? static_cast<uint64_t>(mtime) : 0);

    header->typeflag = std::to_underlying(meta.type);
    encode_string(std::span{header->linkname}, linkname);

    std::ranges::copy(gnu::MAGIC, header->magic);
    std::ranges::copy(gnu::VERSION, header->version);

    encode_string(std::span{header->uname}, meta.owner_name);
    encode_string(std::span{header->gname}, meta.group_name);

    if (meta.is_device()) {
        encode_numeric(std::span{header->devmajor}, meta.device_major);
        encode_numeric(std::span{header->devminor}, meta.device_minor);
    }

    write_checksum(block);
    return block;
}

void append_block(std::vector<std::byte>& out, const header_block& block) {
    out.insert(out.end(), block.begin(), block.end());
}

// GNU 'L'/'K' pseudo-entry: header followed by the NUL-terminated text
void append_gnu_extension(std::vector<std::byte>& out, const entry_type type,
                          const file_metadata& meta, std::string_view text) {
    file_metadata ext;
    ext.path = std::string{gnu::LONGLINK_NAME};
    ext.type = type;
    ext.permissions = std::filesystem::perms::none;
    ext.size = text.size() + 1;
    ext.modification_time = std::chrono::system_clock::from_time_t(0);
    ext.owner_name = meta.owner_name;
    ext.group_name = meta.group_name;

    append_block(out, make_block(ext, ext.path, {}));

    const auto* data = reinterpret_cast<const std::byte*>(text.data());
    out.insert(out.end(), data, data + text.size());
    out.push_back(std::byte{0});
    out.insert(out.end(), padding_size(ext.size), std::byte{0});
}

} // anonymous namespace

void encode_numeric(std::span<char> field, uint64_t value) noexcept {
    std::ranges::fill(field, '\0');
    const size_t digits = field.size() - 1;

    if (value <= octal_limit(digits)) {
        for (size_t i = digits; i > 0; --i) {
            field[i - 1] = static_cast<char>('0' + (value & 07));
            value >>= 3;
        }
        return;
    }

    // GNU base-256: marker byte, then big-endian binary
    for (size_t i = field.size(); i > 1; --i) {
        field[i - 1] = static_cast<char>(value & 0xff);
        value >>= 8;
    }
    field[0] = static_cast<char>(0x80);
}

void encode_string(std::span<char> field, std::string_view text) noexcept {
    std::ranges::fill(field, '\0');
    std::ranges::copy_n(text.begin(), static_cast<std::ptrdiff_t>(std::min(text.size(), field.size())),
                        field.begin());
}

void write_checksum(header_block& block) noexcept {
    auto* header = std::bit_cast<gnu_header*>(block.data());
    const uint32_t sum = header_checksum(block);

    // Six octal digits, NUL, space
    std::span<char> field{header->checksum};
    uint32_t value = sum;
    for (size_t i = 6; i > 0; --i) {
        field[i - 1] = static_cast<char>('0' + (value & 07));
        value >>= 3;
    }
    field[6] = '\0';
    field[7] = ' ';
}

auto encode_header(const file_metadata& meta) -> std::expected<std::vector<std::byte>, error> {
    if (meta.path.empty()) {
        return std::unexpected(error{error_code::invalid_operation, "Cannot encode entry with empty path"});
    }

    std::string name = meta.path;
    if (meta.is_directory() && name.back() != '/') {
        name.push_back('/');
    }
    const std::string linkname = meta.link_target.value_or(std::string{});

    std::vector<std::byte> out;
    out.reserve(BLOCK_SIZE);

    constexpr size_t name_field = sizeof(gnu_header::name);
    constexpr size_t link_field = sizeof(gnu_header::linkname);

    if (linkname.size() > link_field) {
        append_gnu_extension(out, entry_type::gnu_longlink, meta, linkname);
    }
    if (name.size() > name_field) {
        append_gnu_extension(out, entry_type::gnu_longname, meta, name);
    }

    append_block(out, make_block(meta, name, linkname));
    return out;
}

} // namespace tierone::stash::detail
