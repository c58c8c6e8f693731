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

#include <tierone/stash/chunk_writer.hpp>
#include <tierone/stash/chunk_boundary.hpp>
#include <tierone/stash/digest.hpp>
#include <tierone/stash/header_parser.hpp>
#include <tierone/stash/header_writer.hpp>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>

namespace tierone::stash {

namespace fs = std::filesystem;

namespace {

std::string errno_message() {
    return std::string{std::strerror(errno)};
}

std::string lookup_user(const uid_t uid) {
    std::array<char, 4096> buffer{};
    passwd pwd{};
    passwd* found = nullptr;
    if (::getpwuid_r(uid, &pwd, buffer.data(), buffer.size(), &found) == 0 && found) {
        return found->pw_name;
    }
    return {};
}

std::string lookup_group(const gid_t gid) {
    std::array<char, 4096> buffer{};
    group grp{};
    group* found = nullptr;
    if (::getgrgid_r(gid, &grp, buffer.data(), buffer.size(), &found) == 0 && found) {
        return found->gr_name;
    }
    return {};
}

std::expected<std::string, error> read_link(const fs::path& source) {
    std::error_code ec;
    auto target = fs::read_symlink(source, ec);
    if (ec) {
        return std::unexpected(error{error_code::io_error,
            "Cannot read link " + source.string() + ": " + ec.message()});
    }
    return target.string();
}

} // anonymous namespace

chunk_writer::chunk_writer(file_sink out, std::string name, const size_t block_size)
    : out_(std::move(out)), name_(std::move(name)), block_size_(block_size) {}

auto chunk_writer::create(
    const fs::path& directory,
    const uint64_t ordinal,
    const size_t block_size
) -> std::expected<chunk_writer, error> {
    if (block_size == 0) {
        return std::unexpected(error{error_code::invalid_operation, "Copy block size must be positive"});
    }

    std::string name = chunk_name(ordinal);
    auto out = file_sink::create(directory / name);
    if (!out) {
        return std::unexpected(out.error());
    }
    return chunk_writer{std::move(*out), std::move(name), block_size};
}

auto chunk_writer::describe(const fs::path& source, const std::string& name, std::optional<inode_key>& link_key)
    -> std::expected<file_metadata, error> {
    struct stat st{};
    if (::lstat(source.c_str(), &st) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Cannot stat " + source.string() + ": " + errno_message()});
    }

    file_metadata meta;
    meta.path = name;
    meta.permissions = static_cast<fs::perms>(st.st_mode & 07777);
    meta.owner_id = static_cast<uint32_t>(st.st_uid);
    meta.group_id = static_cast<uint32_t>(st.st_gid);
    meta.modification_time = std::chrono::system_clock::from_time_t(st.st_mtime);

    if (auto it = user_names_.find(meta.owner_id); it != user_names_.end()) {
        meta.owner_name = it->second;
    } else {
        meta.owner_name = user_names_.emplace(meta.owner_id, lookup_user(st.st_uid)).first->second;
    }
    if (auto it = group_names_.find(meta.group_id); it != group_names_.end()) {
        meta.group_name = it->second;
    } else {
        meta.group_name = group_names_.emplace(meta.group_id, lookup_group(st.st_gid)).first->second;
    }

    if (S_ISREG(st.st_mode)) {
        if (st.st_nlink > 1) {
            const inode_key inode{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
            if (auto it = hard_links_.find(inode); it != hard_links_.end()) {
                meta.type = entry_type::hard_link;
                meta.link_target = it->second;
                return meta;
            }
            link_key = inode;
        }
        meta.type = entry_type::regular_file;
        meta.size = static_cast<uint64_t>(st.st_size);
    } else if (S_ISDIR(st.st_mode)) {
        meta.type = entry_type::directory;
    } else if (S_ISLNK(st.st_mode)) {
        auto target = read_link(source);
        if (!target) {
            return std::unexpected(target.error());
        }
        meta.type = entry_type::symbolic_link;
        meta.link_target = std::move(*target);
    } else if (S_ISFIFO(st.st_mode)) {
        meta.type = entry_type::fifo;
    } else if (S_ISCHR(st.st_mode) || S_ISBLK(st.st_mode)) {
        meta.type = S_ISCHR(st.st_mode) ? entry_type::character_device : entry_type::block_device;
        meta.device_major = static_cast<uint32_t>(major(st.st_rdev));
        meta.device_minor = static_cast<uint32_t>(minor(st.st_rdev));
    } else {
        return std::unexpected(error{error_code::invalid_operation,
            "Unsupported file type: " + source.string()});
    }

    return meta;
}

auto chunk_writer::write_zeros(size_t count) -> std::expected<void, error> {
    static constexpr std::array<std::byte, detail::BLOCK_SIZE> zeros{};
    while (count > 0) {
        const size_t n = std::min(count, zeros.size());
        if (auto result = out_.write(std::span{zeros.data(), n}); !result) {
            return result;
        }
        count -= n;
    }
    return {};
}

auto chunk_writer::write_entry(const file_metadata& meta, const fs::path& source)
    -> std::expected<std::optional<std::string>, error> {
    // Open the source before emitting anything so that unreadable files
    // usually fail without touching the chunk
    std::optional<file_source> input;
    if (meta.is_regular_file()) {
        auto opened = file_source::open(source);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        input.emplace(std::move(*opened));
    }

    auto header = detail::encode_header(meta);
    if (!header) {
        return std::unexpected(header.error());
    }
    if (auto result = out_.write(*header); !result) {
        return std::unexpected(result.error());
    }

    if (!input) {
        return std::optional<std::string>{};
    }

    auto digest = md5_digest::create();
    if (!digest) {
        return std::unexpected(digest.error());
    }

    std::vector<std::byte> buffer(block_size_);
    uint64_t remaining = meta.size;
    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        auto got = input->read(std::span{buffer.data(), want});
        if (!got) {
            return std::unexpected(got.error());
        }
        if (*got == 0) {
            return std::unexpected(error{error_code::io_error,
                "File shrank while archiving: " + source.string()});
        }

        const std::span<const std::byte> data{buffer.data(), *got};
        if (auto result = out_.write(data); !result) {
            return std::unexpected(result.error());
        }
        if (auto result = digest->update(data); !result) {
            return std::unexpected(result.error());
        }
        remaining -= *got;
    }

    if (auto result = write_zeros(detail::padding_size(meta.size)); !result) {
        return std::unexpected(result.error());
    }

    auto hex = digest->finish();
    if (!hex) {
        return std::unexpected(hex.error());
    }
    return std::optional<std::string>{std::move(*hex)};
}

auto chunk_writer::append(
    const fs::path& source,
    const std::string& name,
    const uint64_t measured_size
) -> std::expected<appended_entry, error> {
    if (finalized_ || !usable_) {
        return std::unexpected(error{error_code::invalid_operation,
            "Chunk " + name_ + " is no longer accepting entries"});
    }

    std::optional<inode_key> link_key;
    auto meta = describe(source, name, link_key);
    if (!meta) {
        return std::unexpected(meta.error());
    }

    const uint64_t offset = out_.position();
    auto md5 = write_entry(*meta, source);
    if (!md5) {
        if (out_.position() != offset) {
            if (auto rollback = out_.truncate(offset); !rollback) {
                usable_ = false;
                return std::unexpected(error{error_code::corrupt_archive,
                    "Cannot roll back " + name_ + " after failing on " + name + ": " +
                    rollback.error().message()});
            }
        }
        return std::unexpected(md5.error());
    }

    if (link_key) {
        hard_links_.emplace(*link_key, name);
    }

    accumulated_size_ += measured_size;
    ++entry_count_;

    return appended_entry{
        .name = name,
        .offset = offset,
        .size = meta->size,
        .modification_time = meta->modification_time,
        .md5 = std::move(*md5)
    };
}

auto chunk_writer::finalize() -> std::expected<void, error> {
    if (finalized_) {
        return std::unexpected(error{error_code::invalid_operation, "Chunk " + name_ + " already finalized"});
    }
    if (!usable_) {
        return std::unexpected(error{error_code::corrupt_archive, "Chunk " + name_ + " is corrupt"});
    }

    // Two zero blocks end the archive, then pad to a whole record
    uint64_t trailer = 2 * detail::BLOCK_SIZE;
    const uint64_t end = out_.position() + trailer;
    if (const uint64_t rest = end % detail::RECORD_SIZE; rest != 0) {
        trailer += detail::RECORD_SIZE - rest;
    }

    if (auto result = write_zeros(static_cast<size_t>(trailer)); !result) {
        return result;
    }
    if (auto result = out_.close(); !result) {
        return result;
    }

    finalized_ = true;
    return {};
}

} // namespace tierone::stash
