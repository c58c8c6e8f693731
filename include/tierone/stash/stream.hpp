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
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>

namespace tierone::stash {

// Seekable source of bytes with a size known up front
class byte_source {
public:
    virtual ~byte_source() = default;

    // Read up to buffer.size() bytes; 0 means the end was reached
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    [[nodiscard]] virtual std::expected<void, error> seek(uint64_t position) = 0;

    [[nodiscard]] virtual uint64_t position() const noexcept = 0;
    [[nodiscard]] virtual uint64_t size() const noexcept = 0;

    [[nodiscard]] bool at_end() const noexcept { return position() >= size(); }

    // Move forward without reading; fails past the end
    [[nodiscard]] std::expected<void, error> skip(uint64_t bytes);

    // Fill buffer completely; running out of data is corrupt_archive
    [[nodiscard]] std::expected<void, error> read_exact(std::span<std::byte> buffer);
};

// Source over a caller-owned buffer
class memory_source : public byte_source {
private:
    std::span<const std::byte> data_;
    uint64_t position_ = 0;

public:
    explicit memory_source(std::span<const std::byte> data) : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        const auto rest = data_.subspan(static_cast<size_t>(position_));
        const size_t n = std::min(buffer.size(), rest.size());
        std::ranges::copy(rest.first(n), buffer.begin());
        position_ += n;
        return n;
    }

    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override {
        if (position > data_.size()) {
            return std::unexpected(error{error_code::io_error, "Seek past end of buffer"});
        }
        position_ = position;
        return {};
    }

    [[nodiscard]] uint64_t position() const noexcept override { return position_; }
    [[nodiscard]] uint64_t size() const noexcept override { return data_.size(); }
};

namespace detail {

struct file_deleter {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

using file_handle = std::unique_ptr<std::FILE, file_deleter>;

} // namespace detail

// Read side of a file. The size is taken from fstat when the file is
// opened; a file that shrinks afterwards simply reads short.
class file_source : public byte_source {
private:
    detail::file_handle file_;
    std::filesystem::path path_;
    uint64_t size_ = 0;
    uint64_t position_ = 0;

    file_source(std::FILE* file, std::filesystem::path path, uint64_t size);

public:
    [[nodiscard]] static std::expected<file_source, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override;

    [[nodiscard]] uint64_t position() const noexcept override { return position_; }
    [[nodiscard]] uint64_t size() const noexcept override { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
};

// Append-only file output that can be rolled back to an earlier position.
// The position is tracked locally and always equals the number of bytes
// that the file will hold once buffered data is flushed.
class file_sink {
private:
    detail::file_handle file_;
    std::filesystem::path path_;
    uint64_t position_ = 0;

    file_sink(std::FILE* file, std::filesystem::path path);

public:
    // Create or replace path
    [[nodiscard]] static std::expected<file_sink, error> create(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, error> write(std::span<const std::byte> data);

    // Discard everything written at or after position
    [[nodiscard]] std::expected<void, error> truncate(uint64_t position);

    // Flush user-space buffers and fsync the descriptor
    [[nodiscard]] std::expected<void, error> sync();

    // Sync and release the handle; the sink is closed afterwards even on error
    [[nodiscard]] std::expected<void, error> close();

    [[nodiscard]] uint64_t position() const noexcept { return position_; }
    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
};

// fsync an existing file or directory by path
[[nodiscard]] std::expected<void, error> sync_path(const std::filesystem::path& path);

} // namespace tierone::stash
