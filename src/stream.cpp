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

#include <tierone/stash/stream.hpp>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tierone::stash {

namespace {

std::string errno_message() {
    return std::string{std::strerror(errno)};
}

} // anonymous namespace

auto byte_source::skip(const uint64_t bytes) -> std::expected<void, error> {
    const uint64_t here = position();
    if (here > size() || bytes > size() - here) {
        return std::unexpected(error{error_code::io_error, "Skip past end of source"});
    }
    return seek(here + bytes);
}

auto byte_source::read_exact(std::span<std::byte> buffer) -> std::expected<void, error> {
    while (!buffer.empty()) {
        auto got = read(buffer);
        if (!got) {
            return std::unexpected(got.error());
        }
        if (*got == 0) {
            return std::unexpected(error{error_code::corrupt_archive, "Unexpected end of data"});
        }
        buffer = buffer.subspan(*got);
    }
    return {};
}

file_source::file_source(std::FILE* file, std::filesystem::path path, const uint64_t size)
    : file_(file), path_(std::move(path)), size_(size) {}

auto file_source::open(const std::filesystem::path& path) -> std::expected<file_source, error> {
    detail::file_handle file{std::fopen(path.c_str(), "rb")};
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file " + path.string() + ": " + errno_message()});
    }

    struct stat st{};
    if (::fstat(::fileno(file.get()), &st) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Cannot stat " + path.string() + ": " + errno_message()});
    }

    return file_source{file.release(), path, static_cast<uint64_t>(st.st_size)};
}

auto file_source::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t n = std::fread(buffer.data(), 1, buffer.size(), file_.get());
    if (n < buffer.size() && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error,
            "Read error on " + path_.string() + ": " + errno_message()});
    }
    position_ += n;
    return n;
}

auto file_source::seek(const uint64_t position) -> std::expected<void, error> {
    if (position > size_) {
        return std::unexpected(error{error_code::io_error, "Seek past end of " + path_.string()});
    }
    if (::fseeko(file_.get(), static_cast<off_t>(position), SEEK_SET) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Seek error on " + path_.string() + ": " + errno_message()});
    }
    position_ = position;
    return {};
}

file_sink::file_sink(std::FILE* file, std::filesystem::path path)
    : file_(file), path_(std::move(path)) {}

auto file_sink::create(const std::filesystem::path& path) -> std::expected<file_sink, error> {
    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to create file " + path.string() + ": " + errno_message()});
    }
    return file_sink{file, path};
}

auto file_sink::write(std::span<const std::byte> data) -> std::expected<void, error> {
    if (!file_) {
        return std::unexpected(error{error_code::invalid_operation, "Write to closed file " + path_.string()});
    }
    if (data.empty()) {
        return {};
    }

    const size_t written = std::fwrite(data.data(), 1, data.size(), file_.get());
    position_ += written;
    if (written != data.size()) {
        return std::unexpected(error{error_code::io_error,
            "Write error on " + path_.string() + ": " + errno_message()});
    }
    return {};
}

auto file_sink::truncate(const uint64_t position) -> std::expected<void, error> {
    if (!file_) {
        return std::unexpected(error{error_code::invalid_operation, "Truncate of closed file " + path_.string()});
    }
    if (position > position_) {
        return std::unexpected(error{error_code::invalid_operation, "Truncate past end of " + path_.string()});
    }

    std::clearerr(file_.get());
    if (std::fflush(file_.get()) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Failed to flush " + path_.string() + ": " + errno_message()});
    }
    if (::ftruncate(::fileno(file_.get()), static_cast<off_t>(position)) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Failed to truncate " + path_.string() + ": " + errno_message()});
    }
    if (::fseeko(file_.get(), static_cast<off_t>(position), SEEK_SET) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Seek error on " + path_.string() + ": " + errno_message()});
    }

    position_ = position;
    return {};
}

auto file_sink::sync() -> std::expected<void, error> {
    if (!file_) {
        return std::unexpected(error{error_code::invalid_operation, "Sync of closed file " + path_.string()});
    }
    if (std::fflush(file_.get()) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Failed to flush " + path_.string() + ": " + errno_message()});
    }
    if (::fsync(::fileno(file_.get())) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Failed to sync " + path_.string() + ": " + errno_message()});
    }
    return {};
}

auto file_sink::close() -> std::expected<void, error> {
    if (!file_) {
        return {};
    }

    auto synced = sync();
    if (std::fclose(file_.release()) != 0 && synced) {
        return std::unexpected(error{error_code::io_error,
            "Failed to close " + path_.string() + ": " + errno_message()});
    }
    return synced;
}

auto sync_path(const std::filesystem::path& path) -> std::expected<void, error> {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(error{error_code::io_error,
            "Cannot open " + path.string() + " for sync: " + errno_message()});
    }
    const bool synced = ::fsync(fd) == 0;
    const std::string reason = synced ? std::string{} : errno_message();
    ::close(fd);
    if (!synced) {
        return std::unexpected(error{error_code::io_error,
            "Failed to sync " + path.string() + ": " + reason});
    }
    return {};
}

} // namespace tierone::stash
