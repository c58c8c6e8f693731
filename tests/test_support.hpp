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

#include <tierone/stash/remote_tier.hpp>
#include <filesystem>
#include <expected>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stash_test {

namespace fs = std::filesystem;

// Scratch directory removed with everything in it on destruction
class TempDir {
    fs::path path_;
public:
    TempDir() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);

        auto temp = fs::temp_directory_path();
        do {
            path_ = temp / ("tierone_stash_test_" + std::to_string(dis(gen)));
        } while (fs::exists(path_));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path make_dir(const std::string& relative) const {
        auto dir = path_ / relative;
        fs::create_directories(dir);
        return dir;
    }

    fs::path write_file(const std::string& relative, const std::string& content) const {
        auto file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }

    // File of size bytes with a position-dependent pattern
    fs::path write_sized_file(const std::string& relative, size_t size, unsigned seed = 0) const {
        std::string content(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            content[i] = static_cast<char>((i * 31 + seed) % 251);
        }
        return write_file(relative, content);
    }
};

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

constexpr size_t MiB = 1024 * 1024;

// Remote tier that records transfers and can be told to fail
class recording_tier : public tierone::stash::remote_tier {
public:
    std::vector<std::pair<fs::path, bool>> puts;
    std::optional<size_t> fail_put_at;   // Index of the put() call that fails
    bool fail_prepare = false;
    size_t prepare_calls = 0;
    // Runs after each successful put() with the file just transferred
    std::function<void(const fs::path&)> after_put;

    std::expected<void, tierone::stash::error> prepare() override {
        ++prepare_calls;
        if (fail_prepare) {
            return std::unexpected(tierone::stash::error{tierone::stash::error_code::setup_error,
                "Target directory is not empty"});
        }
        return {};
    }

    std::expected<void, tierone::stash::error> put(const fs::path& local_file, bool keep) override {
        if (fail_put_at && puts.size() == *fail_put_at) {
            fail_put_at.reset();
            return std::unexpected(tierone::stash::error{tierone::stash::error_code::transfer_error,
                "Simulated transfer failure"});
        }
        puts.emplace_back(local_file, keep);
        if (after_put) {
            after_put(local_file);
        }
        return {};
    }

    std::string_view destination() const noexcept override { return "recording"; }
};

} // namespace stash_test
