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

#include <tierone/stash/remote_tier.hpp>
#include <tierone/stash/log.hpp>
#include <tierone/stash/stream.hpp>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <ranges>
#include <string_view>

#include <sys/wait.h>

namespace tierone::stash {

namespace fs = std::filesystem;

auto shell_command_runner::run(const std::string& command) -> std::expected<command_output, error> {
    const std::string full = command + " 2>&1";
    std::FILE* pipe = ::popen(full.c_str(), "r");
    if (!pipe) {
        return std::unexpected(error{error_code::transfer_error,
            "Cannot run '" + command + "': " + std::string{std::strerror(errno)}});
    }

    command_output result;
    std::array<char, 4096> buffer{};
    size_t n;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

    const int status = ::pclose(pipe);
    if (status == -1) {
        return std::unexpected(error{error_code::transfer_error,
            "Cannot collect status of '" + command + "': " + std::string{std::strerror(errno)}});
    }
    result.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}

std::string shell_quote(std::string_view text) {
    std::string quoted{"'"};
    for (const char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

auto local_tier::put(const fs::path& local_file, bool) -> std::expected<void, error> {
    std::error_code ec;
    if (!fs::is_regular_file(local_file, ec)) {
        return std::unexpected(error{error_code::transfer_error,
            "Local file missing: " + local_file.string()});
    }
    // The file and its directory entry must both reach the disk
    const fs::path directory = local_file.has_parent_path() ? local_file.parent_path() : fs::path{"."};
    for (const auto& target : {local_file, directory}) {
        if (auto synced = sync_path(target); !synced) {
            return std::unexpected(error{error_code::transfer_error, synced.error().message()});
        }
    }
    log::debug("Keeping {} in the local archive only", local_file.string());
    return {};
}

hsi_tier::hsi_tier(std::string destination, std::unique_ptr<command_runner> runner)
    : destination_(std::move(destination)), runner_(std::move(runner)) {}

auto hsi_tier::hsi(const std::string& commands) -> std::expected<command_output, error> {
    const std::string command = "hsi -q " + shell_quote(commands);
    log::debug("Running {}", command);
    return runner_->run(command);
}

auto hsi_tier::prepare() -> std::expected<void, error> {
    auto mkdir = hsi("mkdir -p " + destination_);
    if (!mkdir) {
        return std::unexpected(error{error_code::setup_error, mkdir.error().message()});
    }
    if (mkdir->exit_status != 0) {
        return std::unexpected(error{error_code::setup_error,
            "Could not create HPSS directory " + destination_ + ": " + mkdir->output});
    }

    auto listing = hsi("cd " + destination_ + "; ls");
    if (!listing) {
        return std::unexpected(error{error_code::setup_error, listing.error().message()});
    }
    if (listing->exit_status != 0) {
        return std::unexpected(error{error_code::setup_error,
            "Cannot list HPSS directory " + destination_ + ": " + listing->output});
    }

    // hsi prints a "<directory>:" heading before the entries
    for (auto part : listing->output | std::views::split('\n')) {
        std::string_view line{part.begin(), part.end()};
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.remove_suffix(1);
        }
        if (line.empty() || line.back() == ':') {
            continue;
        }
        return std::unexpected(error{error_code::setup_error,
            "Target HPSS directory is not empty: " + destination_});
    }

    return {};
}

auto hsi_tier::put(const fs::path& local_file, const bool keep) -> std::expected<void, error> {
    const std::string name = local_file.filename().string();
    log::info("Transferring {} to HPSS", name);

    auto result = hsi("cd " + destination_ + "; put " + local_file.string() + " : " + name);
    if (!result) {
        return std::unexpected(error{error_code::transfer_error, result.error().message()});
    }
    if (result->exit_status != 0) {
        return std::unexpected(error{error_code::transfer_error,
            "Error transferring " + local_file.string() + " to HPSS: " + result->output});
    }

    if (!keep) {
        std::error_code ec;
        fs::remove(local_file, ec);
        if (ec) {
            log::warning("Transferred {} but cannot remove the local copy: {}", name, ec.message());
        } else {
            log::debug("Removed local copy of {}", name);
        }
    }
    return {};
}

std::unique_ptr<remote_tier> make_remote_tier(const session_config& config) {
    if (!config.remote_enabled()) {
        return std::make_unique<local_tier>();
    }
    return std::make_unique<hsi_tier>(config.hpss, std::make_unique<shell_command_runner>());
}

} // namespace tierone::stash
