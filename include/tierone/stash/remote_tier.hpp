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

#include <tierone/stash/config.hpp>
#include <tierone/stash/error.hpp>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tierone::stash {

struct command_output {
    int exit_status = 0;
    std::string output;   // stdout and stderr combined
};

// Runs shell commands for the remote tier
class command_runner {
public:
    virtual ~command_runner() = default;

    // Fails only if the command could not be started; a non-zero exit status
    // is reported in the output
    [[nodiscard]] virtual std::expected<command_output, error> run(const std::string& command) = 0;
};

// /bin/sh via popen(3)
class shell_command_runner : public command_runner {
public:
    [[nodiscard]] std::expected<command_output, error> run(const std::string& command) override;
};

// Destination for finished chunks and the final index
class remote_tier {
public:
    virtual ~remote_tier() = default;

    // Make sure the destination exists and holds nothing yet
    [[nodiscard]] virtual std::expected<void, error> prepare() = 0;

    // Transfer local_file. Unless keep is set, the local copy is removed
    // once the transfer succeeded.
    [[nodiscard]] virtual std::expected<void, error> put(const std::filesystem::path& local_file, bool keep) = 0;

    [[nodiscard]] virtual std::string_view destination() const noexcept = 0;
};

// No remote tier: files stay in the local cache, keep has no effect
class local_tier : public remote_tier {
public:
    [[nodiscard]] std::expected<void, error> prepare() override { return {}; }
    [[nodiscard]] std::expected<void, error> put(const std::filesystem::path& local_file, bool keep) override;
    [[nodiscard]] std::string_view destination() const noexcept override { return NO_REMOTE; }
};

// HPSS through the hsi client
class hsi_tier : public remote_tier {
private:
    std::string destination_;
    std::unique_ptr<command_runner> runner_;

    [[nodiscard]] std::expected<command_output, error> hsi(const std::string& commands);

public:
    hsi_tier(std::string destination, std::unique_ptr<command_runner> runner);

    [[nodiscard]] std::expected<void, error> prepare() override;
    [[nodiscard]] std::expected<void, error> put(const std::filesystem::path& local_file, bool keep) override;
    [[nodiscard]] std::string_view destination() const noexcept override { return destination_; }
};

// Quote text for /bin/sh
[[nodiscard]] std::string shell_quote(std::string_view text);

// local_tier for "none", hsi_tier otherwise
[[nodiscard]] std::unique_ptr<remote_tier> make_remote_tier(const session_config& config);

} // namespace tierone::stash
