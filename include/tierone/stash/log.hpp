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

#include <format>
#include <string_view>
#include <utility>

namespace tierone::stash::log {

enum class level : int {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

// Messages below the threshold are dropped. Defaults to level::info.
void set_threshold(level threshold) noexcept;
[[nodiscard]] level threshold() noexcept;

// Write one "[LEVEL] message" line to stderr
void write(level lvl, std::string_view message);

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (threshold() <= level::debug) {
        write(level::debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (threshold() <= level::info) {
        write(level::info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args) {
    if (threshold() <= level::warning) {
        write(level::warning, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    write(level::error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace tierone::stash::log
