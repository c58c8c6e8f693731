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

#include <tierone/stash/log.hpp>
#include <atomic>
#include <cstdio>
#include <print>

namespace tierone::stash::log {

namespace {

std::atomic<level> current_threshold{level::info};

constexpr std::string_view level_name(const level lvl) noexcept {
    switch (lvl) {
        case level::debug: return "DEBUG";
        case level::info: return "INFO";
        case level::warning: return "WARNING";
        case level::error: return "ERROR";
    }
    return "LOG";
}

} // anonymous namespace

void set_threshold(const level threshold) noexcept {
    current_threshold.store(threshold, std::memory_order_relaxed);
}

level threshold() noexcept {
    return current_threshold.load(std::memory_order_relaxed);
}

void write(const level lvl, const std::string_view message) {
    std::println(stderr, "[{}] {}", level_name(lvl), message);
}

} // namespace tierone::stash::log
