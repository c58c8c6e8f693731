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

#include <tierone/stash/enumerator.hpp>
#include <tierone/stash/log.hpp>
#include <algorithm>
#include <utility>

namespace tierone::stash {

namespace fs = std::filesystem;

namespace {

// Directory key "." for the root, "./a/b" below it
std::string child_key(const std::string& parent, const std::string& name) {
    return parent + "/" + name;
}

std::string to_relative(const std::string& dir_key, const std::string& name) {
    if (name.empty()) {
        return dir_key == "." ? std::string{"."} : dir_key.substr(2);
    }
    return dir_key == "." ? name : dir_key.substr(2) + "/" + name;
}

} // anonymous namespace

auto enumerate_files(
    const fs::path& root,
    const std::optional<fs::path>& exclude_dir
) -> std::expected<enumeration, error> {
    std::error_code ec;
    const fs::path base = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        return std::unexpected(error{error_code::io_error,
            "Cannot resolve " + root.string() + ": " + ec.message()});
    }

    std::optional<fs::path> skip;
    if (exclude_dir) {
        fs::path excluded = exclude_dir->is_absolute() ? *exclude_dir : base / *exclude_dir;
        skip = excluded.lexically_normal();
        if (!skip->has_filename()) {
            skip = skip->parent_path();
        }
    }

    enumeration result;
    std::vector<std::pair<std::string, std::string>> found;
    std::vector<std::string> pending{"."};

    while (!pending.empty()) {
        const std::string dir_key = std::move(pending.back());
        pending.pop_back();

        const fs::path dir_path = dir_key == "." ? base : (base / dir_key.substr(2)).lexically_normal();

        fs::directory_iterator it{dir_path, ec};
        if (ec) {
            if (dir_key == ".") {
                return std::unexpected(error{error_code::io_error,
                    "Cannot read directory " + dir_path.string() + ": " + ec.message()});
            }
            log::warning("Cannot read directory {}: {}", dir_path.string(), ec.message());
            result.errors.push_back({to_relative(dir_key, {}), ec.message()});
            continue;
        }

        bool has_children = false;
        for (; it != fs::directory_iterator{}; it.increment(ec)) {
            if (ec) {
                break;
            }
            has_children = true;

            const std::string name = it->path().filename().string();
            const auto status = it->symlink_status(ec);
            if (ec) {
                // Vanished between readdir and lstat; the builder reports it
                ec.clear();
                found.emplace_back(dir_key, name);
                continue;
            }

            if (fs::is_directory(status)) {
                if (skip && it->path().lexically_normal() == *skip) {
                    continue;
                }
                pending.push_back(child_key(dir_key, name));
            } else {
                found.emplace_back(dir_key, name);
            }
        }

        if (ec) {
            log::warning("Error while listing {}: {}", dir_path.string(), ec.message());
            result.errors.push_back({to_relative(dir_key, {}), ec.message()});
            ec.clear();
            continue;
        }

        if (!has_children) {
            found.emplace_back(dir_key, std::string{});
        }
    }

    std::ranges::sort(found);

    result.entries.reserve(found.size());
    for (const auto& [dir_key, name] : found) {
        result.entries.push_back(to_relative(dir_key, name));
    }

    return result;
}

} // namespace tierone::stash
