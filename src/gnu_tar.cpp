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

#include <tierone/stash/gnu_tar.hpp>
#include <tierone/stash/header_parser.hpp>
#include <utility>

namespace tierone::stash::gnu {

auto read_long_name(byte_source& source, const uint64_t size) -> std::expected<std::string, error> {
    if (size > MAX_LONG_NAME) {
        return std::unexpected(error{error_code::corrupt_archive,
            "GNU long name record of " + std::to_string(size) + " bytes"});
    }

    std::string text(static_cast<size_t>(size), '\0');
    if (auto result = source.read_exact(std::as_writable_bytes(std::span{text})); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = source.skip(detail::padding_size(size)); !result) {
        return std::unexpected(result.error());
    }

    if (const auto nul = text.find('\0'); nul != std::string::npos) {
        text.resize(nul);
    }
    return text;
}

void apply_long_names(file_metadata& meta, long_names names) {
    if (names.path) {
        meta.path = std::move(*names.path);
        if (meta.is_directory()) {
            detail::strip_directory_slash(meta.path);
        }
    }
    if (names.link_target) {
        meta.link_target = std::move(*names.link_target);
    }
}

bool has_gnu_magic(const gnu_header& header) noexcept {
    return std::string_view{header.magic, sizeof(header.magic)} == MAGIC &&
           std::string_view{header.version, sizeof(header.version)} == VERSION;
}

} // namespace tierone::stash::gnu
