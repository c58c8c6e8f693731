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

#include <expected>
#include <string>
#include <utility>

namespace tierone::stash {

enum class error_code {
    setup_error,
    io_error,
    transfer_error,
    index_error,
    invalid_header,
    corrupt_archive,
    end_of_archive,
    invalid_operation,
    digest_error
};

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    error_code code_;
    std::string message_;
};

// Human readable name of an error code, used in log lines
[[nodiscard]] constexpr const char* to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::setup_error: return "setup error";
        case error_code::io_error: return "I/O error";
        case error_code::transfer_error: return "transfer error";
        case error_code::index_error: return "index error";
        case error_code::invalid_header: return "invalid header";
        case error_code::corrupt_archive: return "corrupt archive";
        case error_code::end_of_archive: return "end of archive";
        case error_code::invalid_operation: return "invalid operation";
        case error_code::digest_error: return "digest error";
    }
    return "unknown error";
}

} // namespace tierone::stash
