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
#include <expected>
#include <memory>
#include <span>
#include <string>

struct evp_md_ctx_st;

namespace tierone::stash {

// Incremental MD5 over a byte stream, backed by OpenSSL EVP
class md5_digest {
private:
    struct context_deleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, context_deleter> context_;

    explicit md5_digest(evp_md_ctx_st* ctx) : context_(ctx) {}

public:
    [[nodiscard]] static std::expected<md5_digest, error> create();

    [[nodiscard]] std::expected<void, error> update(std::span<const std::byte> data);

    // Lowercase hex of the digest. The object cannot be updated afterwards.
    [[nodiscard]] std::expected<std::string, error> finish();
};

// One-shot digest of an in-memory buffer
[[nodiscard]] std::expected<std::string, error> md5_hex(std::span<const std::byte> data);

} // namespace tierone::stash
