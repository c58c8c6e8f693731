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

#include <tierone/stash/digest.hpp>
#include <array>
#include <format>

#include <openssl/evp.h>

namespace tierone::stash {

void md5_digest::context_deleter::operator()(evp_md_ctx_st* ctx) const {
    if (ctx) EVP_MD_CTX_free(ctx);
}

auto md5_digest::create() -> std::expected<md5_digest, error> {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return std::unexpected(error{error_code::digest_error, "Failed to allocate digest context"});
    }

    md5_digest digest{ctx};
    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
        return std::unexpected(error{error_code::digest_error, "Failed to initialise MD5"});
    }
    return digest;
}

auto md5_digest::update(std::span<const std::byte> data) -> std::expected<void, error> {
    if (!context_) {
        return std::unexpected(error{error_code::invalid_operation, "Digest already finished"});
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(context_.get(), data.data(), data.size()) != 1) {
        return std::unexpected(error{error_code::digest_error, "MD5 update failed"});
    }
    return {};
}

auto md5_digest::finish() -> std::expected<std::string, error> {
    if (!context_) {
        return std::unexpected(error{error_code::invalid_operation, "Digest already finished"});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    const bool ok = EVP_DigestFinal_ex(context_.get(), md.data(), &md_len) == 1;
    context_.reset();
    if (!ok) {
        return std::unexpected(error{error_code::digest_error, "MD5 finalisation failed"});
    }

    std::string hex;
    hex.reserve(static_cast<size_t>(md_len) * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        hex += std::format("{:02x}", md[i]);
    }
    return hex;
}

auto md5_hex(std::span<const std::byte> data) -> std::expected<std::string, error> {
    auto digest = md5_digest::create();
    if (!digest) {
        return std::unexpected(digest.error());
    }
    if (auto result = digest->update(data); !result) {
        return std::unexpected(result.error());
    }
    return digest->finish();
}

} // namespace tierone::stash
