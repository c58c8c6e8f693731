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

#include <catch2/catch_test_macros.hpp>
#include <tierone/stash/session.hpp>
#include <tierone/stash/index_store.hpp>
#include <tierone/stash/verifier.hpp>
#include "test_support.hpp"
#include <cstdio>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace tierone::stash;
using namespace stash_test;

namespace {

std::vector<file_record> index_records(const fs::path& db_path) {
    auto store = index_store::open(db_path, true);
    REQUIRE(store.has_value());
    auto records = store->records();
    REQUIRE(records.has_value());
    return std::move(*records);
}

std::vector<std::string> record_names(const std::vector<file_record>& records) {
    std::vector<std::string> names;
    for (const auto& record : records) {
        names.push_back(record.name);
    }
    return names;
}

// Overwrite one byte of a file in place
void patch_byte(const fs::path& file, uint64_t offset, char value) {
    std::FILE* f = std::fopen(file.c_str(), "r+b");
    REQUIRE(f != nullptr);
    REQUIRE(std::fseek(f, static_cast<long>(offset), SEEK_SET) == 0);
    REQUIRE(std::fputc(value, f) != EOF);
    REQUIRE(std::fclose(f) == 0);
}

// Bound unix socket left on disk; the descriptor is closed right away
void make_socket(const fs::path& path) {
    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string text = path.string();
    REQUIRE(text.size() < sizeof(addr.sun_path));
    text.copy(addr.sun_path, text.size());
    const int rc = ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    ::close(fd);
    REQUIRE(rc == 0);
}

} // anonymous namespace

TEST_CASE("create_archive builds chunks and an index", "[integration][session]") {
    TempDir tmp;
    tmp.write_file("a.txt", "alpha");
    tmp.write_file("sub/b.txt", "bravo");
    tmp.make_dir("empty");

    session_config config;
    config.path = tmp.path();
    recording_tier tier;

    auto report = create_archive(config, tier);
    REQUIRE(report.has_value());
    CHECK(report->chunks == 1);
    CHECK(report->records == 3);
    CHECK_FALSE(report->has_failures());
    CHECK(tier.prepare_calls == 1);

    // Chunks first, then the index, whose local copy is kept
    REQUIRE(tier.puts.size() == 2);
    CHECK(tier.puts[0].first == config.cache_dir() / "000000.tar");
    CHECK(tier.puts[1].first == config.index_path());
    CHECK(tier.puts[1].second);

    const auto records = index_records(config.index_path());
    CHECK(record_names(records) == std::vector<std::string>{"a.txt", "empty", "sub/b.txt"});
    CHECK(records[1].size == 0);
    CHECK_FALSE(records[1].md5.has_value());
    CHECK(records[0].md5 == std::optional<std::string>{"2c1743a391305fbf367df8e4f069f9f9"});

    auto store = index_store::open(config.index_path(), true);
    REQUIRE(store.has_value());
    auto entries = store->read_config();
    REQUIRE(entries.has_value());
    CHECK(entries->at("path") == tmp.path().string());
    CHECK(entries->at("hpss") == "none");
    CHECK(entries->at("maxsize") == std::to_string(DEFAULT_MAX_CHUNK_SIZE));
}

TEST_CASE("create_archive honours exclusion patterns", "[integration][session]") {
    TempDir tmp;
    tmp.write_file("keep.dat", "k");
    tmp.write_file("debug.log", "l");
    tmp.write_file("scratch/tmp1", "t");
    tmp.write_file("scratch/tmp2", "t");

    session_config config;
    config.path = tmp.path();
    recording_tier tier;

    auto report = create_archive(config, tier, "*.log,scratch/");
    REQUIRE(report.has_value());
    CHECK(record_names(index_records(config.index_path())) == std::vector<std::string>{"keep.dat"});
}

TEST_CASE("create_archive with an external cache", "[integration][session]") {
    TempDir source;
    TempDir staging;
    source.write_file("x.txt", "x");

    session_config config;
    config.path = source.path();
    config.cache = staging.path() / "cache";
    recording_tier tier;

    auto report = create_archive(config, tier);
    REQUIRE(report.has_value());
    CHECK(fs::exists(staging.path() / "cache" / "index.db"));
    CHECK_FALSE(fs::exists(source.path() / "stash"));
}

TEST_CASE("create_archive reports entries it cannot archive", "[integration][session]") {
    TempDir tmp;
    tmp.write_file("good.txt", "good");
    make_socket(tmp.path() / "sock");

    session_config config;
    config.path = tmp.path();
    recording_tier tier;

    auto report = create_archive(config, tier);
    REQUIRE(report.has_value());
    REQUIRE(report->has_failures());
    REQUIRE(report->failures.size() == 1);
    CHECK(report->failures[0].path == "sock");
    CHECK(record_names(index_records(config.index_path())) == std::vector<std::string>{"good.txt"});
}

TEST_CASE("create_archive skips excluded unreadable directories", "[integration][session]") {
    TempDir tmp;
    tmp.write_file("open.txt", "o");
    tmp.write_file("secret/key.pem", "k");
    const fs::path locked = tmp.path() / "secret";

    fs::permissions(locked, fs::perms::none);
    std::error_code ec;
    fs::directory_iterator listing{locked, ec};
    if (!ec) {
        fs::permissions(locked, fs::perms::owner_all);
        SKIP("Directory permissions are not enforced for this user");
    }

    session_config config;
    config.path = tmp.path();
    recording_tier tier;

    auto unfiltered = create_archive(config, tier);
    auto filtered = create_archive(config, tier, "secret/");
    fs::permissions(locked, fs::perms::owner_all);

    REQUIRE(unfiltered.has_value());
    REQUIRE(unfiltered->failures.size() == 1);
    CHECK(unfiltered->failures[0].path == "secret");

    REQUIRE(filtered.has_value());
    CHECK_FALSE(filtered->has_failures());
    CHECK(record_names(index_records(config.index_path())) == std::vector<std::string>{"open.txt"});
}

TEST_CASE("create_archive setup errors", "[integration][session]") {
    TempDir tmp;
    session_config config;
    config.path = tmp.path();
    recording_tier tier;

    SECTION("Relative source path") {
        config.path = "relative/dir";
        auto report = create_archive(config, tier);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::setup_error);
        CHECK(tier.prepare_calls == 0);
    }

    SECTION("Source is a file") {
        config.path = tmp.write_file("file.txt", "x");
        auto report = create_archive(config, tier);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::setup_error);
    }

    SECTION("Zero chunk size") {
        config.maxsize = 0;
        auto report = create_archive(config, tier);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::setup_error);
    }

    SECTION("Remote destination not empty") {
        tier.fail_prepare = true;
        auto report = create_archive(config, tier);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::setup_error);
        CHECK_FALSE(fs::exists(config.cache_dir()));
    }

    CHECK(tier.puts.empty());
}

TEST_CASE("create_archive stops on transfer failure", "[integration][session]") {
    TempDir tmp;
    tmp.write_sized_file("one", 2048, 1);
    tmp.write_sized_file("two", 2048, 2);

    session_config config;
    config.path = tmp.path();
    config.maxsize = 2048;
    recording_tier tier;
    tier.fail_put_at = 1;

    auto report = create_archive(config, tier);
    REQUIRE_FALSE(report.has_value());
    CHECK(report.error().code() == error_code::transfer_error);

    // The index was never shipped, but its local copy holds the first chunk
    REQUIRE(tier.puts.size() == 1);
    CHECK(record_names(index_records(config.index_path())) == std::vector<std::string>{"one"});
}

TEST_CASE("verify_archive re-reads recorded digests", "[integration][session][verify]") {
    TempDir tmp;
    tmp.write_file("a.txt", "alpha");
    tmp.write_file("b.txt", "bravo");
    tmp.make_dir("empty");

    session_config config;
    config.path = tmp.path();
    recording_tier tier;
    REQUIRE(create_archive(config, tier).has_value());

    SECTION("Intact archive") {
        auto report = verify_archive(config.cache_dir());
        REQUIRE(report.has_value());
        CHECK(report->ok());
        CHECK(report->verified == 2);
        CHECK(report->without_digest == 1);
        CHECK(report->skipped == 0);
    }

    SECTION("Corrupted content") {
        const auto records = index_records(config.index_path());
        patch_byte(config.cache_dir() / records[1].tar, records[1].offset + 512, 'X');

        auto report = verify_archive(config.cache_dir());
        REQUIRE(report.has_value());
        CHECK_FALSE(report->ok());
        REQUIRE(report->mismatches.size() == 1);
        CHECK(report->mismatches[0].name == "b.txt");
        CHECK(report->verified == 1);
    }

    SECTION("Chunk no longer cached") {
        fs::remove(config.cache_dir() / "000000.tar");

        auto report = verify_archive(config.cache_dir());
        REQUIRE(report.has_value());
        CHECK(report->ok());
        CHECK(report->skipped == 2);
        CHECK(report->missing_chunks == std::vector<std::string>{"000000.tar"});
    }

    SECTION("No index") {
        auto report = verify_archive(tmp.path() / "elsewhere");
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::index_error);
    }
}
