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
#include <tierone/stash/archive_builder.hpp>
#include <tierone/stash/chunk_boundary.hpp>
#include <tierone/stash/chunk_reader.hpp>
#include "test_support.hpp"
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

using namespace tierone::stash;
using namespace stash_test;

namespace {

// Source tree, cache and index of one builder run
struct builder_fixture {
    TempDir tmp;
    session_config config;
    std::optional<index_store> index;
    recording_tier tier;
    failure_tracker failures;

    explicit builder_fixture(uint64_t maxsize, const std::string& cache = "cache") {
        config.path = tmp.make_dir("src");
        config.cache = tmp.make_dir(cache);
        config.maxsize = maxsize;
        open_index();
    }

    void open_index() {
        auto store = index_store::create(config.index_path());
        REQUIRE(store.has_value());
        index.emplace(std::move(*store));
    }

    std::expected<build_summary, error> build(const std::vector<std::string>& files, size_t block_size = 4096) {
        archive_session session{config, *index, tier, failures};
        archive_builder builder{session, block_size};
        return builder.add_files(files);
    }

    std::vector<file_record> records() {
        auto stored = index->records();
        REQUIRE(stored.has_value());
        return std::move(*stored);
    }

    void write(const std::string& name, size_t size, unsigned seed = 0) {
        tmp.write_sized_file("src/" + name, size, seed);
    }
};

std::vector<std::string> names_in(const std::vector<file_record>& records, const std::string& tar) {
    std::vector<std::string> names;
    for (const auto& record : records) {
        if (record.tar == tar) {
            names.push_back(record.name);
        }
    }
    return names;
}

} // anonymous namespace

TEST_CASE("archive_builder splits entries into size-bounded chunks", "[integration][builder]") {
    builder_fixture fx{10 * MiB};
    fx.write("file1", 6 * MiB, 1);
    fx.write("file2", 6 * MiB, 2);
    fx.write("file3", 1 * MiB, 3);

    auto summary = fx.build({"file1", "file2", "file3"});
    REQUIRE(summary.has_value());
    CHECK(summary->chunks == 2);
    CHECK(summary->records == 3);
    CHECK(summary->next_ordinal == 2);

    const auto records = fx.records();
    CHECK(names_in(records, "000000.tar") == std::vector<std::string>{"file1"});
    CHECK(names_in(records, "000001.tar") == std::vector<std::string>{"file2", "file3"});

    REQUIRE(fx.tier.puts.size() == 2);
    CHECK(fx.tier.puts[0].first == fx.config.cache_dir() / "000000.tar");
    CHECK(fx.tier.puts[1].first == fx.config.cache_dir() / "000001.tar");
    CHECK_FALSE(fx.tier.puts[0].second);

    CHECK(fx.failures.empty());
}

TEST_CASE("archive_builder gives oversized entries a chunk of their own", "[integration][builder]") {
    builder_fixture fx{1 * MiB};
    fx.write("small1", 100);
    fx.write("huge", 3 * MiB);
    fx.write("small2", 100);

    auto summary = fx.build({"small1", "huge", "small2"});
    REQUIRE(summary.has_value());
    CHECK(summary->chunks == 3);

    const auto records = fx.records();
    CHECK(names_in(records, "000000.tar") == std::vector<std::string>{"small1"});
    CHECK(names_in(records, "000001.tar") == std::vector<std::string>{"huge"});
    CHECK(names_in(records, "000002.tar") == std::vector<std::string>{"small2"});

    // Entries are never split across chunks
    for (const auto& record : records) {
        CHECK(record.size == (record.name == "huge" ? 3 * MiB : 100));
    }
}

TEST_CASE("archive_builder records entries at their digest location", "[integration][builder]") {
    builder_fixture fx{64 * 1024};
    fx.write("a.bin", 10000, 1);
    fx.write("b.bin", 70000, 2);
    fx.write("c.bin", 3, 3);
    fx.write("d.bin", 0);
    fx.tmp.make_dir("src/empty");
    fs::create_symlink("a.bin", fx.config.path / "link");

    auto summary = fx.build({"a.bin", "b.bin", "c.bin", "d.bin", "empty", "link"});
    REQUIRE(summary.has_value());
    CHECK(summary->records == 6);

    for (const auto& record : fx.records()) {
        auto reader = chunk_reader::from_file(fx.config.cache_dir() / record.tar);
        REQUIRE(reader.has_value());
        auto entry = reader->read_entry_at(record.offset);
        REQUIRE(entry.has_value());
        CHECK(entry->metadata.path == record.name);
        CHECK(entry->metadata.size == record.size);

        if (record.md5) {
            auto digest = reader->digest_entry_at(record.offset);
            REQUIRE(digest.has_value());
            CHECK(*digest == *record.md5);
        } else {
            CHECK_FALSE(entry->metadata.is_regular_file());
            CHECK(record.size == 0);
        }
    }
}

TEST_CASE("archive_builder isolates per-entry failures", "[integration][builder]") {
    builder_fixture fx{10 * MiB};
    fx.write("before.txt", 10);
    fx.write("after.txt", 20);

    auto summary = fx.build({"before.txt", "vanished.txt", "after.txt"});
    REQUIRE(summary.has_value());
    CHECK(summary->records == 2);
    CHECK(summary->chunks == 1);

    REQUIRE(fx.failures.size() == 1);
    CHECK(fx.failures.failures()[0].path == "vanished.txt");
    CHECK_FALSE(fx.failures.failures()[0].reason.empty());

    const auto records = fx.records();
    REQUIRE(records.size() == 2);
    CHECK(records[0].name == "before.txt");
    CHECK(records[1].name == "after.txt");
    CHECK(records[1].offset == 1024);
}

TEST_CASE("archive_builder aborts on transfer failure", "[integration][builder]") {
    builder_fixture fx{1 * MiB};
    fx.write("one", MiB, 1);
    fx.write("two", MiB, 2);
    fx.write("three", MiB, 3);
    fx.tier.fail_put_at = 1;

    auto summary = fx.build({"one", "two", "three"});
    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == error_code::transfer_error);

    // Only the chunk transferred before the fault is indexed
    const auto records = fx.records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].name == "one");
    CHECK(records[0].tar == "000000.tar");

    CHECK(fx.tier.puts.size() == 1);
    CHECK_FALSE(fs::exists(fx.config.cache_dir() / "000002.tar"));
}

TEST_CASE("archive_builder aborts when the index cannot be written", "[integration][builder]") {
    builder_fixture fx{1 * MiB};
    fx.write("one", MiB, 1);
    fx.write("two", MiB, 2);
    fx.write("three", MiB, 3);

    // Once the second chunk is transferred, another connection takes the
    // database lock so that chunk's commit fails
    sqlite3* other = nullptr;
    fx.tier.after_put = [&](const fs::path& file) {
        if (file.filename() != "000001.tar") {
            return;
        }
        REQUIRE(sqlite3_open(fx.config.index_path().c_str(), &other) == SQLITE_OK);
        REQUIRE(sqlite3_exec(other, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr) == SQLITE_OK);
    };

    auto summary = fx.build({"one", "two", "three"});

    REQUIRE(other != nullptr);
    CHECK(sqlite3_exec(other, "ROLLBACK", nullptr, nullptr, nullptr) == SQLITE_OK);
    CHECK(sqlite3_close(other) == SQLITE_OK);

    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == error_code::index_error);

    // The first chunk's records survive; nothing after the fault is built
    const auto records = fx.records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].name == "one");
    CHECK(records[0].tar == "000000.tar");

    CHECK(fx.tier.puts.size() == 2);
    CHECK_FALSE(fs::exists(fx.config.cache_dir() / "000002.tar"));
}

TEST_CASE("archive_builder numbers chunks from the given ordinal", "[integration][builder]") {
    builder_fixture fx{10 * MiB};
    fx.write("x", 5);

    archive_session session{fx.config, *fx.index, fx.tier, fx.failures};
    archive_builder builder{session};
    auto summary = builder.add_files({"x"}, 0x2a);
    REQUIRE(summary.has_value());
    CHECK(summary->next_ordinal == 0x2b);
    CHECK(fs::exists(fx.config.cache_dir() / "00002a.tar"));
}

TEST_CASE("archive_builder with nothing to archive", "[integration][builder]") {
    builder_fixture fx{10 * MiB};

    auto summary = fx.build({});
    REQUIRE(summary.has_value());
    CHECK(summary->chunks == 0);
    CHECK(summary->records == 0);
    CHECK(fx.tier.puts.empty());
}

TEST_CASE("archive_builder output is deterministic", "[integration][builder]") {
    builder_fixture first{100 * 1024, "cache_a"};
    for (int i = 0; i < 8; ++i) {
        first.write("f" + std::to_string(i), 30000 + static_cast<size_t>(i) * 1000, static_cast<unsigned>(i));
    }
    const std::vector<std::string> files{"f0", "f1", "f2", "f3", "f4", "f5", "f6", "f7"};

    // Same source tree, different cache and copy block size
    session_config second_config = first.config;
    second_config.cache = first.tmp.make_dir("cache_b");
    auto second_index = index_store::create(second_config.index_path());
    REQUIRE(second_index.has_value());
    recording_tier second_tier;
    failure_tracker second_failures;

    auto a = first.build(files);
    REQUIRE(a.has_value());

    archive_session session{second_config, *second_index, second_tier, second_failures};
    archive_builder builder{session, 1000};
    auto b = builder.add_files(files);
    REQUIRE(b.has_value());

    REQUIRE(a->chunks == b->chunks);
    for (uint64_t ordinal = 0; ordinal < a->chunks; ++ordinal) {
        const auto name = chunk_name(ordinal);
        CHECK(read_file(first.config.cache_dir() / name) == read_file(second_config.cache_dir() / name));
    }

    auto second_records = second_index->records();
    REQUIRE(second_records.has_value());
    CHECK(first.records() == *second_records);
}

TEST_CASE("measure_entry", "[unit][builder]") {
    TempDir tmp;
    const auto file = tmp.write_file("f", "12345");
    tmp.make_dir("d");
    fs::create_symlink("f", tmp.path() / "l");

    CHECK(measure_entry(file) == 5);
    CHECK(measure_entry(tmp.path() / "d") == 0);
    CHECK(measure_entry(tmp.path() / "l") == 0);
    CHECK(measure_entry(tmp.path() / "missing") == 0);
}
