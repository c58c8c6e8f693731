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
#include <tierone/stash/enumerator.hpp>
#include "test_support.hpp"
#include <string>
#include <vector>

using namespace tierone::stash;
using namespace stash_test;

TEST_CASE("enumerate_files lists files in walk order", "[unit][enumerator]") {
    TempDir tmp;
    tmp.write_file("b.txt", "b");
    tmp.write_file("a.txt", "a");
    tmp.write_file("sub/z.txt", "z");
    tmp.write_file("sub/deeper/y.txt", "y");
    tmp.write_file("c/x.txt", "x");

    auto result = enumerate_files(tmp.path());
    REQUIRE(result.has_value());
    CHECK(result->errors.empty());

    // Sorted by (directory, name): root files first, then each subdirectory
    const std::vector<std::string> expected{
        "a.txt", "b.txt", "c/x.txt", "sub/z.txt", "sub/deeper/y.txt"};
    CHECK(result->entries == expected);
}

TEST_CASE("enumerate_files keeps empty directories", "[unit][enumerator]") {
    TempDir tmp;
    tmp.make_dir("empty");
    tmp.make_dir("parent/leaf");
    tmp.write_file("file.txt", "data");

    auto result = enumerate_files(tmp.path());
    REQUIRE(result.has_value());

    const std::vector<std::string> expected{"file.txt", "empty", "parent/leaf"};
    CHECK(result->entries == expected);
}

TEST_CASE("enumerate_files on an empty root", "[unit][enumerator]") {
    TempDir tmp;

    auto result = enumerate_files(tmp.path());
    REQUIRE(result.has_value());
    CHECK(result->entries == std::vector<std::string>{"."});
}

TEST_CASE("enumerate_files skips the excluded directory", "[unit][enumerator]") {
    TempDir tmp;
    tmp.write_file("keep.txt", "k");
    tmp.write_file("stash/index.db", "i");
    tmp.write_file("stash/000000.tar", "t");

    SECTION("Relative exclusion") {
        auto result = enumerate_files(tmp.path(), fs::path{"stash"});
        REQUIRE(result.has_value());
        CHECK(result->entries == std::vector<std::string>{"keep.txt"});
    }

    SECTION("Absolute exclusion with trailing slash") {
        auto result = enumerate_files(tmp.path(), fs::path{(tmp.path() / "stash").string() + "/"});
        REQUIRE(result.has_value());
        CHECK(result->entries == std::vector<std::string>{"keep.txt"});
    }
}

TEST_CASE("enumerate_files lists directory symlinks as entries", "[unit][enumerator]") {
    TempDir tmp;
    tmp.write_file("real/f.txt", "f");
    fs::create_directory_symlink("real", tmp.path() / "alias");

    auto result = enumerate_files(tmp.path());
    REQUIRE(result.has_value());

    const std::vector<std::string> expected{"alias", "real/f.txt"};
    CHECK(result->entries == expected);
}

TEST_CASE("enumerate_files fails when the root is missing", "[unit][enumerator]") {
    TempDir tmp;
    auto result = enumerate_files(tmp.path() / "absent");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::io_error);
}
