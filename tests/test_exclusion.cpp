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
#include <tierone/stash/exclusion.hpp>
#include <string>
#include <vector>

using namespace tierone::stash;

TEST_CASE("exclusion_filter matches glob patterns", "[unit][exclusion]") {
    const auto filter = exclusion_filter::parse("*.tmp,scratch/core.*");

    CHECK(filter.excluded("a.tmp"));
    CHECK(filter.excluded("deep/nested/b.tmp"));   // '*' crosses '/'
    CHECK(filter.excluded("scratch/core.1234"));
    CHECK_FALSE(filter.excluded("a.tmpx"));
    CHECK_FALSE(filter.excluded("other/core.1234"));
}

TEST_CASE("exclusion_filter treats a trailing slash as a subtree", "[unit][exclusion]") {
    const exclusion_filter filter{{"logs/"}};

    REQUIRE(filter.patterns().size() == 1);
    CHECK(filter.patterns().front() == "logs/*");

    CHECK(filter.excluded("logs/a.txt"));
    CHECK(filter.excluded("logs/sub/b.txt"));
    CHECK_FALSE(filter.excluded("logs_backup/a.txt"));
    CHECK_FALSE(filter.excluded("data/logs"));
}

TEST_CASE("exclusion_filter matches directories against subtree patterns", "[unit][exclusion]") {
    const auto filter = exclusion_filter::parse("secret/,build,*.cache");

    CHECK_FALSE(filter.excluded("secret"));
    CHECK(filter.excluded_directory("secret"));
    CHECK(filter.excluded_directory("build"));
    CHECK(filter.excluded_directory("deep/x.cache"));
    CHECK_FALSE(filter.excluded_directory("secrets"));
    CHECK_FALSE(filter.excluded_directory("public"));
}

TEST_CASE("exclusion_filter parse ignores empty items", "[unit][exclusion]") {
    SECTION("Empty list") {
        const auto filter = exclusion_filter::parse("");
        CHECK(filter.empty());
        CHECK_FALSE(filter.excluded("anything"));
    }

    SECTION("Stray commas") {
        const auto filter = exclusion_filter::parse(",*.o,,*.a,");
        REQUIRE(filter.patterns().size() == 2);
        CHECK(filter.patterns()[0] == "*.o");
        CHECK(filter.patterns()[1] == "*.a");
    }
}

TEST_CASE("exclusion_filter apply keeps order", "[unit][exclusion]") {
    const auto filter = exclusion_filter::parse("*.bak");
    const std::vector<std::string> paths{"z.txt", "b.bak", "a.txt", "m/c.bak", "m/d"};

    const auto kept = filter.apply(paths);
    CHECK(kept == std::vector<std::string>{"z.txt", "a.txt", "m/d"});

    CHECK(exclusion_filter{}.apply(paths) == paths);
}
