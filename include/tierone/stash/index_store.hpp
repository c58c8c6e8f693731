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

#include <tierone/stash/config.hpp>
#include <tierone/stash/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace tierone::stash {

// One archived entry as stored in the files table
struct file_record {
    int64_t id = 0;                  // Assigned by the store
    std::string name;
    uint64_t size = 0;
    std::string mtime;               // UTC, "YYYY-MM-DD HH:MM:SS"
    std::optional<std::string> md5;  // Absent for directories, links and special files
    std::string tar;                 // Chunk file name
    uint64_t offset = 0;

    bool operator==(const file_record&) const = default;
};

// Timestamp text used for the mtime column
[[nodiscard]] std::string format_index_time(std::chrono::system_clock::time_point time);

class index_store;

// Open write transaction. Rolls back on destruction unless committed.
class index_transaction {
private:
    sqlite3* db_ = nullptr;

    explicit index_transaction(sqlite3* db) : db_(db) {}
    friend class index_store;

public:
    index_transaction(const index_transaction&) = delete;
    index_transaction& operator=(const index_transaction&) = delete;
    index_transaction(index_transaction&& other) noexcept : db_(std::exchange(other.db_, nullptr)) {}
    index_transaction& operator=(index_transaction&& other) noexcept;
    ~index_transaction();

    [[nodiscard]] std::expected<void, error> commit();
    void rollback() noexcept;

    [[nodiscard]] bool active() const noexcept { return db_ != nullptr; }
};

// SQLite database holding the session config and the file records.
// Nothing guarantees path uniqueness in the files table: rerunning a session
// against the same index would add a second row for the same name.
class index_store {
private:
    struct db_deleter {
        void operator()(sqlite3* db) const;
    };

    std::unique_ptr<sqlite3, db_deleter> db_;
    std::filesystem::path path_;

    index_store(sqlite3* db, std::filesystem::path path);

    [[nodiscard]] std::expected<void, error> execute(const char* sql);

public:
    // Create a fresh index at path, replacing any existing file
    [[nodiscard]] static std::expected<index_store, error> create(const std::filesystem::path& path);

    // Open an existing index
    [[nodiscard]] static std::expected<index_store, error> open(
        const std::filesystem::path& path, bool read_only = false);

    [[nodiscard]] std::expected<void, error> write_config(const session_config& config);
    [[nodiscard]] std::expected<std::map<std::string, std::string>, error> read_config();

    [[nodiscard]] std::expected<index_transaction, error> begin();

    // Insert inside an open transaction
    [[nodiscard]] std::expected<void, error> insert_records(
        index_transaction& transaction, std::span<const file_record> records);

    // Insert all records in a single transaction
    [[nodiscard]] std::expected<void, error> commit_records(std::span<const file_record> records);

    // All records in insertion order
    [[nodiscard]] std::expected<std::vector<file_record>, error> records();
    [[nodiscard]] std::expected<size_t, error> record_count();

    // Close the database; further calls fail
    [[nodiscard]] std::expected<void, error> close();

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
};

} // namespace tierone::stash
