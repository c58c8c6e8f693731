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

#include <tierone/stash/index_store.hpp>
#include <tierone/stash/log.hpp>
#include <format>

#include <sqlite3.h>

namespace tierone::stash {

namespace {

struct statement_deleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) sqlite3_finalize(stmt);
    }
};

using statement = std::unique_ptr<sqlite3_stmt, statement_deleter>;

error sqlite_error(sqlite3* db, const std::string& what) {
    return error{error_code::index_error, what + ": " + (db ? sqlite3_errmsg(db) : "out of memory")};
}

std::expected<statement, error> prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqlite_error(db, "Failed to prepare statement"));
    }
    return statement{raw};
}

std::string column_text(sqlite3_stmt* stmt, const int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? std::string{reinterpret_cast<const char*>(text)} : std::string{};
}

constexpr const char* CREATE_CONFIG_TABLE = R"(
create table config (
  arg text primary key,
  value text
);)";

constexpr const char* CREATE_FILES_TABLE = R"(
create table files (
  id integer primary key,
  name text,
  size integer,
  mtime timestamp,
  md5 text,
  tar text,
  offset integer
);)";

} // anonymous namespace

std::string format_index_time(const std::chrono::system_clock::time_point time) {
    return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::seconds>(time));
}

// index_transaction implementation
index_transaction& index_transaction::operator=(index_transaction&& other) noexcept {
    if (this != &other) {
        rollback();
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

index_transaction::~index_transaction() {
    rollback();
}

auto index_transaction::commit() -> std::expected<void, error> {
    if (!db_) {
        return std::unexpected(error{error_code::invalid_operation, "No active transaction"});
    }
    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        auto err = sqlite_error(db_, "Failed to commit transaction");
        rollback();
        return std::unexpected(std::move(err));
    }
    db_ = nullptr;
    return {};
}

void index_transaction::rollback() noexcept {
    if (!db_) {
        return;
    }
    sqlite3* db = std::exchange(db_, nullptr);
    // SQLite may already have rolled back on its own after a failed statement
    if (sqlite3_get_autocommit(db) == 0 &&
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
        log::error("Index rollback failed: {}", sqlite3_errmsg(db));
    }
}

// index_store implementation
void index_store::db_deleter::operator()(sqlite3* db) const {
    if (db) sqlite3_close(db);
}

index_store::index_store(sqlite3* db, std::filesystem::path path)
    : db_(db), path_(std::move(path)) {}

auto index_store::execute(const char* sql) -> std::expected<void, error> {
    if (!db_) {
        return std::unexpected(error{error_code::invalid_operation, "Index is closed"});
    }
    char* message = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string text = message ? message : "unknown failure";
        sqlite3_free(message);
        return std::unexpected(error{error_code::index_error, "Index statement failed: " + text});
    }
    return {};
}

auto index_store::create(const std::filesystem::path& path) -> std::expected<index_store, error> {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(error{error_code::index_error,
            "Cannot remove existing index " + path.string() + ": " + ec.message()});
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    index_store store{raw, path};
    if (rc != SQLITE_OK) {
        return std::unexpected(sqlite_error(raw, "Cannot create index " + path.string()));
    }

    if (auto result = store.execute(CREATE_CONFIG_TABLE); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = store.execute(CREATE_FILES_TABLE); !result) {
        return std::unexpected(result.error());
    }
    return store;
}

auto index_store::open(const std::filesystem::path& path, const bool read_only) -> std::expected<index_store, error> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(error{error_code::index_error, "Index not found: " + path.string()});
    }

    sqlite3* raw = nullptr;
    const int flags = read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    index_store store{raw, path};
    if (rc != SQLITE_OK) {
        return std::unexpected(sqlite_error(raw, "Cannot open index " + path.string()));
    }
    return store;
}

auto index_store::write_config(const session_config& config) -> std::expected<void, error> {
    auto transaction = begin();
    if (!transaction) {
        return std::unexpected(transaction.error());
    }

    auto stmt = prepare(db_.get(), "insert into config values (?,?)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    for (const auto& [key, value] : config.to_entries()) {
        sqlite3_stmt* s = stmt->get();
        if (sqlite3_bind_text(s, 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_bind_text(s, 2, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_step(s) != SQLITE_DONE ||
            sqlite3_reset(s) != SQLITE_OK) {
            return std::unexpected(sqlite_error(db_.get(), "Failed to store config " + key));
        }
    }

    return transaction->commit();
}

auto index_store::read_config() -> std::expected<std::map<std::string, std::string>, error> {
    if (!db_) {
        return std::unexpected(error{error_code::invalid_operation, "Index is closed"});
    }

    auto stmt = prepare(db_.get(), "select arg, value from config");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    std::map<std::string, std::string> entries;
    int rc;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        entries.emplace(column_text(stmt->get(), 0), column_text(stmt->get(), 1));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(db_.get(), "Failed to read config"));
    }
    return entries;
}

auto index_store::begin() -> std::expected<index_transaction, error> {
    if (!db_) {
        return std::unexpected(error{error_code::invalid_operation, "Index is closed"});
    }
    if (sqlite3_exec(db_.get(), "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return std::unexpected(sqlite_error(db_.get(), "Failed to begin transaction"));
    }
    return index_transaction{db_.get()};
}

auto index_store::insert_records(
    index_transaction& transaction,
    std::span<const file_record> records
) -> std::expected<void, error> {
    if (!transaction.active() || transaction.db_ != db_.get()) {
        return std::unexpected(error{error_code::invalid_operation, "Transaction does not belong to this index"});
    }

    auto stmt = prepare(db_.get(), "insert into files values (NULL,?,?,?,?,?,?)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    for (const auto& record : records) {
        sqlite3_stmt* s = stmt->get();
        const int md5_rc = record.md5
            ? sqlite3_bind_text(s, 4, record.md5->c_str(), -1, SQLITE_TRANSIENT)
            : sqlite3_bind_null(s, 4);

        if (sqlite3_bind_text(s, 1, record.name.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_bind_int64(s, 2, static_cast<sqlite3_int64>(record.size)) != SQLITE_OK ||
            sqlite3_bind_text(s, 3, record.mtime.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            md5_rc != SQLITE_OK ||
            sqlite3_bind_text(s, 5, record.tar.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_bind_int64(s, 6, static_cast<sqlite3_int64>(record.offset)) != SQLITE_OK ||
            sqlite3_step(s) != SQLITE_DONE ||
            sqlite3_reset(s) != SQLITE_OK) {
            return std::unexpected(sqlite_error(db_.get(), "Failed to insert record for " + record.name));
        }
    }

    return {};
}

auto index_store::commit_records(std::span<const file_record> records) -> std::expected<void, error> {
    auto transaction = begin();
    if (!transaction) {
        return std::unexpected(transaction.error());
    }
    if (auto result = insert_records(*transaction, records); !result) {
        return result;
    }
    return transaction->commit();
}

auto index_store::records() -> std::expected<std::vector<file_record>, error> {
    if (!db_) {
        return std::unexpected(error{error_code::invalid_operation, "Index is closed"});
    }

    auto stmt = prepare(db_.get(), "select id, name, size, mtime, md5, tar, offset from files order by id");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    std::vector<file_record> result;
    int rc;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt->get();
        file_record record;
        record.id = sqlite3_column_int64(s, 0);
        record.name = column_text(s, 1);
        record.size = static_cast<uint64_t>(sqlite3_column_int64(s, 2));
        record.mtime = column_text(s, 3);
        if (sqlite3_column_type(s, 4) != SQLITE_NULL) {
            record.md5 = column_text(s, 4);
        }
        record.tar = column_text(s, 5);
        record.offset = static_cast<uint64_t>(sqlite3_column_int64(s, 6));
        result.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(db_.get(), "Failed to read records"));
    }
    return result;
}

auto index_store::record_count() -> std::expected<size_t, error> {
    if (!db_) {
        return std::unexpected(error{error_code::invalid_operation, "Index is closed"});
    }

    auto stmt = prepare(db_.get(), "select count(*) from files");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
        return std::unexpected(sqlite_error(db_.get(), "Failed to count records"));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt->get(), 0));
}

auto index_store::close() -> std::expected<void, error> {
    if (!db_) {
        return {};
    }
    sqlite3* db = db_.release();
    if (sqlite3_close(db) != SQLITE_OK) {
        auto err = sqlite_error(db, "Failed to close index");
        // Deferred close, completes once outstanding statements are finalized
        static_cast<void>(sqlite3_close_v2(db));
        return std::unexpected(std::move(err));
    }
    return {};
}

} // namespace tierone::stash
