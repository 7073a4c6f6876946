#include "durable_store.hpp"

#include <sqlite3.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace reflux::storage {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

auto persistence_error(sqlite3* db, std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::Persistence,
                             fmt::format("{}: {}", what, db ? sqlite3_errmsg(db) : "no database handle"));
}

// Имя таблицы в двойных кавычках, кавычки внутри удваиваются
auto quote_ident(std::string_view name) -> std::string {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

auto exec(sqlite3* db, const std::string& sql) -> infra::VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string err = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                                                 fmt::format("'{}' failed: {}", sql, err)));
    }
    return {};
}

auto prepare(sqlite3* db, const std::string& sql) -> infra::Result<Statement> {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(persistence_error(db, fmt::format("Failed to prepare '{}'", sql)));
    }
    return Statement{raw};
}

auto bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value) -> infra::VoidResult {
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        return std::unexpected(persistence_error(db, "Failed to bind parameter"));
    }
    return {};
}

auto table_exists(sqlite3* db, std::string_view ns) -> infra::Result<bool> {
    auto stmt = prepare(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    if (!stmt) return std::unexpected(std::move(stmt.error()));

    if (auto res = bind_text(db, stmt->get(), 1, ns); !res) return std::unexpected(std::move(res.error()));
    auto rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    return std::unexpected(persistence_error(db, fmt::format("Failed to look up namespace '{}'", ns)));
}

auto namespace_missing(std::string_view ns) -> infra::Error {
    return infra::make_error(infra::ErrorCode::NamespaceMissing,
                             fmt::format("namespace '{}' not found", ns));
}

} // namespace

// =============== ReadTxn ===============

auto ReadTxn::for_each(std::string_view ns, const Visitor& visit) const -> infra::VoidResult {
    auto exists = table_exists(db_, ns);
    if (!exists) return std::unexpected(std::move(exists.error()));
    if (!*exists) return std::unexpected(namespace_missing(ns));

    auto stmt = prepare(db_, fmt::format("SELECT key, value FROM {};", quote_ident(ns)));
    if (!stmt) return std::unexpected(std::move(stmt.error()));

    int rc;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        const auto* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt->get(), 0));
        const int key_size = sqlite3_column_bytes(stmt->get(), 0);
        const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt->get(), 1));
        const int blob_size = sqlite3_column_bytes(stmt->get(), 1);

        auto res = visit(std::string_view(key ? key : "", static_cast<std::size_t>(key_size)),
                         std::string_view(blob ? blob : "", static_cast<std::size_t>(blob_size)));
        if (!res) return res;
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(persistence_error(db_, fmt::format("Failed to iterate '{}'", ns)));
    }
    return {};
}

auto ReadTxn::get(std::string_view ns, std::string_view key) const
    -> infra::Result<std::optional<std::string>>
{
    auto exists = table_exists(db_, ns);
    if (!exists) return std::unexpected(std::move(exists.error()));
    if (!*exists) return std::optional<std::string>{};

    auto stmt = prepare(db_, fmt::format("SELECT value FROM {} WHERE key = ?;", quote_ident(ns)));
    if (!stmt) return std::unexpected(std::move(stmt.error()));

    if (auto res = bind_text(db_, stmt->get(), 1, key); !res) return std::unexpected(std::move(res.error()));
    auto rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) return std::optional<std::string>{};
    if (rc != SQLITE_ROW) {
        return std::unexpected(persistence_error(db_, fmt::format("Failed to read '{}/{}'", ns, key)));
    }

    const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt->get(), 0));
    const int blob_size = sqlite3_column_bytes(stmt->get(), 0);
    return std::optional<std::string>{std::string(blob ? blob : "", static_cast<std::size_t>(blob_size))};
}

// =============== WriteTxn ===============

auto WriteTxn::put(std::string_view key, std::string_view value) -> infra::VoidResult {
    if (!present_) return std::unexpected(namespace_missing(ns_));

    auto stmt = prepare(db_, fmt::format("INSERT OR REPLACE INTO {} (key, value) VALUES (?, ?);", quote_ident(ns_)));
    if (!stmt) return std::unexpected(std::move(stmt.error()));

    if (auto res = bind_text(db_, stmt->get(), 1, key); !res) return res;
    if (sqlite3_bind_blob(stmt->get(), 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        return std::unexpected(persistence_error(db_, "Failed to bind value"));
    }
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
        return std::unexpected(persistence_error(db_, fmt::format("Failed to put '{}/{}'", ns_, key)));
    }
    return {};
}

auto WriteTxn::remove(std::string_view key) -> infra::VoidResult {
    if (!present_) return {};

    auto stmt = prepare(db_, fmt::format("DELETE FROM {} WHERE key = ?;", quote_ident(ns_)));
    if (!stmt) return std::unexpected(std::move(stmt.error()));

    if (auto res = bind_text(db_, stmt->get(), 1, key); !res) return res;
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
        return std::unexpected(persistence_error(db_, fmt::format("Failed to delete '{}/{}'", ns_, key)));
    }
    return {};
}

// =============== DurableStore ===============

DurableStore::DurableStore(sqlite3* db, std::filesystem::path path, const StoreOptions& options)
    : db_(db), path_(std::move(path)), options_(options) {}

DurableStore::~DurableStore() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

auto DurableStore::open(const std::filesystem::path& path, const StoreOptions& options)
    -> infra::Result<std::unique_ptr<DurableStore>>
{
    sqlite3* db = nullptr;
    auto rc = sqlite3_open_v2(path.c_str(), &db,
                              SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        auto err = infra::make_error(infra::ErrorCode::Persistence,
                                     fmt::format("Failed to open store ({}): {}", path.string(), sqlite3_errstr(rc)));
        sqlite3_close_v2(db);
        return std::unexpected(std::move(err));
    }

    // Дальше хэндлом владеет DurableStore, деструктор закроет его при ошибке
    std::unique_ptr<DurableStore> store(new DurableStore(db, path, options));

    if (sqlite3_busy_timeout(db, static_cast<int>(options.busy_timeout_ms)) != SQLITE_OK) {
        return std::unexpected(persistence_error(db, "Failed to set busy timeout"));
    }

    const char* journal = options.journal_mode == infra::JournalMode::Wal ? "WAL" : "DELETE";
    const char* sync = options.synchronous == infra::SyncLevel::Full ? "FULL" : "NORMAL";

    if (auto res = exec(db, fmt::format("PRAGMA journal_mode={};", journal)); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = exec(db, fmt::format("PRAGMA synchronous={};", sync)); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (options.exclusive) {
        if (auto res = exec(db, "PRAGMA locking_mode=EXCLUSIVE;"); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    spdlog::debug("Opened store {} (journal={}, synchronous={}, exclusive={})",
                  path.string(), journal, sync, options.exclusive);
    return store;
}

auto DurableStore::ensure_open_locked() const -> infra::VoidResult {
    if (!db_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                                                 fmt::format("store {} is closed", path_.string())));
    }
    return {};
}

auto DurableStore::table_exists_locked(std::string_view ns) const -> infra::Result<bool> {
    return table_exists(db_, ns);
}

auto DurableStore::ensure_namespaces(std::initializer_list<std::string_view> names) -> infra::VoidResult {
    std::lock_guard lock(mtx_);
    if (auto res = ensure_open_locked(); !res) return res;

    if (auto res = exec(db_, "BEGIN IMMEDIATE;"); !res) return res;

    for (auto name : names) {
        auto res = exec(db_, fmt::format(
            "CREATE TABLE IF NOT EXISTS {} (key TEXT PRIMARY KEY, value BLOB NOT NULL);", quote_ident(name)));
        if (!res) {
            (void)exec(db_, "ROLLBACK;");
            return res;
        }
    }

    if (auto res = exec(db_, "COMMIT;"); !res) {
        (void)exec(db_, "ROLLBACK;");
        return res;
    }
    return {};
}

auto DurableStore::has_namespace(std::string_view ns) const -> infra::Result<bool> {
    std::lock_guard lock(mtx_);
    if (auto res = ensure_open_locked(); !res) return std::unexpected(std::move(res.error()));
    return table_exists_locked(ns);
}

auto DurableStore::update(std::string_view ns, const WriteFn& fn) -> infra::VoidResult {
    std::lock_guard lock(mtx_);
    if (auto res = ensure_open_locked(); !res) return res;

    if (auto res = exec(db_, "BEGIN IMMEDIATE;"); !res) return res;

    auto present = table_exists_locked(ns);
    if (!present) {
        (void)exec(db_, "ROLLBACK;");
        return std::unexpected(std::move(present.error()));
    }

    WriteTxn tx(db_, ns, *present);
    if (auto res = fn(tx); !res) {
        (void)exec(db_, "ROLLBACK;");
        return res;
    }

    if (auto res = exec(db_, "COMMIT;"); !res) {
        (void)exec(db_, "ROLLBACK;");
        return res;
    }
    return {};
}

auto DurableStore::view(const ReadFn& fn) const -> infra::VoidResult {
    std::lock_guard lock(mtx_);
    if (auto res = ensure_open_locked(); !res) return res;

    if (auto res = exec(db_, "BEGIN;"); !res) return res;

    ReadTxn tx(db_);
    auto res = fn(tx);

    // Читающая транзакция ничего не меняет, поэтому при ошибке fn просто завершаем её
    auto end = exec(db_, res ? "COMMIT;" : "ROLLBACK;");
    if (!res) return res;
    return end;
}

auto DurableStore::flush() -> infra::VoidResult {
    std::lock_guard lock(mtx_);
    if (auto res = ensure_open_locked(); !res) return res;

    if (sqlite3_db_cacheflush(db_) != SQLITE_OK) {
        return std::unexpected(persistence_error(db_, "Failed to flush page cache"));
    }

    if (options_.journal_mode == infra::JournalMode::Wal) {
        auto rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_FULL, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            return std::unexpected(persistence_error(db_, "Failed to checkpoint WAL"));
        }
    }
    return {};
}

auto DurableStore::close() -> infra::VoidResult {
    std::lock_guard lock(mtx_);
    if (auto res = ensure_open_locked(); !res) return res;

    auto rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        return std::unexpected(persistence_error(db_, fmt::format("Failed to close store {}", path_.string())));
    }
    db_ = nullptr;
    spdlog::debug("Closed store {}", path_.string());
    return {};
}

auto DurableStore::is_open() const -> bool {
    std::lock_guard lock(mtx_);
    return db_ != nullptr;
}

} // namespace reflux::storage
