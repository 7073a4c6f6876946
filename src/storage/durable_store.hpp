#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

struct sqlite3;

namespace reflux::storage {

// Фиксированные пространства имён (таблицы) lock-файла
namespace ns {
inline constexpr std::string_view files = "Files";
inline constexpr std::string_view server = "Server";
inline constexpr std::string_view additional_data = "AdditionalData";
} // namespace ns

struct StoreOptions {
    infra::JournalMode journal_mode = infra::JournalMode::Delete;
    infra::SyncLevel synchronous = infra::SyncLevel::Full;
    std::uint32_t busy_timeout_ms = 5000;
    bool exclusive = true;
};

/// Чтение внутри транзакции DurableStore::view.
class ReadTxn {
public:
    using Visitor = std::function<infra::VoidResult(std::string_view key, std::string_view value)>;

    /// Обходит все записи пространства. NamespaceMissing, если таблицы нет.
    [[nodiscard]] auto for_each(std::string_view ns, const Visitor& visit) const -> infra::VoidResult;

    [[nodiscard]] auto get(std::string_view ns, std::string_view key) const
        -> infra::Result<std::optional<std::string>>;

private:
    friend class DurableStore;
    explicit ReadTxn(sqlite3* db) : db_(db) {}

    sqlite3* db_;
};

/// Изменения одного пространства внутри DurableStore::update.
class WriteTxn {
public:
    [[nodiscard]] auto put(std::string_view key, std::string_view value) -> infra::VoidResult;

    // Отсутствующее пространство: no-op
    [[nodiscard]] auto remove(std::string_view key) -> infra::VoidResult;

    [[nodiscard]] auto ns() const -> std::string_view { return ns_; }

private:
    friend class DurableStore;
    WriteTxn(sqlite3* db, std::string_view ns, bool present)
        : db_(db), ns_(ns), present_(present) {}

    sqlite3* db_;
    std::string_view ns_;
    bool present_;
};

/// Встроенное транзакционное хранилище ключ-значение поверх SQLite.
/// Каждое пространство имён это таблица (key TEXT PRIMARY KEY, value BLOB).
/// Все транзакции сериализуются на одном соединении.
class DurableStore {
public:
    using WriteFn = std::function<infra::VoidResult(WriteTxn&)>;
    using ReadFn = std::function<infra::VoidResult(const ReadTxn&)>;

    [[nodiscard]] static auto open(const std::filesystem::path& path, const StoreOptions& options = {})
        -> infra::Result<std::unique_ptr<DurableStore>>;

    ~DurableStore();

    DurableStore(const DurableStore&) = delete;
    DurableStore& operator=(const DurableStore&) = delete;

    [[nodiscard]] auto ensure_namespaces(std::initializer_list<std::string_view> names) -> infra::VoidResult;
    [[nodiscard]] auto has_namespace(std::string_view ns) const -> infra::Result<bool>;

    /// Атомарно применяет fn к пространству ns: либо все изменения, либо ни одного.
    [[nodiscard]] auto update(std::string_view ns, const WriteFn& fn) -> infra::VoidResult;

    [[nodiscard]] auto view(const ReadFn& fn) const -> infra::VoidResult;

    [[nodiscard]] auto flush() -> infra::VoidResult;
    [[nodiscard]] auto close() -> infra::VoidResult;

    [[nodiscard]] auto is_open() const -> bool;
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    DurableStore(sqlite3* db, std::filesystem::path path, const StoreOptions& options);

    [[nodiscard]] auto table_exists_locked(std::string_view ns) const -> infra::Result<bool>;
    [[nodiscard]] auto ensure_open_locked() const -> infra::VoidResult;

    sqlite3* db_;
    std::filesystem::path path_;
    StoreOptions options_;
    mutable std::mutex mtx_;
};

} // namespace reflux::storage
