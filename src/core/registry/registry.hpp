#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/codec/codec.hpp"
#include "infra/error_handler/error.hpp"
#include "storage/durable_store.hpp"

namespace reflux::core {

// Общий контракт реестров, который нужен TransferManager при восстановлении
class RegistryBase {
public:
    virtual ~RegistryBase() = default;

    /// Загружает всё пространство в память. Только при восстановлении.
    [[nodiscard]] virtual auto load_all(const storage::ReadTxn& tx) -> infra::VoidResult = 0;

    /// Перезаписывает каждую запись из памяти (транзакция на ключ), затем flush.
    [[nodiscard]] virtual auto sync() -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto size() const -> std::size_t = 0;
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Потокобезопасное отображение в памяти поверх одного пространства DurableStore.
/// Запись сначала идёт в хранилище и только после успешного коммита в память.
/// Писатели сериализованы write_mutex_, поэтому порядок в памяти совпадает
/// с порядком коммитов.
template<typename Record, typename Codec = codec::YamlCodec<Record>>
class Registry : public RegistryBase {
public:
    Registry(storage::DurableStore& store, std::string_view ns)
        : store_(store), ns_(ns) {}

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    [[nodiscard]] auto store_or_update(const std::string& key, const Record& record) -> infra::VoidResult {
        std::lock_guard write_lock(write_mutex_);
        return persist_locked(key, record);
    }

    [[nodiscard]] auto load(const std::string& key) const -> std::optional<Record> {
        std::shared_lock lock(map_mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return Codec::copy(it->second);
    }

    [[nodiscard]] auto remove(const std::string& key) -> infra::VoidResult {
        std::lock_guard write_lock(write_mutex_);

        // Сначала диск: после рестарта удалённая запись не должна воскреснуть
        auto res = store_.update(ns_, [&](storage::WriteTxn& tx) { return tx.remove(key); });
        if (!res) {
            return res;
        }

        std::unique_lock lock(map_mutex_);
        entries_.erase(key);
        return {};
    }

    [[nodiscard]] auto exists(const std::string& key) const -> bool {
        std::shared_lock lock(map_mutex_);
        return entries_.contains(key);
    }

    /// Снимок всех записей. NotFound, если реестр пуст.
    [[nodiscard]] auto get_all() const -> infra::Result<std::vector<Record>> {
        std::vector<Record> records;
        {
            std::shared_lock lock(map_mutex_);
            records.reserve(entries_.size());
            for (const auto& [key, record] : entries_) {
                records.push_back(Codec::copy(record));
            }
        }
        if (records.empty()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                                   fmt::format("no records found in '{}'", ns_)));
        }
        return records;
    }

    [[nodiscard]] auto keys() const -> std::vector<std::string> {
        std::shared_lock lock(map_mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& [key, record] : entries_) {
            result.push_back(key);
        }
        return result;
    }

    // Вызывается под блокировкой хранилища, поэтому write_mutex_ здесь не берётся
    [[nodiscard]] auto load_all(const storage::ReadTxn& tx) -> infra::VoidResult override {
        std::size_t loaded = 0;

        auto res = tx.for_each(ns_, [&](std::string_view key, std::string_view value) -> infra::VoidResult {
            auto record = Codec::decode(value);
            if (!record) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                                       fmt::format("'{}/{}': {}", ns_, key, record.error().message)));
            }
            std::unique_lock lock(map_mutex_);
            entries_.insert_or_assign(std::string(key), std::move(*record));
            ++loaded;
            return {};
        });
        if (!res) {
            return res;
        }

        spdlog::debug("Loaded {} record(s) from '{}'", loaded, ns_);
        return {};
    }

    [[nodiscard]] auto sync() -> infra::VoidResult override {
        // Не атомарно по всем ключам: каждая запись своя транзакция и повтор безопасен
        for (const auto& key : keys()) {
            std::lock_guard write_lock(write_mutex_);
            auto current = load(key);
            if (!current) {
                continue; // удалена во время обхода
            }
            if (auto res = persist_locked(key, *current); !res) {
                return res;
            }
        }
        return store_.flush();
    }

    [[nodiscard]] auto size() const -> std::size_t override {
        std::shared_lock lock(map_mutex_);
        return entries_.size();
    }

    [[nodiscard]] auto name() const -> std::string_view override { return ns_; }

protected:
    /// Атомарное чтение-изменение-запись одной записи. NotFound, если ключа нет.
    template<typename Mutate>
    [[nodiscard]] auto modify(const std::string& key, Mutate&& mutate) -> infra::VoidResult {
        std::lock_guard write_lock(write_mutex_);
        auto current = load(key);
        if (!current) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                                   fmt::format("'{}' key not found in '{}'", key, ns_)));
        }
        mutate(*current);
        return persist_locked(key, *current);
    }

private:
    // Требует write_mutex_
    [[nodiscard]] auto persist_locked(const std::string& key, const Record& record) -> infra::VoidResult {
        auto bytes = Codec::encode(record);
        if (!bytes) {
            return std::unexpected(std::move(bytes.error()));
        }

        auto res = store_.update(ns_, [&](storage::WriteTxn& tx) { return tx.put(key, *bytes); });
        if (!res) {
            return res;
        }

        std::unique_lock lock(map_mutex_);
        entries_.insert_or_assign(key, Codec::copy(record));
        return {};
    }

    storage::DurableStore& store_;
    std::string_view ns_;
    std::unordered_map<std::string, Record> entries_;
    mutable std::shared_mutex map_mutex_;
    std::mutex write_mutex_;
};

} // namespace reflux::core
