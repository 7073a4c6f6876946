#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

#include "core/executor/executor.hpp"
#include "core/records/connection_params.hpp"
#include "core/registry/attribute_registry.hpp"
#include "core/registry/transfer_registry.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "storage/durable_store.hpp"

namespace reflux::core {

enum class ManagerState {
    Fresh,         // lock-файла не было
    Recovering,    // lock-файл остался от прошлого запуска, идёт загрузка
    Ready,
    ShuttingDown,
    Closed,
};

[[nodiscard]] auto to_string(ManagerState state) -> std::string_view;

/// Путь lock-файла: <work_dir>/.<lock_name>.lock (по умолчанию ./.<имя бинарника>.lock).
[[nodiscard]] auto lock_file_path_for(const infra::Config& config) -> std::filesystem::path;

/// Владеет lock-файлом (он же файл SQLite), обоими реестрами, параметрами
/// подключения и токеном отмены.
///
/// Если lock-файл уже существовал при создании, предыдущий запуск не вызвал
/// finish(): всё сохранённое загружается обратно и is_preexisting() == true.
/// close() оставляет lock-файл, finish() удаляет его.
class TransferManager {
public:
    [[nodiscard]] static auto create(const infra::Config& config = {})
        -> infra::Result<std::unique_ptr<TransferManager>>;

    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    [[nodiscard]] auto is_preexisting() const -> bool { return preexisting_; }
    [[nodiscard]] auto state() const -> ManagerState { return state_.load(); }
    [[nodiscard]] auto lock_file_path() const -> const std::filesystem::path& { return lock_file_path_; }

    [[nodiscard]] auto files() -> TransferRegistry& { return files_; }
    [[nodiscard]] auto attributes() -> AttributeRegistry& { return attributes_; }

    /// NotSet, если параметры ни разу не сохранялись.
    [[nodiscard]] auto connection_params() const -> infra::Result<ConnectionParams>;
    [[nodiscard]] auto store_or_update_connection_params(const ConnectionParams& params) -> infra::VoidResult;

    [[nodiscard]] auto operate(const TransferFn& transfer) -> infra::Result<std::vector<TransferRecord>>;

    // Синхронизирует оба реестра с хранилищем
    [[nodiscard]] auto sync() -> infra::VoidResult;

    [[nodiscard]] auto cancellation_token() const -> std::stop_token { return cancel_source_.get_token(); }
    [[nodiscard]] auto is_cancelled() const -> bool { return cancel_source_.stop_requested(); }
    void cancel();

    [[nodiscard]] auto close() -> infra::VoidResult;
    [[nodiscard]] auto finish() -> infra::VoidResult;

private:
    TransferManager(std::filesystem::path lock_file_path,
                    bool preexisting,
                    std::unique_ptr<storage::DurableStore> store,
                    std::chrono::milliseconds signal_poll);

    [[nodiscard]] auto load_existing_data() -> infra::VoidResult;
    [[nodiscard]] auto load_connection_params(const storage::ReadTxn& tx) const
        -> infra::Result<std::optional<ConnectionParams>>;
    void setup_signal_handling();

    std::filesystem::path lock_file_path_;
    bool preexisting_;
    std::unique_ptr<storage::DurableStore> store_;
    TransferRegistry files_;
    AttributeRegistry attributes_;

    std::optional<ConnectionParams> connection_params_;
    mutable std::mutex params_mutex_;

    std::atomic<ManagerState> state_;
    std::stop_source cancel_source_;
    std::chrono::milliseconds signal_poll_;
    std::jthread signal_watcher_;
};

} // namespace reflux::core
