#include "transfer_manager.hpp"

#include <cerrno>
#include <condition_variable>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "core/codec/codec.hpp"
#include "infra/interrupt.hpp"

namespace reflux::core {

namespace {

constexpr std::string_view server_info_key = "Info";

constexpr std::uint32_t default_signal_poll_ms = 50;

// Аналог basename(argv[0])
auto program_name() -> std::string {
#if defined(__GLIBC__)
    if (program_invocation_short_name && *program_invocation_short_name) {
        return program_invocation_short_name;
    }
#endif
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.filename().empty()) {
        return exe.filename().string();
    }
    return "reflux";
}

auto store_options_from(const infra::Config& config) -> storage::StoreOptions {
    storage::StoreOptions options;
    if (config.journal_mode) options.journal_mode = *config.journal_mode;
    if (config.synchronous) options.synchronous = *config.synchronous;
    if (config.busy_timeout_ms) options.busy_timeout_ms = *config.busy_timeout_ms;
    if (config.exclusive) options.exclusive = *config.exclusive;
    return options;
}

} // namespace

std::string_view to_string(ManagerState state) {
    switch (state) {
        case ManagerState::Fresh:        return "Fresh";
        case ManagerState::Recovering:   return "Recovering";
        case ManagerState::Ready:        return "Ready";
        case ManagerState::ShuttingDown: return "ShuttingDown";
        case ManagerState::Closed:       return "Closed";
    }
    return "Unknown";
}

std::filesystem::path lock_file_path_for(const infra::Config& config) {
    const auto dir = config.work_dir.value_or(std::filesystem::path("."));
    const auto name = config.lock_name.value_or(program_name());
    return dir / fmt::format(".{}.lock", name);
}

TransferManager::TransferManager(std::filesystem::path lock_file_path,
                                 bool preexisting,
                                 std::unique_ptr<storage::DurableStore> store,
                                 std::chrono::milliseconds signal_poll)
    : lock_file_path_(std::move(lock_file_path))
    , preexisting_(preexisting)
    , store_(std::move(store))
    , files_(*store_)
    , attributes_(*store_)
    , state_(preexisting ? ManagerState::Recovering : ManagerState::Fresh)
    , signal_poll_(signal_poll)
{}

TransferManager::~TransferManager() {
    const auto current = state_.load();
    if (current == ManagerState::Closed || current == ManagerState::ShuttingDown) {
        return;
    }
    // Без finish(): lock-файл остаётся, следующий запуск восстановит состояние
    if (auto res = close(); !res) {
        (void)infra::log_and_return(std::move(res.error()));
    }
}

auto TransferManager::create(const infra::Config& config)
    -> infra::Result<std::unique_ptr<TransferManager>>
{
    auto lock_path = lock_file_path_for(config);

    std::error_code ec;
    const bool preexisting = std::filesystem::exists(lock_path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                               fmt::format("Cannot stat lock file {}: {}", lock_path.string(), ec.message())));
    }

    auto store = storage::DurableStore::open(lock_path, store_options_from(config));
    if (!store) {
        return std::unexpected(infra::log_and_return(std::move(store.error())));
    }

    auto poll = std::chrono::milliseconds(config.signal_poll_ms.value_or(default_signal_poll_ms));
    std::unique_ptr<TransferManager> tm(new TransferManager(lock_path, preexisting, std::move(*store), poll));

    if (auto res = tm->store_->ensure_namespaces({storage::ns::files,
                                                  storage::ns::server,
                                                  storage::ns::additional_data}); !res) {
        tm->state_ = ManagerState::Closed;
        return std::unexpected(infra::log_and_return(std::move(res.error())));
    }

    if (preexisting) {
        spdlog::info("Lock file {} already exists, recovering previous session", lock_path.string());
        if (auto res = tm->load_existing_data(); !res) {
            tm->state_ = ManagerState::Closed;
            return std::unexpected(infra::log_and_return(std::move(res.error())));
        }
    }

    tm->setup_signal_handling();
    tm->state_ = ManagerState::Ready;

    spdlog::debug("TransferManager ready ({}, preexisting={})", lock_path.string(), preexisting);
    return tm;
}

auto TransferManager::load_existing_data() -> infra::VoidResult {
    std::optional<ConnectionParams> params;

    auto res = store_->view([&](const storage::ReadTxn& tx) -> infra::VoidResult {
        for (RegistryBase* registry : std::vector<RegistryBase*>{&files_, &attributes_}) {
            if (auto loaded = registry->load_all(tx); !loaded) {
                return loaded;
            }
        }

        auto loaded = load_connection_params(tx);
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        params = std::move(*loaded);
        return {};
    });
    if (!res) {
        return res;
    }

    {
        std::lock_guard lock(params_mutex_);
        connection_params_ = std::move(params);
    }

    spdlog::info("Recovered {} transfer record(s), {} attribute(s), connection params: {}",
                 files_.size(), attributes_.size(), connection_params_ ? "yes" : "no");
    return store_->flush();
}

auto TransferManager::load_connection_params(const storage::ReadTxn& tx) const
    -> infra::Result<std::optional<ConnectionParams>>
{
    auto bytes = tx.get(storage::ns::server, server_info_key);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }
    if (!*bytes) {
        return std::optional<ConnectionParams>{};
    }

    auto params = codec::YamlCodec<ConnectionParams>::decode(**bytes);
    if (!params) {
        return std::unexpected(std::move(params.error()));
    }
    return std::optional<ConnectionParams>{std::move(*params)};
}

auto TransferManager::connection_params() const -> infra::Result<ConnectionParams> {
    std::lock_guard lock(params_mutex_);
    if (!connection_params_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotSet, "server info not set"));
    }
    return *connection_params_;
}

auto TransferManager::store_or_update_connection_params(const ConnectionParams& params) -> infra::VoidResult {
    if (auto res = params.validate(); !res) {
        return res;
    }

    auto bytes = codec::YamlCodec<ConnectionParams>::encode(params);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }

    std::lock_guard lock(params_mutex_);
    auto res = store_->update(storage::ns::server, [&](storage::WriteTxn& tx) {
        return tx.put(server_info_key, *bytes);
    });
    if (!res) {
        return res;
    }

    connection_params_ = params;
    return {};
}

auto TransferManager::operate(const TransferFn& transfer) -> infra::Result<std::vector<TransferRecord>> {
    return core::operate(files_, transfer);
}

auto TransferManager::sync() -> infra::VoidResult {
    if (auto res = files_.sync(); !res) {
        return res;
    }
    if (auto res = attributes_.sync(); !res) {
        return res;
    }
    return store_->flush();
}

void TransferManager::cancel() {
    cancel_source_.request_stop();
}

void TransferManager::setup_signal_handling() {
    infra::install_signal_handler();

    // Сам обработчик только выставляет флаг; здесь он превращается в запрос остановки
    signal_watcher_ = std::jthread([this](std::stop_token st) {
        std::mutex mtx;
        std::condition_variable_any cv;
        std::unique_lock lock(mtx);

        while (!st.stop_requested() && !cancel_source_.stop_requested()) {
            if (infra::is_interrupted()) {
                spdlog::warn("Received interrupt signal, cancelling transfers...");
                cancel_source_.request_stop();
                return;
            }
            (void)cv.wait_for(lock, st, signal_poll_, [] { return infra::is_interrupted(); });
        }
    });
}

auto TransferManager::close() -> infra::VoidResult {
    auto expected = ManagerState::Ready;
    if (!state_.compare_exchange_strong(expected, ManagerState::ShuttingDown)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                               fmt::format("TransferManager is {}, cannot close", to_string(expected))));
    }

    if (signal_watcher_.joinable()) {
        signal_watcher_.request_stop();
        signal_watcher_.join();
    }

    // Хэндл закрывается ровно один раз, даже если flush не удался
    auto flushed = store_->flush();
    auto closed = store_->close();
    state_ = ManagerState::Closed;

    if (!flushed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                               fmt::format("failed to sync database: {}", flushed.error().message)));
    }
    if (!closed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                               fmt::format("failed to close database: {}", closed.error().message)));
    }
    return {};
}

auto TransferManager::finish() -> infra::VoidResult {
    if (auto res = close(); !res) {
        return res;
    }

    std::error_code ec;
    if (!std::filesystem::remove(lock_file_path_, ec) || ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                               fmt::format("failed to remove lock file {}: {}", lock_file_path_.string(),
                                           ec ? ec.message() : "file not found")));
    }

    spdlog::info("Session finished, lock file {} removed", lock_file_path_.string());
    return {};
}

} // namespace reflux::core
