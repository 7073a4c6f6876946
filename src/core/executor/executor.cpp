#include "executor.hpp"

#include <spdlog/spdlog.h>

namespace reflux::core {

namespace {

// NotFound при учёте значит, что запись удалили параллельно: её пропускаем
bool vanished(const infra::VoidResult& res) {
    return !res && res.error().code == infra::ErrorCode::NotFound;
}

} // namespace

auto operate(TransferRegistry& files, const TransferFn& transfer)
    -> infra::Result<std::vector<TransferRecord>>
{
    auto pending = files.get_all();
    const std::vector<TransferRecord> records = pending ? std::move(*pending) : std::vector<TransferRecord>{};

    std::size_t failed = 0;
    for (const auto& record : records) {
        auto res = files.start(record.source_path);
        if (vanished(res)) {
            spdlog::warn("'{}' removed during operate, skipping", record.source_path);
            continue;
        }
        if (!res) {
            return std::unexpected(infra::log_and_return(std::move(res.error())));
        }

        auto outcome = transfer(record.source_path, record.target_path);

        if (outcome.error) {
            ++failed;
            spdlog::warn("Transfer {} -> {} failed: {}",
                         record.source_path, record.target_path, outcome.error->message);
            res = files.update_status(record.source_path, TransferStatus::Failed,
                                      outcome.bytes_transferred, outcome.error->message);
        } else {
            res = files.update_status(record.source_path, TransferStatus::Completed,
                                      outcome.bytes_transferred);
        }

        if (vanished(res)) {
            spdlog::warn("'{}' removed during operate, skipping", record.source_path);
            continue;
        }
        if (!res) {
            return std::unexpected(infra::log_and_return(std::move(res.error())));
        }
    }

    spdlog::debug("operate: {} record(s) processed, {} failed", records.size(), failed);

    if (auto res = files.sync(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    return files.get_all();
}

} // namespace reflux::core
