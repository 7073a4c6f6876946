#include "transfer_registry.hpp"

namespace reflux::core {

TransferRegistry::TransferRegistry(storage::DurableStore& store)
    : Registry(store, storage::ns::files) {}

auto TransferRegistry::store_or_update(const TransferRecord& record) -> infra::VoidResult {
    return Registry::store_or_update(record.source_path, record);
}

auto TransferRegistry::add(std::string source_path, std::string target_path) -> infra::VoidResult {
    TransferRecord record;
    record.source_path = std::move(source_path);
    record.target_path = std::move(target_path);
    return store_or_update(record);
}

auto TransferRegistry::update_status(const std::string& source_path,
                                     TransferStatus status,
                                     std::uint64_t bytes_transferred,
                                     std::optional<std::string> error) -> infra::VoidResult
{
    auto res = modify(source_path, [&](TransferRecord& record) {
        apply_status(record, status, bytes_transferred, error);
    });
    if (res) {
        spdlog::debug("'{}' -> {} ({} bytes)", source_path, to_string(status), bytes_transferred);
    }
    return res;
}

auto TransferRegistry::start(const std::string& source_path) -> infra::VoidResult {
    return update_status(source_path, TransferStatus::InProgress, 0);
}

auto TransferRegistry::set_error(const std::string& source_path, std::string error) -> infra::VoidResult {
    return update_status(source_path, TransferStatus::Failed, 0, std::move(error));
}

auto TransferRegistry::set_success(const std::string& source_path, std::uint64_t bytes_transferred) -> infra::VoidResult {
    return update_status(source_path, TransferStatus::Completed, bytes_transferred);
}

} // namespace reflux::core
