#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/records/transfer_record.hpp"
#include "core/registry/registry.hpp"

namespace reflux::core {

/// Реестр записей о передаче файлов, ключ это source_path.
class TransferRegistry final : public Registry<TransferRecord> {
public:
    explicit TransferRegistry(storage::DurableStore& store);

    [[nodiscard]] auto store_or_update(const TransferRecord& record) -> infra::VoidResult;

    // Новая запись в статусе NotStarted
    [[nodiscard]] auto add(std::string source_path, std::string target_path) -> infra::VoidResult;

    [[nodiscard]] auto update_status(const std::string& source_path,
                                     TransferStatus status,
                                     std::uint64_t bytes_transferred,
                                     std::optional<std::string> error = std::nullopt) -> infra::VoidResult;

    [[nodiscard]] auto start(const std::string& source_path) -> infra::VoidResult;
    [[nodiscard]] auto set_error(const std::string& source_path, std::string error) -> infra::VoidResult;
    [[nodiscard]] auto set_success(const std::string& source_path, std::uint64_t bytes_transferred) -> infra::VoidResult;
};

} // namespace reflux::core
