#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reflux::core {

enum class TransferStatus : std::uint8_t {
    NotStarted,
    InProgress,
    Completed,
    Failed,
};

[[nodiscard]] auto to_string(TransferStatus status) -> std::string_view;
[[nodiscard]] auto status_from_string(std::string_view name) -> std::optional<TransferStatus>;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

struct TransferRecord {
    std::string source_path;              // ключ записи
    std::string target_path;
    TransferStatus status = TransferStatus::NotStarted;
    std::uint64_t bytes_transferred = 0;
    std::optional<Timestamp> time_start;
    std::optional<Timestamp> time_end;
    std::optional<std::string> error_msg;

    bool operator==(const TransferRecord&) const = default;
};

/// Переводит запись в новый статус:
///   InProgress            -> новый цикл: time_start = now, time_end и error_msg сбрасываются
///   Completed / Failed    -> time_end = now
///   error (только Failed) -> error_msg
void apply_status(TransferRecord& record,
                  TransferStatus status,
                  std::uint64_t bytes_transferred,
                  const std::optional<std::string>& error,
                  Timestamp now = Clock::now());

} // namespace reflux::core
