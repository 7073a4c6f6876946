#include "transfer_record.hpp"

namespace reflux::core {

std::string_view to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::NotStarted: return "NotStarted";
        case TransferStatus::InProgress: return "InProgress";
        case TransferStatus::Completed:  return "Completed";
        case TransferStatus::Failed:     return "Failed";
    }
    return "Unknown";
}

std::optional<TransferStatus> status_from_string(std::string_view name) {
    if (name == "NotStarted") return TransferStatus::NotStarted;
    if (name == "InProgress") return TransferStatus::InProgress;
    if (name == "Completed")  return TransferStatus::Completed;
    if (name == "Failed")     return TransferStatus::Failed;
    return std::nullopt;
}

void apply_status(TransferRecord& record,
                  TransferStatus status,
                  std::uint64_t bytes_transferred,
                  const std::optional<std::string>& error,
                  Timestamp now)
{
    record.status = status;
    record.bytes_transferred = bytes_transferred;

    switch (status) {
        case TransferStatus::InProgress:
            record.time_start = now;
            record.time_end.reset();
            record.error_msg.reset();
            break;
        case TransferStatus::Completed:
            record.time_end = now;
            break;
        case TransferStatus::Failed:
            record.time_end = now;
            if (error) record.error_msg = *error;
            break;
        case TransferStatus::NotStarted:
            break;
    }
}

} // namespace reflux::core
