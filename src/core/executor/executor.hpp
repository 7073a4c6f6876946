#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/records/transfer_record.hpp"
#include "core/registry/transfer_registry.hpp"
#include "infra/error_handler/error.hpp"

namespace reflux::core {

struct TransferOutcome {
    std::uint64_t bytes_transferred = 0;
    std::optional<infra::Error> error;  // пусто: передача успешна
};

// Сама передача байтов (сеть, копирование). Предоставляется вызывающим кодом.
using TransferFn = std::function<TransferOutcome(const std::string& source_path,
                                                 const std::string& target_path)>;

/// Прогоняет transfer по всем записям реестра (порядок не определён):
/// InProgress -> transfer -> Completed | Failed, затем sync() и снимок get_all().
/// Ошибка transfer помечает только свою запись. Запись, удалённая во время обхода,
/// пропускается. Любая другая ошибка учёта прерывает обход без sync.
/// Отмену не отслеживает: это делает transfer через токен менеджера.
[[nodiscard]] auto operate(TransferRegistry& files, const TransferFn& transfer)
    -> infra::Result<std::vector<TransferRecord>>;

} // namespace reflux::core
