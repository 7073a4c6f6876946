#pragma once

#include <cstdint>
#include <filesystem>
#include <stop_token>
#include "infra/error_handler/error.hpp"

namespace reflux::adapters::fs {

/// Буферизованное копирование src -> dst, возвращает число скопированных байт.
/// Между блоками проверяет stop: при отмене Interrupted, dst удаляется.
[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::stop_token stop = {}
) -> infra::Result<std::uint64_t>;

// dst уже существует и совпадает с src по размеру: копия завершена в прошлом запуске
[[nodiscard]] auto is_complete_copy(const std::filesystem::path& src,
                                    const std::filesystem::path& dst) -> bool;

} // namespace reflux::adapters::fs
