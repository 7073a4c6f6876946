#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace reflux::args_parser {

struct CLIArgs
{
    std::string destination;                // первый позиционный аргумент
    std::vector<std::string> sources;       // остальные позиционные аргументы
    bool verify{false};                     // --verify
    std::optional<std::string> work_dir;    // --work-dir
    std::optional<std::string> lock_name;   // --lock-name
    std::optional<std::string> log_level;   // --log-level
};

/// Разбирает командную строку reflux-copy.
/// При --help или ошибке разбора возвращает код выхода (сообщение уже выведено CLI11).
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace reflux::args_parser
