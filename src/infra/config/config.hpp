#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

#include "cli/args_parser/args_parser.hpp"

namespace reflux::infra {

enum class JournalMode { Delete, Wal };
enum class SyncLevel { Full, Normal };

struct Config {
    // Расположение lock-файла: <work_dir>/.<lock_name>.lock
    std::optional<std::filesystem::path> work_dir;
    std::optional<std::string> lock_name;

    // SQLite
    std::optional<JournalMode> journal_mode;
    std::optional<SyncLevel> synchronous;
    std::optional<std::uint32_t> busy_timeout_ms;
    std::optional<bool> exclusive;

    // Период опроса флага прерывания, мс
    std::optional<std::uint32_t> signal_poll_ms;

    std::optional<std::string> log_level;

    // reflux-copy
    bool verify = false;

    // Слияние с другим Config (поля other имеют приоритет)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.reflux.yaml
///   2. $XDG_CONFIG_HOME/reflux/config.yaml или ~/.config/reflux/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конкретный файл. Отсутствие файла здесь ошибка.
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Конфиг из аргументов командной строки, поверх файла через merge_with.
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// Применяет log_level к глобальному логгеру spdlog.
void apply_logging(const Config& config);

} // namespace reflux::infra
