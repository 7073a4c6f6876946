#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "config.hpp"

namespace reflux::infra {
    void Config::merge_with(const Config& other) {
        if (other.work_dir) work_dir = other.work_dir;
        if (other.lock_name) lock_name = other.lock_name;
        if (other.journal_mode) journal_mode = other.journal_mode;
        if (other.synchronous) synchronous = other.synchronous;
        if (other.busy_timeout_ms) busy_timeout_ms = other.busy_timeout_ms;
        if (other.exclusive) exclusive = other.exclusive;
        if (other.signal_poll_ms) signal_poll_ms = other.signal_poll_ms;
        if (other.log_level) log_level = other.log_level;
        if (other.verify) verify = true;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".reflux.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "reflux" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "reflux" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_journal_mode(const std::string& value) -> JournalMode {
        if (value == "wal") return JournalMode::Wal;
        if (value == "delete") return JournalMode::Delete;
        throw std::invalid_argument(fmt::format("unknown journal_mode '{}'", value));
    }

    static auto parse_sync_level(const std::string& value) -> SyncLevel {
        if (value == "full") return SyncLevel::Full;
        if (value == "normal") return SyncLevel::Normal;
        throw std::invalid_argument(fmt::format("unknown synchronous '{}'", value));
    }

    static auto parse_node(const YAML::Node& config) -> Config {
        Config cfg{};

        if (config["work_dir"]) cfg.work_dir = config["work_dir"].as<std::string>();
        if (config["lock_name"]) cfg.lock_name = config["lock_name"].as<std::string>();

        if (config["journal_mode"]) cfg.journal_mode = parse_journal_mode(config["journal_mode"].as<std::string>());
        if (config["synchronous"]) cfg.synchronous = parse_sync_level(config["synchronous"].as<std::string>());
        if (config["busy_timeout_ms"]) cfg.busy_timeout_ms = config["busy_timeout_ms"].as<std::uint32_t>();
        if (config["exclusive"]) cfg.exclusive = config["exclusive"].as<bool>();
        if (config["signal_poll_ms"]) cfg.signal_poll_ms = config["signal_poll_ms"].as<std::uint32_t>();

        if (config["log_level"]) {
            auto level = config["log_level"].as<std::string>();
            if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
                throw std::invalid_argument(fmt::format("unknown log_level '{}'", level));
            }
            cfg.log_level = level;
        }

        if (config["verify"]) cfg.verify = config["verify"].as<bool>();
        return cfg;
    }

    auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        if (!std::filesystem::exists(path)) {
            return std::unexpected(fmt::format("Config file not found: {}", path.string()));
        }

        try {
            auto cfg = parse_node(YAML::LoadFile(path.string()));
            spdlog::debug("Loaded config from {}", path.string());
            return cfg;
        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config(path);
        }

        // Файла нет ни в одном месте: значения по умолчанию
        return Config{};
    }

    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        if (args.work_dir) cfg.work_dir = *args.work_dir;
        cfg.lock_name = args.lock_name;
        cfg.log_level = args.log_level;
        cfg.verify = args.verify;
        return cfg;
    }

    void apply_logging(const Config& config) {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        spdlog::set_level(spdlog::level::from_str(config.log_level.value_or("info")));
    }

} // namespace reflux::infra
