#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>
#include <fmt/core.h>

#include "infra/config/config.hpp"

namespace reflux::test {

// Уникальный временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                fmt::format("reflux-test-{}-{}", ::getpid(), counter.fetch_add(1));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

inline auto config_in(const TempDir& dir, std::string lock_name = "reflux-test") -> infra::Config {
    infra::Config config;
    config.work_dir = dir.path();
    config.lock_name = std::move(lock_name);
    config.signal_poll_ms = 5;
    return config;
}

} // namespace reflux::test
