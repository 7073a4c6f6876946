#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "adapters/fs.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/transfer_manager/transfer_manager.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/xxhash_verifier.hpp"

namespace {

constexpr std::string_view destination_key = "destination";

auto fail(reflux::core::TransferManager& tm, const reflux::infra::Error& err) -> int {
    spdlog::error("{}", err.message);
    if (auto res = tm.close(); !res) {
        spdlog::error("{}", res.error().message);
    }
    return err.to_exit_code();
}

// Регистрирует источники новой сессии: цель <destination>/<имя файла>
auto register_sources(reflux::core::TransferManager& tm,
                      const std::filesystem::path& destination,
                      const std::vector<std::string>& sources) -> reflux::infra::VoidResult
{
    using namespace reflux;

    if (auto res = tm.attributes().store_as(std::string(destination_key), destination.string()); !res) {
        return res;
    }

    for (const auto& src : sources) {
        std::filesystem::path source(src);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                                   fmt::format("Source is not a regular file: {}", src)));
        }
        auto absolute = std::filesystem::absolute(source, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                                   fmt::format("Cannot resolve {}: {}", src, ec.message())));
        }
        auto target = destination / source.filename();
        if (auto res = tm.files().add(absolute.string(), target.string()); !res) {
            return res;
        }
    }
    return {};
}

} // namespace

int main(int argc, char** argv)
{
    using namespace reflux;

    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_res = args_parser::parse_args(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help или ошибка разбора
        }
        const auto& args = *args_res;

        // 1. Файл, 2. CLI поверх него
        auto config_res = infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = *config_res;
        config.merge_with(infra::config_from_cli(args));
        infra::apply_logging(config);

        auto tm_res = core::TransferManager::create(config);
        if (!tm_res) {
            spdlog::error("Cannot open session: {}", tm_res.error().message);
            return tm_res.error().to_exit_code();
        }
        auto& tm = **tm_res;

        if (tm.is_preexisting()) {
            if (!args.destination.empty()) {
                spdlog::warn("Unfinished session found in {}, ignoring arguments and resuming it",
                             tm.lock_file_path().string());
            }
            auto destination = tm.attributes().load_as<std::string>(std::string(destination_key));
            if (destination) {
                spdlog::info("Resuming copy into {}", *destination);
            }
        } else {
            if (args.destination.empty()) {
                spdlog::error("Nothing to resume: pass <destination> <source>... (see --help)");
                // Пустая сессия не должна оставлять lock-файл
                if (auto res = tm.finish(); !res) {
                    spdlog::error("{}", res.error().message);
                }
                return 1;
            }
            if (auto res = register_sources(tm, args.destination, args.sources); !res) {
                return fail(tm, res.error());
            }
        }

        const auto token = tm.cancellation_token();
        const bool verify = config.verify;

        auto copy_one = [&token, verify](const std::string& src, const std::string& dst) -> core::TransferOutcome {
            if (token.stop_requested()) {
                return {0, infra::make_error(infra::ErrorCode::Interrupted, "cancelled before start")};
            }

            if (adapters::fs::is_complete_copy(src, dst)) {
                std::error_code ec;
                auto size = std::filesystem::file_size(dst, ec);
                spdlog::debug("Skipping {} (already copied)", src);
                return {ec ? 0 : static_cast<std::uint64_t>(size), std::nullopt};
            }

            auto copied = adapters::fs::copy_file_buffered(src, dst, token);
            if (!copied) {
                return {0, std::move(copied.error())};
            }

            if (verify) {
                if (auto res = infra::XXHashVerifier::verify_copy(src, dst, token); !res) {
                    return {*copied, std::move(res.error())};
                }
            }
            return {*copied, std::nullopt};
        };

        auto result = tm.operate(copy_one);
        if (!result && result.error().code == infra::ErrorCode::NotFound && tm.files().size() == 0) {
            spdlog::info("Nothing to copy");
            if (auto res = tm.finish(); !res) {
                spdlog::error("{}", res.error().message);
                return res.error().to_exit_code();
            }
            return 0;
        }
        if (!result) {
            return fail(tm, result.error());
        }

        std::uint64_t total_bytes = 0;
        for (const auto& record : *result) {
            total_bytes += record.bytes_transferred;
            fmt::print("{:<10} {} -> {} ({} bytes){}\n",
                       core::to_string(record.status),
                       record.source_path, record.target_path, record.bytes_transferred,
                       record.error_msg ? fmt::format(": {}", *record.error_msg) : std::string{});
        }

        const bool all_completed = std::all_of(result->begin(), result->end(), [](const auto& record) {
            return record.status == core::TransferStatus::Completed;
        });

        if (all_completed && !tm.is_cancelled()) {
            spdlog::info("All {} file(s) copied, {} bytes", result->size(), total_bytes);
            if (auto res = tm.finish(); !res) {
                spdlog::error("{}", res.error().message);
                return res.error().to_exit_code();
            }
            return 0;
        }

        if (auto res = tm.close(); !res) {
            spdlog::error("{}", res.error().message);
            return res.error().to_exit_code();
        }
        spdlog::warn("Session incomplete, state kept in {}. Run again to resume.",
                     tm.lock_file_path().string());
        return tm.is_cancelled() ? 130 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown fatal error");
        return 1;
    }
}
