#include "fs.hpp"

#include <fstream>
#include <system_error>
#include <vector>
#include <fmt/core.h>

namespace reflux::adapters::fs {

auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::stop_token stop
) -> infra::Result<std::uint64_t> {
    std::error_code ec;
    if (dst.has_parent_path()) {
        std::filesystem::create_directories(dst.parent_path(), ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                                 fmt::format("Cannot create {}: {}", dst.parent_path().string(), ec.message())));
        }
    }

    std::ifstream ifs(src, std::ios::binary);
    if (!ifs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                             fmt::format("Failed to open {}", src.string())));
    }
    std::ofstream ofs(dst, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                             fmt::format("Failed to create {}", dst.string())));
    }

    constexpr std::size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    std::uint64_t copied = 0;

    while (ifs) {
        if (stop.stop_requested()) {
            ofs.close();
            std::filesystem::remove(dst, ec);
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                 fmt::format("Copy of {} cancelled", src.string())));
        }

        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = ifs.gcount();
        if (n <= 0) break;

        if (!ofs.write(buffer.data(), n)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                                 fmt::format("Write error at offset {} in {}", copied, dst.string())));
        }
        copied += static_cast<std::uint64_t>(n);
    }

    if (ifs.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                             fmt::format("Read error at offset {} in {}", copied, src.string())));
    }

    ofs.flush();
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoFailure,
                             fmt::format("Flush failed for {}", dst.string())));
    }
    return copied;
}

auto is_complete_copy(const std::filesystem::path& src,
                      const std::filesystem::path& dst) -> bool {
    std::error_code ec;
    if (!std::filesystem::exists(dst, ec) || ec) {
        return false;
    }

    auto src_size = std::filesystem::file_size(src, ec);
    if (ec) return false;

    auto dst_size = std::filesystem::file_size(dst, ec);
    if (ec) return false;

    return src_size == dst_size;
}

} // namespace reflux::adapters::fs
