#include "xxhash_verifier.hpp"

#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace reflux::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path, std::stop_token stop)
    -> Result<XXH64_hash_t>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
                               fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "Failed to create XXH64 state"));
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(buffer_size);
    while (file) {
        if (stop.stop_requested()) {
            return std::unexpected(make_error(ErrorCode::Interrupted,
                                   fmt::format("Hashing of {} cancelled", path.string())));
        }
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = file.gcount();
        if (n <= 0) break;
        XXH64_update(state.get(), buffer.data(), static_cast<std::size_t>(n));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
                               fmt::format("Error reading file: {}", path.string())));
    }
    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_copy(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 std::stop_token stop)
    -> VoidResult
{
    auto src_hash = hash_file(src, stop);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }
    auto dst_hash = hash_file(dst, stop);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    if (*src_hash != *dst_hash) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
                               fmt::format("Hash mismatch: {} ({:016x}) vs {} ({:016x})",
                                           src.string(), *src_hash, dst.string(), *dst_hash)));
    }
    spdlog::debug("Verified {} ({:016x})", dst.string(), *dst_hash);
    return {};
}

} // namespace reflux::infra
