#pragma once

#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <xxhash.h>

#include "infra/error_handler/error.hpp"

namespace reflux::infra {

// Проверка копии по xxHash64 (включается ключом verify в конфиге)
class XXHashVerifier {
public:
    [[nodiscard]] static auto hash_file(const std::filesystem::path& path, std::stop_token stop = {})
        -> Result<XXH64_hash_t>;

    // IoFailure при расхождении хешей
    [[nodiscard]] static auto verify_copy(const std::filesystem::path& src,
                                          const std::filesystem::path& dst,
                                          std::stop_token stop = {})
        -> VoidResult;

private:
    static constexpr std::size_t buffer_size = 1024 * 1024;
};

} // namespace reflux::infra
