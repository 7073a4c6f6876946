#include "connection_params.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace reflux::core {

namespace {

constexpr int max_port = 65535;
constexpr std::size_t max_host_length = 253;

// Хост или IP-литерал: без пробелов, управляющих символов и частей URL
bool is_valid_locator(const std::string& address) {
    if (address.empty() || address.size() > max_host_length) return false;
    return std::none_of(address.begin(), address.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c) ||
               c == '/' || c == '?' || c == '#' || c == '@';
    });
}

auto resolve(const std::string& address) -> infra::VoidResult {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(address.c_str(), nullptr, &hints, &result);
    if (rc != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Validation,
                               fmt::format("invalid address format: {}: {}", address, ::gai_strerror(rc))));
    }
    ::freeaddrinfo(result);
    return {};
}

} // namespace

auto ConnectionParams::validate() const -> infra::VoidResult {
    if (port < 0 || port > max_port) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Validation,
                                                 fmt::format("invalid port: {}", port)));
    }

    if (user.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Validation, "empty user"));
    }

    if (!is_valid_locator(address)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Validation,
                                                 fmt::format("invalid address format: '{}'", address)));
    }

    return resolve(address);
}

auto ConnectionParams::create(std::string address, int port, std::string user)
    -> infra::Result<ConnectionParams>
{
    ConnectionParams params{std::move(address), port, std::move(user)};
    if (auto res = params.validate(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return params;
}

} // namespace reflux::core
