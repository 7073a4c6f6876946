#pragma once

#include <string>

#include "infra/error_handler/error.hpp"

namespace reflux::core {

// Параметры подключения к удалённой стороне. Один экземпляр на хранилище.
struct ConnectionParams {
    std::string address;
    int port = 0;
    std::string user;

    /// Validation, если адрес синтаксически неверен или не резолвится,
    /// порт вне [0, 65535] или пользователь пуст.
    [[nodiscard]] auto validate() const -> infra::VoidResult;

    [[nodiscard]] static auto create(std::string address, int port, std::string user)
        -> infra::Result<ConnectionParams>;

    bool operator==(const ConnectionParams&) const = default;
};

} // namespace reflux::core
