#pragma once

#include <string>
#include <string_view>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace reflux::infra {

enum class ErrorCode {
    // Ошибки ядра
    Validation,        // некорректные параметры подключения
    NotFound,          // ключа нет в реестре
    NamespaceMissing,  // ожидаемая таблица отсутствует в хранилище
    NotSet,            // параметры подключения ещё не сохранены
    Persistence,       // любая ошибка SQLite: open, транзакция, flush, close

    // Кооперативная отмена
    Interrupted,

    // Инструмент копирования
    IoFailure,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace reflux::infra
