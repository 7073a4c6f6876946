#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace reflux::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::Persistence:
        case ErrorCode::NamespaceMissing:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::Validation:  return 2;
        case ErrorCode::IoFailure:   return 20;
        case ErrorCode::NotFound:    return 21;
        case ErrorCode::Interrupted: return 130; // SIGINT
        default:                     return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation:       return "validation";
        case ErrorCode::NotFound:         return "not found";
        case ErrorCode::NamespaceMissing: return "namespace missing";
        case ErrorCode::NotSet:           return "not set";
        case ErrorCode::Persistence:      return "persistence";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::IoFailure:        return "io failure";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace reflux::infra
