// ==============================================================================
// error.cpp - Таксономия ошибок
// ==============================================================================

#include "repoguard/error.hpp"

#include <utility>

namespace repoguard {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFoundError";
    case ErrorKind::Read:
        return "ReadError";
    case ErrorKind::Write:
        return "WriteError";
    case ErrorKind::Config:
        return "ConfigError";
    }
    return "Error";
}

std::string Error::format() const {
    if (path.empty()) {
        return message;
    }
    return message + " - " + path;
}

Exception::Exception(Error error) : std::runtime_error(error.format()), error_(std::move(error)) {}

Exception config_error(const std::string& message, const std::string& path) {
    return Exception(Error{ErrorKind::Config, message, path});
}

Exception not_found_error(const std::string& message, const std::string& path) {
    return Exception(Error{ErrorKind::NotFound, message, path});
}

}  // namespace repoguard
