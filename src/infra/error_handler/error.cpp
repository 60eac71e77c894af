#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>

namespace extsort::infra {

auto kind_of(ErrorCode code) -> ErrorKind {
    switch (code) {
        case ErrorCode::FileLocked:
        case ErrorCode::Busy:
            return ErrorKind::Locked;
        case ErrorCode::TransientIO:
            return ErrorKind::TransientIO;
        case ErrorCode::ConfigError:
            return ErrorKind::ConfigError;
        default:
            return ErrorKind::Fatal;
    }
}

auto Error::kind() const -> ErrorKind {
    return kind_of(code);
}

bool Error::is_fatal() const {
    const auto k = kind();
    return k == ErrorKind::Fatal || k == ErrorKind::ConfigError;
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::ConfigError:  return 2;
        case ErrorCode::Interrupted:  return 130; // SIGINT
        default:                      return EXIT_FAILURE;
    }
}

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::FileLocked:       return "file_locked";
        case ErrorCode::Busy:             return "busy";
        case ErrorCode::TransientIO:      return "transient_io";
        case ErrorCode::FileNotFound:     return "file_not_found";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::DiskFull:         return "disk_full";
        case ErrorCode::ReadOnly:         return "read_only";
        case ErrorCode::InvalidPath:      return "invalid_path";
        case ErrorCode::AlreadyExists:    return "already_exists";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::ConfigError:      return "config_error";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Locked:      return "locked";
        case ErrorKind::TransientIO: return "transient_io";
        case ErrorKind::Fatal:       return "fatal";
        case ErrorKind::ConfigError: return "config_error";
    }
    return "fatal";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

auto code_from_errno(int err) -> ErrorCode {
    switch (err) {
        case EBUSY:
        case ETXTBSY:
            return ErrorCode::Busy;

        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case EINTR:
        case EMFILE:
        case ENFILE:
        case ENOMEM:
        case ENOBUFS:
        case ETIMEDOUT:
        case EIO:
            return ErrorCode::TransientIO;

        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::PermissionDenied;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorCode::DiskFull;
        case EROFS:
            return ErrorCode::ReadOnly;
        case ENAMETOOLONG:
        case EISDIR:
        case ELOOP:
        case EINVAL:
            return ErrorCode::InvalidPath;
        case EEXIST:
            return ErrorCode::AlreadyExists;
        default:
            return ErrorCode::Unknown;
    }
}

auto error_from_errno(int err, std::string_view context,
                      const std::source_location& loc) -> Error {
    return Error{code_from_errno(err),
                 fmt::format("{}: {}", context, std::strerror(err)),
                 loc};
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

} // namespace extsort::infra
