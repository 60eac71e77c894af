#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace extsort::infra {

enum class ErrorCode {
    // Заблокирован другим процессом (retry, затем skip/fail)
    FileLocked,
    Busy,

    // Временные (retry с backoff)
    TransientIO,

    // Фатальные для конкретного файла (без retry)
    FileNotFound,
    PermissionDenied,
    DiskFull,
    ReadOnly,
    InvalidPath,
    AlreadyExists,
    Interrupted,
    Unknown,

    // Ошибка конфигурации (запуск прерывается до копирования)
    ConfigError,
};

// Классы ошибок, которыми оперирует RetryPolicy и отчёт
enum class ErrorKind {
    Locked,
    TransientIO,
    Fatal,
    ConfigError,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto kind() const -> ErrorKind;
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;

    [[nodiscard]] auto is_locked() const -> bool {
        return kind() == ErrorKind::Locked;
    }

    [[nodiscard]] auto is_transient() const -> bool {
        const auto k = kind();
        return k == ErrorKind::Locked || k == ErrorKind::TransientIO;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto kind_of(ErrorCode code) -> ErrorKind;
[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит errno системного вызова в ErrorCode.
/// EWOULDBLOCK от flock() сюда не попадает: вызывающий код сам помечает его как FileLocked.
[[nodiscard]] auto code_from_errno(int err) -> ErrorCode;

[[nodiscard]] auto error_from_errno(
    int err,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace extsort::infra
