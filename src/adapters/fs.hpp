#pragma once

#include <cstdint>
#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace extsort::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // >= 1 MB
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

/// Копирует содержимое src в dst и возвращает число записанных байт.
///
/// dst создаётся эксклюзивно (O_CREAT | O_EXCL): существующий файл никогда
/// не перезаписывается, вместо этого возвращается ErrorCode::AlreadyExists.
/// Если другой процесс держит эксклюзивный flock на src, возвращается
/// ErrorCode::FileLocked. При любой ошибке частично записанный dst удаляется.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uintmax_t>;

[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> infra::Result<std::uintmax_t>;

/// Переносит mtime и POSIX-права с src на dst.
[[nodiscard]] auto copy_metadata(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

} // namespace extsort::adapters::fs
