#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include "infra/error_handler/error.hpp"

namespace extsort::core {

// Файл, найденный при обходе. Не меняется после создания.
struct FileEntry {
    std::filesystem::path source;    // абсолютный путь
    std::filesystem::path relative;  // относительно корня источника
    std::optional<std::uintmax_t> size;
};

enum class SkipReason {
    Locked,
    Excluded,
    Cancelled,
};

struct Copied {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uintmax_t bytes = 0;
    int retries = 0;
};

struct Skipped {
    std::filesystem::path source;
    SkipReason reason = SkipReason::Excluded;
};

struct Failed {
    std::filesystem::path source;
    infra::ErrorCode code = infra::ErrorCode::Unknown;
    int retries = 0;
    std::string message;

    [[nodiscard]] auto kind() const -> infra::ErrorKind { return infra::kind_of(code); }
};

// Ровно один исход на каждый FileEntry (или на каталог, который не удалось прочитать)
using CopyOutcome = std::variant<Copied, Skipped, Failed>;

} // namespace extsort::core
