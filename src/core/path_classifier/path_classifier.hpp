#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace extsort::core {

inline constexpr std::string_view kNoExtensionBucket = "no_extension";

/// Имя папки назначения по расширению файла: текст после последней точки
/// в lower-case (UTF-8; латиница, греческий, кириллица). Ведущая точка dotfile
/// расширением не считается.
/// Для файлов без расширения возвращает "no_extension".
[[nodiscard]] auto classify_bucket(const std::filesystem::path& path) -> std::string;

/// Преобразует shell-glob в регулярное выражение ECMAScript.
///   *   любая последовательность без '/'
///   ?   один символ, кроме '/'
///   **  любая последовательность, включая '/'; "a/**" совпадает и с самим "a"
///   [abc], [!abc]  классы символов; ']' сразу после '[' или '[!' входит в класс
[[nodiscard]] auto glob_to_regex(std::string_view glob) -> std::string;

/// Шаблон с '/' в конце ("build/") совпадает только с каталогами.
class GlobPattern {
public:
    // Бросает std::regex_error для некорректного шаблона
    explicit GlobPattern(std::string glob);

    [[nodiscard]] auto matches(std::string_view relative_path) const -> bool;
    // С учётом типа записи: directory_only-шаблон не совпадает с файлом
    [[nodiscard]] auto matches_entry(std::string_view relative_path, bool is_directory) const -> bool;

    [[nodiscard]] auto text() const -> const std::string& { return glob_; }
    [[nodiscard]] auto directory_only() const -> bool { return directory_only_; }

private:
    std::string glob_;
    std::regex regex_;
    bool directory_only_ = false;
};

// Проверка исключений. Шаблоны компилируются один раз и дальше только читаются,
// поэтому объект безопасно использовать из нескольких потоков.
class PathClassifier {
public:
    PathClassifier() = default;

    [[nodiscard]] static auto create(const std::vector<std::string>& exclusion_globs)
        -> infra::Result<PathClassifier>;

    /// true, если относительный путь или любой из его каталогов-предков
    /// совпадает с одним из шаблонов. is_directory относится к самому пути.
    [[nodiscard]] auto is_excluded(const std::filesystem::path& relative_path,
                                   bool is_directory = false) const -> bool;

    // Первый совпавший шаблон, для диагностики
    [[nodiscard]] auto matching_pattern(const std::filesystem::path& relative_path,
                                        bool is_directory = false) const
        -> std::optional<std::string_view>;

private:
    std::vector<GlobPattern> patterns_;
};

/// Разовая проверка без предварительной компиляции.
/// Некорректные шаблоны пропускаются с предупреждением.
[[nodiscard]] auto is_excluded(const std::filesystem::path& relative_path,
                               const std::vector<std::string>& exclusion_globs,
                               bool is_directory = false) -> bool;

} // namespace extsort::core
