#include "path_classifier.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace extsort::core {

namespace {

constexpr std::string_view kRegexSpecial = ".^$|()+{}\\";

struct NormalizedGlob {
    std::string body;
    bool anchored = false;       // "/x": только от корня источника
    bool directory_only = false; // "x/": только каталоги
};

// Без "./" в начале и без завершающих '/'
auto normalize_glob(std::string_view glob) -> NormalizedGlob {
    NormalizedGlob n{std::string(glob)};
    auto& g = n.body;

    while (g.starts_with("./")) g.erase(0, 2);
    if (g.starts_with('/')) {
        n.anchored = true;
        const auto first = g.find_first_not_of('/');
        g.erase(0, first == std::string::npos ? g.size() : first);
    }
    while (!g.empty() && g.ends_with('/')) {
        g.pop_back();
        n.directory_only = true;
    }
    return n;
}

// Заглавные буквы Latin-1, Latin Extended-A, греческого и кириллицы.
// Остальные кодовые точки не меняются.
auto fold_code_point(char32_t cp) -> char32_t {
    if (cp < 0x80) {
        return (cp >= U'A' && cp <= U'Z') ? cp + 0x20 : cp;
    }
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    if (cp >= 0x100 && cp <= 0x17F && cp != 0x130 && cp != 0x138 && cp != 0x149) {
        if (cp == 0x178) return 0xFF;
        const bool even_upper = (cp <= 0x137) || (cp >= 0x14A && cp <= 0x177);
        if (even_upper) return (cp % 2 == 0) ? cp + 1 : cp;
        return (cp % 2 == 1 && cp != 0x17F) ? cp + 1 : cp;
    }
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 0x20;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    return cp;
}

auto append_utf8(std::string& out, char32_t cp) -> void {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Нижний регистр для UTF-8. Некорректные последовательности копируются как есть.
auto utf8_to_lower(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        if (lead < 0x80)                { len = 1; cp = lead; }
        else if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }

        bool valid = len > 0 && i + len <= text.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }

        if (!valid) {
            out += text[i];
            ++i;
            continue;
        }
        append_utf8(out, fold_code_point(cp));
        i += len;
    }
    return out;
}

// Каждый префикс пути: "a", "a/b", "a/b/c"
auto path_prefixes(const std::filesystem::path& relative) -> std::vector<std::string> {
    std::vector<std::string> prefixes;
    std::string current;
    for (const auto& part : relative) {
        const auto s = part.generic_string();
        if (s.empty() || s == "." || s == "/") continue;
        if (!current.empty()) current += '/';
        current += s;
        prefixes.push_back(current);
    }
    return prefixes;
}

} // namespace

auto classify_bucket(const std::filesystem::path& path) -> std::string {
    // path::extension() уже не считает ведущую точку dotfile расширением
    const auto ext = path.filename().extension().string();
    if (ext.size() <= 1) {
        return std::string(kNoExtensionBucket);
    }

    return utf8_to_lower(std::string_view{ext}.substr(1));
}

auto glob_to_regex(std::string_view glob) -> std::string {
    std::string out;
    out.reserve(glob.size() * 2);

    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        switch (c) {
            case '*':
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    ++i;
                    if (i + 1 < glob.size() && glob[i + 1] == '/') {
                        ++i;
                        out += "(?:.*/)?"; // "**/": ноль или больше каталогов
                    } else {
                        out += ".*";
                    }
                } else {
                    out += "[^/]*";
                }
                break;
            case '?':
                out += "[^/]";
                break;
            case '/':
                if (glob.substr(i) == "/**") {
                    out += "(?:/.*)?";
                    i = glob.size();
                } else {
                    out += '/';
                }
                break;
            case '[': {
                std::size_t j = i + 1;
                if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) ++j;
                if (j < glob.size() && glob[j] == ']') ++j; // ']' сразу после '[' это символ класса
                while (j < glob.size() && glob[j] != ']') ++j;
                if (j >= glob.size()) {
                    out += "\\["; // незакрытая скобка: обычный символ
                    break;
                }
                out += '[';
                std::size_t k = i + 1;
                if (glob[k] == '!' || glob[k] == '^') {
                    out += "^/"; // отрицание не должно захватывать разделитель
                    ++k;
                }
                for (; k < j; ++k) {
                    const char m = glob[k];
                    if (m == '\\' || m == '[' || m == ']' || m == '^') out += '\\';
                    out += m;
                }
                out += ']';
                i = j;
                break;
            }
            case '\\':
                if (i + 1 < glob.size()) {
                    ++i;
                    if (kRegexSpecial.find(glob[i]) != std::string_view::npos ||
                        glob[i] == '*' || glob[i] == '?' || glob[i] == '[' || glob[i] == ']') {
                        out += '\\';
                    }
                    out += glob[i];
                } else {
                    out += "\\\\";
                }
                break;
            default:
                if (kRegexSpecial.find(c) != std::string_view::npos || c == ']') {
                    out += '\\';
                }
                out += c;
        }
    }
    return out;
}

GlobPattern::GlobPattern(std::string glob)
    : glob_(std::move(glob))
{
    const auto normalized = normalize_glob(glob_);
    directory_only_ = normalized.directory_only;
    // Неякорный шаблон совпадает с хвостом пути: "*.tmp" ловит файл на любой глубине
    const auto body = glob_to_regex(normalized.body);
    regex_ = std::regex(normalized.anchored ? body : "(?:.*/)?" + body,
                        std::regex::ECMAScript | std::regex::optimize);
}

auto GlobPattern::matches(std::string_view relative_path) const -> bool {
    return std::regex_match(relative_path.begin(), relative_path.end(), regex_);
}

auto PathClassifier::create(const std::vector<std::string>& exclusion_globs)
    -> infra::Result<PathClassifier>
{
    PathClassifier classifier;
    classifier.patterns_.reserve(exclusion_globs.size());

    for (const auto& glob : exclusion_globs) {
        if (glob.empty()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                                   "Empty exclusion pattern"));
        }
        try {
            classifier.patterns_.emplace_back(glob);
        } catch (const std::regex_error& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                fmt::format("Invalid exclusion pattern '{}': {}", glob, e.what())));
        }
    }
    return classifier;
}

auto GlobPattern::matches_entry(std::string_view relative_path, bool is_directory) const -> bool {
    if (directory_only_ && !is_directory) return false;
    return matches(relative_path);
}

auto PathClassifier::matching_pattern(const std::filesystem::path& relative_path,
                                      bool is_directory) const
    -> std::optional<std::string_view>
{
    if (patterns_.empty()) return std::nullopt;

    const auto prefixes = path_prefixes(relative_path);
    for (std::size_t i = 0; i < prefixes.size(); ++i) {
        // Все префиксы, кроме последнего, заведомо каталоги
        const bool dir = is_directory || i + 1 < prefixes.size();
        for (const auto& pattern : patterns_) {
            if (pattern.matches_entry(prefixes[i], dir)) {
                return std::string_view{pattern.text()};
            }
        }
    }
    return std::nullopt;
}

auto PathClassifier::is_excluded(const std::filesystem::path& relative_path,
                                 bool is_directory) const -> bool {
    return matching_pattern(relative_path, is_directory).has_value();
}

auto is_excluded(const std::filesystem::path& relative_path,
                 const std::vector<std::string>& exclusion_globs,
                 bool is_directory) -> bool
{
    const auto prefixes = path_prefixes(relative_path);
    for (const auto& glob : exclusion_globs) {
        try {
            const GlobPattern pattern{glob};
            for (std::size_t i = 0; i < prefixes.size(); ++i) {
                if (pattern.matches_entry(prefixes[i], is_directory || i + 1 < prefixes.size())) {
                    return true;
                }
            }
        } catch (const std::regex_error& e) {
            spdlog::warn("Invalid exclude pattern '{}': {}", glob, e.what());
        }
    }
    return false;
}

} // namespace extsort::core
