//! # Input File Discovery
//!
//! Turns the command-line patterns into the list of files to process.
//!
//! ## Process
//!
//! 1. Expand each pattern with POSIX `glob(3)`, or by walking its literal
//!    prefix when it contains a `**` segment
//! 2. Keep regular files as they are; walk directories for source files
//! 3. Drop paths matching an ignore pattern (`fnmatch(3)`) or, inside a git
//!    work tree, a `.gitignore` rule
//! 4. Sort and deduplicate, so reports come out in a stable order

#include "schemat/cli/discovery.hpp"

#include "schemat/log/log.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <functional>
#include <glob.h>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace schemat::cli {

namespace {

constexpr std::array<std::string_view, 16> SOURCE_EXTENSIONS = {
    ".scm", ".ss",  ".sls", ".sld", ".sps", ".rkt", ".lisp", ".lsp",
    ".cl",  ".el",  ".clj", ".cljs", ".cljc", ".edn", ".fnl", ".janet",
};

auto normalize(std::string_view path) -> std::string {
    while (path.starts_with("./")) {
        path.remove_prefix(2);
    }
    while (path.size() > 1 && path.ends_with('/')) {
        path.remove_suffix(1);
    }
    return std::string(path);
}

auto absolute_path(const std::string& path) -> std::string {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return normalize(path);
    }
    return normalize(absolute.lexically_normal().generic_string());
}

auto pattern_matches(const std::string& pattern, const std::string& path) -> bool {
    return fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
}

auto has_wildcard(std::string_view pattern) -> bool {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

auto split(std::string_view text, char separator) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto end = text.find(separator, start);
        parts.emplace_back(text.substr(start, end - start));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return parts;
}

auto match_segments(const std::vector<std::string>& pattern, size_t i,
                    const std::vector<std::string>& path, size_t j) -> bool {
    while (i < pattern.size()) {
        if (pattern[i] == "**") {
            for (size_t k = j; k <= path.size(); ++k) {
                if (match_segments(pattern, i + 1, path, k)) {
                    return true;
                }
            }
            return false;
        }
        if (j == path.size() || !pattern_matches(pattern[i], path[j])) {
            return false;
        }
        ++i;
        ++j;
    }
    return j == path.size();
}

/// Directory to walk for a `**` pattern: everything before the first wildcard
/// segment.
auto literal_prefix(const std::string& pattern) -> std::string {
    auto wild = pattern.find_first_of("*?[");
    auto slash = pattern.rfind('/', wild);
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return pattern.substr(0, slash);
}

/// Adds the files below `dir` accepted by `accept`, reporting traversal errors.
auto walk_directory(const std::string& dir, const std::vector<std::string>& ignore,
                    GitIgnore& gitignore, const std::function<bool(const fs::path&)>& accept,
                    std::vector<std::string>& files) -> Result<bool, std::string> {
    bool in_repository = gitignore.load_for(dir);

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return "cannot read directory " + dir + ": " + ec.message();
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return "cannot read directory " + dir + ": " + ec.message();
        }

        const auto& entry = *it;
        auto name = entry.path().filename().string();
        auto path = normalize(entry.path().generic_string());

        if (entry.is_directory(ec)) {
            if (name.starts_with(".") || is_ignored(path, ignore) ||
                gitignore.is_ignored(path, true)) {
                it.disable_recursion_pending();
            } else if (in_repository) {
                gitignore.add_directory(path);
            }
            continue;
        }

        if (entry.is_regular_file(ec) && accept(entry.path()) && !is_ignored(path, ignore) &&
            !gitignore.is_ignored(path, false)) {
            files.push_back(path);
        }
    }

    return true;
}

auto expand_recursive(const std::string& pattern, const std::vector<std::string>& ignore,
                      GitIgnore& gitignore, std::vector<std::string>& files)
    -> Result<bool, std::string> {
    auto normalized = normalize(pattern);
    auto base = literal_prefix(normalized);

    std::error_code ec;
    if (!fs::is_directory(base, ec) || is_ignored(base, ignore) ||
        (gitignore.load_for(base) && gitignore.is_excluded(base, true))) {
        SCHEMAT_LOG_WARN("cli", "No files match " << pattern);
        return true;
    }

    auto before = files.size();
    auto walked = walk_directory(
        base, ignore, gitignore,
        [&normalized](const fs::path& path) {
            return !path.filename().string().starts_with(".") &&
                   glob_match(normalized, normalize(path.generic_string()));
        },
        files);
    if (is_ok(walked) && files.size() == before) {
        SCHEMAT_LOG_WARN("cli", "No files match " << pattern);
    }
    return walked;
}

} // anonymous namespace

auto is_source_file(std::string_view path) -> bool {
    auto ext = fs::path(path).extension().string();
    return std::find(SOURCE_EXTENSIONS.begin(), SOURCE_EXTENSIONS.end(), ext) !=
           SOURCE_EXTENSIONS.end();
}

auto is_ignored(std::string_view path, const std::vector<std::string>& ignore) -> bool {
    if (ignore.empty()) {
        return false;
    }

    std::string current = normalize(path);
    while (!current.empty()) {
        auto slash = current.rfind('/');
        std::string base = slash == std::string::npos ? current : current.substr(slash + 1);

        for (const auto& raw : ignore) {
            auto pattern = normalize(raw);
            if (pattern_matches(pattern, current)) {
                return true;
            }
            if (pattern.find('/') == std::string::npos && pattern_matches(pattern, base)) {
                return true;
            }
        }

        if (slash == std::string::npos || slash == 0) {
            break;
        }
        current.resize(slash);
    }

    return false;
}

auto glob_match(std::string_view pattern, std::string_view path) -> bool {
    return match_segments(split(pattern, '/'), 0, split(path, '/'), 0);
}

// ============================================================================
// Gitignore
// ============================================================================

auto GitIgnore::load_for(const std::string& dir) -> bool {
    fs::path current(absolute_path(dir));
    fs::path root;

    std::error_code ec;
    while (true) {
        if (fs::exists(current / ".git", ec)) {
            root = current;
            break;
        }
        if (current == current.parent_path()) {
            return false;
        }
        current = current.parent_path();
    }

    auto target = fs::path(absolute_path(dir));
    auto relative = target.lexically_relative(root);
    add_directory(root.generic_string());
    for (const auto& part : relative) {
        if (part == ".") {
            continue;
        }
        root /= part;
        add_directory(root.generic_string());
    }
    return true;
}

void GitIgnore::add_directory(const std::string& dir) {
    auto base = absolute_path(dir);
    if (!loaded_.insert(base).second) {
        return;
    }

    auto file = fs::path(base) / ".gitignore";
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        SCHEMAT_LOG_WARN("cli", "Cannot read " << file.generic_string());
        return;
    }
    std::ostringstream content;
    content << in.rdbuf();
    add_rules(base, content.str());
}

void GitIgnore::add_rules(const std::string& base, std::string_view content) {
    auto absolute_base = absolute_path(base);
    size_t count = 0;

    for (const auto& raw : split(content, '\n')) {
        std::string_view line = raw;
        while (!line.empty() &&
               (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
            line.remove_suffix(1);
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }

        Rule rule{.base = absolute_base, .pattern = {}};
        if (line.front() == '!') {
            rule.negated = true;
            line.remove_prefix(1);
        } else if (line.starts_with("\\#") || line.starts_with("\\!")) {
            line.remove_prefix(1);
        }
        if (line.ends_with('/')) {
            rule.dir_only = true;
            line.remove_suffix(1);
        }
        rule.anchored = line.find('/') != std::string_view::npos;
        while (line.starts_with('/')) {
            line.remove_prefix(1);
        }
        if (line.empty()) {
            continue;
        }

        rule.pattern = std::string(line);
        rules_.push_back(std::move(rule));
        ++count;
    }

    SCHEMAT_LOG_DEBUG("cli", "Loaded " << count << " gitignore rule(s) for " << absolute_base);
}

auto GitIgnore::is_ignored(const std::string& path, bool is_dir) const -> bool {
    if (rules_.empty()) {
        return false;
    }
    return matches(absolute_path(path), is_dir);
}

auto GitIgnore::is_excluded(const std::string& path, bool is_dir) const -> bool {
    if (rules_.empty()) {
        return false;
    }

    auto absolute = absolute_path(path);
    for (auto slash = absolute.find('/', 1); slash != std::string::npos;
         slash = absolute.find('/', slash + 1)) {
        if (matches(absolute.substr(0, slash), true)) {
            return true;
        }
    }
    return matches(absolute, is_dir);
}

auto GitIgnore::matches(const std::string& absolute, bool is_dir) const -> bool {
    bool ignored = false;

    for (const auto& rule : rules_) {
        if (rule.dir_only && !is_dir) {
            continue;
        }
        if (absolute.size() <= rule.base.size() || !absolute.starts_with(rule.base) ||
            absolute[rule.base.size()] != '/') {
            continue;
        }

        auto relative = absolute.substr(rule.base.size() + 1);
        bool hit = false;
        if (rule.anchored) {
            hit = glob_match(rule.pattern, relative);
        } else {
            auto slash = relative.rfind('/');
            hit = pattern_matches(rule.pattern, slash == std::string::npos
                                                    ? relative
                                                    : relative.substr(slash + 1));
        }
        if (hit) {
            ignored = !rule.negated;
        }
    }

    return ignored;
}

// ============================================================================
// Discovery
// ============================================================================

auto discover_files(const std::vector<std::string>& patterns,
                    const std::vector<std::string>& ignore)
    -> Result<std::vector<std::string>, std::string> {
    std::vector<std::string> files;
    GitIgnore gitignore;

    auto sources = [](const fs::path& path) { return is_source_file(path.generic_string()); };

    for (const auto& pattern : patterns) {
        if (pattern.find("**") != std::string::npos) {
            auto expanded = expand_recursive(pattern, ignore, gitignore, files);
            if (is_err(expanded)) {
                return unwrap_err(expanded);
            }
            continue;
        }

        glob_t matches_buf{};
        int rc = glob(pattern.c_str(), 0, nullptr, &matches_buf);

        if (rc == GLOB_NOMATCH) {
            globfree(&matches_buf);
            SCHEMAT_LOG_WARN("cli", "No files match " << pattern);
            continue;
        }
        if (rc != 0) {
            globfree(&matches_buf);
            return "cannot expand pattern " + pattern +
                   (rc == GLOB_NOSPACE ? ": out of memory" : ": read error");
        }

        std::vector<std::string> expanded(matches_buf.gl_pathv,
                                          matches_buf.gl_pathv + matches_buf.gl_pathc);
        globfree(&matches_buf);

        // Paths named literally are taken even when git ignores them.
        bool literal = !has_wildcard(pattern);

        for (const auto& match : expanded) {
            auto path = normalize(match);
            std::error_code ec;
            bool is_dir = fs::is_directory(path, ec);
            if (is_ignored(path, ignore)) {
                continue;
            }
            if (!literal) {
                auto parent = fs::path(path).parent_path().generic_string();
                auto dir = is_dir ? path : (parent.empty() ? std::string(".") : parent);
                if (gitignore.load_for(dir) && gitignore.is_excluded(path, is_dir)) {
                    continue;
                }
            }

            if (is_dir) {
                auto walked = walk_directory(path, ignore, gitignore, sources, files);
                if (is_err(walked)) {
                    return unwrap_err(walked);
                }
            } else {
                // Explicitly named files are taken whatever their extension.
                files.push_back(path);
            }
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    SCHEMAT_LOG_DEBUG("cli", "Discovered " << files.size() << " file(s)");
    return files;
}

} // namespace schemat::cli
