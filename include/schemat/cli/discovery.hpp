#ifndef SCHEMAT_CLI_DISCOVERY_HPP
#define SCHEMAT_CLI_DISCOVERY_HPP

#include "schemat/common.hpp"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace schemat::cli {

// True for file names with a Scheme, Racket, Lisp, Clojure or similar extension
[[nodiscard]] auto is_source_file(std::string_view path) -> bool;

// True if `path` or one of its parent directories matches `pattern`.
// A pattern without '/' is also tried against each path component alone.
[[nodiscard]] auto is_ignored(std::string_view path, const std::vector<std::string>& ignore)
    -> bool;

// Matches `path` against `pattern` one '/'-separated segment at a time with
// fnmatch(3). A `**` segment matches any number of segments, including none.
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view path) -> bool;

// The `.gitignore` rules in effect for the git work trees seen so far.
//
// Rules follow git: `#` comments, `!` negation, a trailing '/' for directories
// only, and a pattern with an inner '/' anchored at its file's directory. The
// last matching rule wins.
class GitIgnore {
public:
    // Loads the `.gitignore` files from the enclosing repository root down to
    // `dir`. Returns false when `dir` is not inside a git work tree.
    auto load_for(const std::string& dir) -> bool;

    // Adds the rules of `dir/.gitignore`, if there is one. Each directory is
    // read once.
    void add_directory(const std::string& dir);

    // Adds rules given as `.gitignore` text, relative to directory `base`.
    void add_rules(const std::string& base, std::string_view content);

    // True if a rule ignores `path` itself.
    [[nodiscard]] auto is_ignored(const std::string& path, bool is_dir) const -> bool;

    // True if `path` or one of its parent directories is ignored.
    [[nodiscard]] auto is_excluded(const std::string& path, bool is_dir) const -> bool;

private:
    struct Rule {
        std::string base; // Absolute directory of the .gitignore
        std::string pattern;
        bool negated = false;
        bool dir_only = false;
        bool anchored = false;
    };

    std::vector<Rule> rules_;
    std::set<std::string> loaded_;

    [[nodiscard]] auto matches(const std::string& absolute, bool is_dir) const -> bool;
};

// Expands glob patterns into a sorted, duplicate-free file list.
// Directory matches are walked recursively for source files, skipping hidden
// directories. `**` patterns are matched against every file below their
// literal prefix. Inside a git work tree, paths ignored by `.gitignore` are
// dropped, except paths named literally on the command line. Patterns
// matching nothing contribute nothing.
[[nodiscard]] auto discover_files(const std::vector<std::string>& patterns,
                                  const std::vector<std::string>& ignore)
    -> Result<std::vector<std::string>, std::string>;

} // namespace schemat::cli

#endif // SCHEMAT_CLI_DISCOVERY_HPP
