#ifndef FILE_SELECTOR_HPP
#define FILE_SELECTOR_HPP

#include "Types.hpp"

#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Lazily walks a directory tree and yields regular files with a selected extension.
 *
 * Depth-first, pre-order: within a directory entries are taken in path order and
 * the directory's files come before its subdirectories. Symbolic links are
 * neither followed nor yielded. Directories that cannot be listed are passed to
 * the error handler and skipped. A selector is consumed once.
 */
class FileSelector {
public:
    using ErrorHandler = std::function<void(const fs::path&, const std::error_code&)>;

    explicit FileSelector(SelectionCriteria criteria, ErrorHandler on_error = {});

    // Next matching file, or std::nullopt when the walk is exhausted.
    std::optional<fs::path> next();

    // Extension predicate only; does not touch the filesystem.
    bool matches(const fs::path& file) const;

    const SelectionCriteria& criteria() const { return criteria_; }

private:
    void start();
    void expand(const fs::path& directory);
    void report_error(const fs::path& path, const std::error_code& ec) const;
    std::string comparable(std::string extension) const;

    SelectionCriteria criteria_;
    ErrorHandler on_error_;
    std::set<std::string> extensions_;
    std::deque<fs::path> pending_files_;
    std::vector<fs::path> pending_directories_;
    bool started_{false};
};

#endif
