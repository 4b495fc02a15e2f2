#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

enum class LineTerminator {None, Lf, CrLf};

inline std::string_view to_string(LineTerminator terminator) {
    switch (terminator) {
        case LineTerminator::Lf: return "\n";
        case LineTerminator::CrLf: return "\r\n";
        case LineTerminator::None: return "";
    }
    return "";
}

/**
 * @brief One line of a file: its content and the terminator that ended it.
 *
 * The content views the buffer the line was tokenized from and must not
 * outlive it.
 */
struct Line {
    std::string_view content;
    LineTerminator terminator{LineTerminator::None};
};

struct NormalizationConfig {
    bool eof_newline_normalization{true};
};

struct NormalizationResult {
    std::string content;
    bool changed{false};
};

struct SelectionCriteria {
    std::filesystem::path root;
    std::set<std::string> extensions; ///< Stored without the leading dot.
    bool case_sensitive{true};
};

enum class FileStatus {Changed, Unchanged, Failed};

inline std::string to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Changed: return "changed";
        case FileStatus::Unchanged: return "unchanged";
        case FileStatus::Failed: return "failed";
        default: return "unknown";
    }
}

struct FileOutcome {
    std::filesystem::path path;
    FileStatus status{FileStatus::Unchanged};
    std::string reason;
    std::uintmax_t bytes_before{0};
    std::uintmax_t bytes_after{0};
};

struct RunStats {
    std::size_t files_scanned{0};
    std::size_t files_changed{0};
    std::size_t files_unchanged{0};
    std::size_t files_failed{0};
    std::int64_t bytes_removed{0}; ///< Net; negative when only terminators were added.
    std::chrono::milliseconds duration{0};
};

#endif
