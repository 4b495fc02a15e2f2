#include "FileSelector.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>


FileSelector::FileSelector(SelectionCriteria criteria, ErrorHandler on_error)
    : criteria_(std::move(criteria)),
      on_error_(std::move(on_error))
{
    for (const auto& extension : criteria_.extensions) {
        std::string normalized = Utils::normalize_extension(extension);
        if (!normalized.empty()) {
            extensions_.insert(comparable(std::move(normalized)));
        }
    }
}


std::optional<fs::path> FileSelector::next()
{
    if (!started_) {
        started_ = true;
        start();
    }

    while (pending_files_.empty()) {
        if (pending_directories_.empty()) {
            return std::nullopt;
        }
        fs::path directory = std::move(pending_directories_.back());
        pending_directories_.pop_back();
        expand(directory);
    }

    fs::path file = std::move(pending_files_.front());
    pending_files_.pop_front();
    return file;
}


bool FileSelector::matches(const fs::path& file) const
{
    const std::string extension = Utils::path_to_utf8(file.filename().extension());
    if (extension.size() < 2) {
        return false;
    }
    return extensions_.contains(comparable(extension.substr(1)));
}


void FileSelector::start()
{
    const fs::path& root = criteria_.root;
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Selecting files under '{}' with extension(s) {}{}",
                      Utils::path_to_utf8(root),
                      fmt::join(extensions_, ", "),
                      criteria_.case_sensitive ? "" : " (ignoring case)");
    }

    std::error_code ec;
    const fs::file_status status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        report_error(root, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        return;
    }

    if (fs::is_directory(status)) {
        pending_directories_.push_back(root);
    } else if (fs::is_regular_file(status) && matches(root)) {
        pending_files_.push_back(root);
    }
}


void FileSelector::expand(const fs::path& directory)
{
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        report_error(directory, ec);
        return;
    }

    std::vector<fs::directory_entry> entries;
    const fs::directory_iterator end;
    while (it != end) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            report_error(directory, ec);
            break;
        }
    }
    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.path() < rhs.path();
    });

    std::vector<fs::path> subdirectories;
    for (const auto& entry : entries) {
        std::error_code status_ec;
        const fs::file_status status = entry.symlink_status(status_ec);
        if (status_ec) {
            report_error(entry.path(), status_ec);
            continue;
        }

        if (fs::is_directory(status)) {
            subdirectories.push_back(entry.path());
        } else if (fs::is_regular_file(status) && matches(entry.path())) {
            pending_files_.push_back(entry.path());
        } else if (auto logger = Logger::get_logger("core_logger")) {
            logger->trace("Skipping '{}'", Utils::path_to_utf8(entry.path()));
        }
    }

    // Stack: push in reverse so the first subdirectory is expanded next.
    pending_directories_.insert(pending_directories_.end(),
                                subdirectories.rbegin(), subdirectories.rend());
}


void FileSelector::report_error(const fs::path& path, const std::error_code& ec) const
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Traversal error at '{}': {}", Utils::path_to_utf8(path), ec.message());
    }
    if (on_error_) {
        on_error_(path, ec);
    }
}


std::string FileSelector::comparable(std::string extension) const
{
    if (criteria_.case_sensitive) {
        return extension;
    }
    return Utils::to_lower_ascii(std::move(extension));
}
