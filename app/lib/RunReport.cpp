#include "RunReport.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fstream>
#include <memory>
#include <utility>

#include <fmt/format.h>


RunReport::RunReport(bool check_only)
    : check_only_(check_only)
{
}


void RunReport::record(FileOutcome outcome)
{
    ++stats_.files_scanned;
    switch (outcome.status) {
        case FileStatus::Changed:
            ++stats_.files_changed;
            stats_.bytes_removed += static_cast<std::int64_t>(outcome.bytes_before)
                                  - static_cast<std::int64_t>(outcome.bytes_after);
            break;
        case FileStatus::Unchanged:
            ++stats_.files_unchanged;
            break;
        case FileStatus::Failed:
            ++stats_.files_failed;
            break;
    }
    outcomes_.push_back(std::move(outcome));
}


void RunReport::set_duration(std::chrono::milliseconds duration)
{
    stats_.duration = duration;
}


Json::Value RunReport::to_json() const
{
    Json::Value root(Json::objectValue);
    root["check_only"] = check_only_;

    Json::Value stats(Json::objectValue);
    stats["files_scanned"] = static_cast<Json::UInt64>(stats_.files_scanned);
    stats["files_changed"] = static_cast<Json::UInt64>(stats_.files_changed);
    stats["files_unchanged"] = static_cast<Json::UInt64>(stats_.files_unchanged);
    stats["files_failed"] = static_cast<Json::UInt64>(stats_.files_failed);
    stats["bytes_removed"] = static_cast<Json::Int64>(stats_.bytes_removed);
    stats["duration_ms"] = static_cast<Json::Int64>(stats_.duration.count());
    root["stats"] = stats;

    Json::Value files(Json::arrayValue);
    for (const auto& outcome : outcomes_) {
        Json::Value entry(Json::objectValue);
        entry["path"] = Utils::path_to_utf8(outcome.path);
        entry["status"] = to_string(outcome.status);
        if (outcome.status == FileStatus::Failed) {
            entry["reason"] = outcome.reason;
        }
        entry["bytes_before"] = static_cast<Json::UInt64>(outcome.bytes_before);
        entry["bytes_after"] = static_cast<Json::UInt64>(outcome.bytes_after);
        files.append(entry);
    }
    root["files"] = files;
    return root;
}


std::string RunReport::summary() const
{
    return fmt::format("Scanned {} file(s): {} {}, {} unchanged, {} failed in {} ms",
                       stats_.files_scanned,
                       stats_.files_changed,
                       check_only_ ? "would be cleaned" : "cleaned",
                       stats_.files_unchanged,
                       stats_.files_failed,
                       stats_.duration.count());
}


void RunReport::save(const std::filesystem::path& path) const
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, Utils::path_to_utf8(path));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(to_json(), &out);
    out << '\n';
    out.close();
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, Utils::path_to_utf8(path));
    }
}
