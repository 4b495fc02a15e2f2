#ifndef RUN_REPORT_HPP
#define RUN_REPORT_HPP

#include "Types.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <json/json.h>

/**
 * @brief Ordered per-file outcomes of one run plus the aggregate statistics.
 *
 * record() keeps the counters in step with the outcome list, so
 * files_scanned always equals changed + unchanged + failed.
 */
class RunReport {
public:
    explicit RunReport(bool check_only = false);

    void record(FileOutcome outcome);
    void set_duration(std::chrono::milliseconds duration);

    const std::vector<FileOutcome>& outcomes() const { return outcomes_; }
    const RunStats& stats() const { return stats_; }
    bool check_only() const { return check_only_; }
    bool has_failures() const { return stats_.files_failed > 0; }
    bool has_changes() const { return stats_.files_changed > 0; }

    Json::Value to_json() const;
    std::string summary() const;

    // Throws ErrorCodes::AppException when the file cannot be written.
    void save(const std::filesystem::path& path) const;

private:
    std::vector<FileOutcome> outcomes_;
    RunStats stats_;
    bool check_only_;
};

#endif
