#ifndef NORMALIZATION_RUNNER_HPP
#define NORMALIZATION_RUNNER_HPP

#include "IFileStore.hpp"
#include "RunReport.hpp"
#include "Types.hpp"

#include <filesystem>

struct RunOptions {
    SelectionCriteria selection;
    NormalizationConfig normalization;
    bool check_only{false};
};

/**
 * @brief Drives one run: select, read, normalize and write back each file.
 *
 * Every file (and every directory the walk could not list) ends up as exactly
 * one FileOutcome in the returned report. A failure is recorded and the run
 * moves on to the next file. In check mode nothing is written.
 */
class NormalizationRunner {
public:
    NormalizationRunner(RunOptions options, IFileStore& store);

    RunReport run();
    FileOutcome process_file(const std::filesystem::path& path);

private:
    void log_outcome(const FileOutcome& outcome) const;

    RunOptions options_;
    IFileStore& store_;
};

#endif
