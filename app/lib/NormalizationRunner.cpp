#include "NormalizationRunner.hpp"
#include "FileSelector.hpp"
#include "Logger.hpp"
#include "TextNormalizer.hpp"
#include "Utils.hpp"

#include <chrono>
#include <exception>
#include <utility>


NormalizationRunner::NormalizationRunner(RunOptions options, IFileStore& store)
    : options_(std::move(options)),
      store_(store)
{
}


RunReport NormalizationRunner::run()
{
    const auto started = std::chrono::steady_clock::now();
    RunReport report(options_.check_only);

    FileSelector selector(options_.selection,
        [this, &report](const std::filesystem::path& path, const std::error_code& ec) {
            FileOutcome outcome;
            outcome.path = path;
            outcome.status = FileStatus::Failed;
            outcome.reason = ec.message();
            log_outcome(outcome);
            report.record(std::move(outcome));
        });

    while (auto path = selector.next()) {
        FileOutcome outcome = process_file(*path);
        log_outcome(outcome);
        report.record(std::move(outcome));
    }

    report.set_duration(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started));

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("{}", report.summary());
    }
    return report;
}


FileOutcome NormalizationRunner::process_file(const std::filesystem::path& path)
{
    FileOutcome outcome;
    outcome.path = path;

    try {
        const std::string content = store_.read_all(path);
        outcome.bytes_before = content.size();

        NormalizationResult result = TextNormalizer::normalize(content, options_.normalization);
        outcome.bytes_after = result.content.size();
        if (!result.changed) {
            outcome.status = FileStatus::Unchanged;
            return outcome;
        }

        if (!options_.check_only) {
            store_.write_all(path, result.content);
        }
        outcome.status = FileStatus::Changed;
    } catch (const std::exception& ex) {
        outcome.status = FileStatus::Failed;
        outcome.reason = ex.what();
    }
    return outcome;
}


void NormalizationRunner::log_outcome(const FileOutcome& outcome) const
{
    auto logger = Logger::get_logger("core_logger");
    if (!logger) {
        return;
    }

    const std::string display = Utils::path_to_utf8(outcome.path);
    switch (outcome.status) {
        case FileStatus::Changed:
            logger->info("{}: {}", options_.check_only ? "Would clean" : "Cleaned", display);
            break;
        case FileStatus::Unchanged:
            logger->debug("Unchanged: {}", display);
            break;
        case FileStatus::Failed:
            logger->error("Not cleaned: {}: {}", display, outcome.reason);
            break;
    }
}
