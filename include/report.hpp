#ifndef REPORT_HPP
#define REPORT_HPP
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "branch_record.hpp"

enum class RunMode { Live, DryRun };

const char* to_string(RunMode mode);

/**
 * @brief Run metadata printed in the report header.
 */
struct ReportContext {
    RunMode mode = RunMode::Live;
    int threshold_days = 30;
    std::time_t generated_at = 0;
    std::string trunk = "main";
};

/**
 * @brief Render the audit report.
 *
 * Output depends only on the arguments, so identical inputs give
 * byte-identical text. Sections for empty buckets are omitted; the document
 * always ends with the END OF REPORT banner.
 *
 * @param outcomes Deletion outcomes in processing order; supplies failure
 *                 messages and the deleted count.
 */
std::string render_report(const ClassificationSummary& summary, const ReportContext& ctx,
                          const std::vector<DeletionOutcome>& outcomes);

/// JSON object holding the summary buckets.
nlohmann::json summary_to_json(const ClassificationSummary& summary);

/// Complete JSON document: context, summary and outcomes.
nlohmann::json report_to_json(const ClassificationSummary& summary, const ReportContext& ctx,
                              const std::vector<DeletionOutcome>& outcomes);

/// report_to_json() serialized with two-space indentation.
std::string render_json_report(const ClassificationSummary& summary, const ReportContext& ctx,
                               const std::vector<DeletionOutcome>& outcomes);

/**
 * @brief Write @p text verbatim to @p path.
 *
 * @return `false` with @p error filled in when the file cannot be written.
 */
bool write_report(const std::filesystem::path& path, const std::string& text,
                  std::string& error);

#endif // REPORT_HPP
