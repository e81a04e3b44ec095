/**
 * @file summary_printer.hpp
 * @brief human-readable run summary and process exit classification
 */
#pragma once

#include <expected>
#include <ostream>

#include "ckw/common/error.hpp"
#include "ckw/upload/upload_report.hpp"

namespace ckw::app
{

inline constexpr int kExitSuccess   = 0;
inline constexpr int kExitFailures  = 1;   ///< at least one artifact failed
inline constexpr int kExitRunError  = 2;   ///< config, capability fetch or auth
inline constexpr int kExitCancelled = 130; ///< SIGINT / SIGTERM

/**
 * @brief writes completed / failed / timed out sections plus the counters
 *
 * ⚠️ IMPURE FUNCTION (writes to the stream)
 */
void print_summary(const upload::RunSummary &summary, std::ostream &out);

/**
 * @brief maps the run outcome onto the process exit code
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto exit_code(const std::expected<upload::RunSummary, Error> &outcome, bool timeouts_are_failures)
    -> int;

} // namespace ckw::app
