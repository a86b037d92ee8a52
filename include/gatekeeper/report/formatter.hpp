#pragma once

#include <gatekeeper/schema/alignment_verdict.hpp>
#include <gatekeeper/schema/engine_statistics.hpp>
#include <gatekeeper/schema/failure_summary.hpp>
#include <gatekeeper/schema/verbosity.hpp>

#include <string>

namespace gatekeeper::report {

/// Render a verdict as plain text.
///
/// `full` lists every check grouped by category (first-seen order) followed
/// by timing, counts and the final verdict; `summary` keeps only the verdict
/// and, when denied, the failure report; `silent` renders nothing.
std::string render_verdict(const schema::alignment_verdict_t& verdict,
                           schema::verbosity_t verbosity);

/// Critical failures first, then non-critical ones, then violated rules.
std::string render_failure_summary(const schema::failure_summary_t& summary);

std::string render_statistics(const schema::engine_statistics_t& statistics);

}  // namespace gatekeeper::report
