#pragma once

#include <string>
#include <vector>
#include "protocol/transcript_contract.hpp"
#include "session/transcript_search.hpp"

namespace runvault::session {

// Plain-text renderings used by the CLI.

std::string render_summary(const protocol::Transcript& transcript);
std::string render_full(const protocol::Transcript& transcript);
std::string export_markdown(const protocol::Transcript& transcript);
std::string format_meta_list(const std::vector<protocol::RunMeta>& metas);
std::string format_stats(const RunStatistics& stats);

// Wall-clock duration of a run, "running" runs measured up to now. Rounded
// to whole seconds, e.g. "1h2m3s" or "45s".
std::string format_run_duration(const protocol::RunMeta& meta);

}  // namespace runvault::session
