#pragma once
#include <ostream>
#include "core/config/store_config.hpp"
#include "core/errors/store_errors.hpp"
#include "protocol/cli_request.hpp"

namespace runvault::app {

    // Executes one validated CLI command against the store rooted at
    // config.base_dir. Command output goes to `out`; diagnostics go through
    // the logger. Returns the number of items reported.
    runvault::core::errors::Result<std::size_t> run_command(
        const runvault::protocol::CliRequest& req,
        const runvault::core::config::StoreConfig& config,
        std::ostream& out);

} // namespace runvault::app
