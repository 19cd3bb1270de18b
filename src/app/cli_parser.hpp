#pragma once
#include <string>
#include "core/errors/store_errors.hpp"
#include "protocol/cli_request.hpp"

namespace runvault::app::cli {
    runvault::core::errors::Result<runvault::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage_text();
}
