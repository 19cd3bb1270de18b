#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/store_errors.hpp"

namespace runvault::tools {

struct ProcessRequest {
    // argv[0] is looked up on PATH; no shell is involved.
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 30000;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// Returns the first executable named `program` on PATH.
std::optional<std::filesystem::path> find_in_path(const std::string& program);

}  // namespace runvault::tools
