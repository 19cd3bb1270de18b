#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "protocol/transcript_contract.hpp"

namespace runvault::protocol {

    enum class CliCommand {
        Cleanup,          // cleanup [--dry-run]
        CleanupArchives,  // cleanup-archives [--dry-run]
        Archive,          // archive <run_id>
        Restore,          // restore <run_id>
        Archives,         // archives
        DeleteArchive,    // delete-archive <run_id>
        Usage,            // usage
        List,             // list [--flow F] [--status S] [--limit N]
        Show,             // show <run_id> [--markdown]
        Stats,            // stats
        Search            // search <query> [--case-sensitive] [--max N]
    };

    // Validated command line for the runvault maintenance tool
    struct CliRequest {
        CliCommand command = CliCommand::Usage;
        std::optional<std::filesystem::path> base_dir;     // overrides the config file
        std::optional<std::filesystem::path> config_path;
        bool verbose = false;

        bool dry_run = false;
        std::string run_id;
        std::string query;
        bool case_sensitive = false;
        std::size_t max_results = 0;
        std::string flow_id;
        std::optional<RunStatus> status;
        std::size_t limit = 0;
        bool markdown = false;
    };

} // namespace runvault::protocol
