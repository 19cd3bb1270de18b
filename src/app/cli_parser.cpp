#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace runvault::app::cli {

    using namespace runvault::core::errors;
    using runvault::protocol::CliCommand;
    using runvault::protocol::CliRequest;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> command;
            std::vector<std::string> positionals;
            std::optional<std::string> base_dir;
            std::optional<std::string> config;
            std::optional<std::string> flow;
            std::optional<std::string> status;
            std::optional<std::string> limit;
            std::optional<std::string> max;
            bool verbose = false;
            bool dry_run = false;
            bool case_sensitive = false;
            bool markdown = false;
        };

        const std::unordered_map<std::string, CliCommand>& command_table() {
            static const std::unordered_map<std::string, CliCommand> table = {
                {"cleanup", CliCommand::Cleanup},
                {"cleanup-archives", CliCommand::CleanupArchives},
                {"archive", CliCommand::Archive},
                {"restore", CliCommand::Restore},
                {"archives", CliCommand::Archives},
                {"delete-archive", CliCommand::DeleteArchive},
                {"usage", CliCommand::Usage},
                {"list", CliCommand::List},
                {"show", CliCommand::Show},
                {"stats", CliCommand::Stats},
                {"search", CliCommand::Search},
            };
            return table;
        }

        StoreError usage_error(const std::string& message, const std::string& code) {
            return StoreError{ErrorCategory::Input, message, code, "Run 'runvault --help' for usage."};
        }

        // Exception-free integer parsing
        Result<std::size_t> parse_count(const std::string& flag, const std::string& text) {
            std::size_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return StoreError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value > 1000000) {
                return StoreError{ErrorCategory::Input, flag + " out of bounds", "bounds_error", "Must be at most 1000000."};
            }
            return value;
        }

        bool takes_run_id(const CliCommand command) {
            return command == CliCommand::Archive || command == CliCommand::Restore ||
                   command == CliCommand::DeleteArchive || command == CliCommand::Show;
        }

    }  // namespace

    std::string usage_text() {
        return "Usage: runvault [--base-dir DIR] [--config FILE] [--verbose] <command> [args]\n"
               "\n"
               "Commands:\n"
               "  cleanup [--dry-run]             apply the retention policy to runs\n"
               "  cleanup-archives [--dry-run]    delete expired archives\n"
               "  archive <run_id>                archive one run now\n"
               "  restore <run_id>                restore an archived run\n"
               "  archives                        list archived run ids\n"
               "  delete-archive <run_id>         delete one archive\n"
               "  usage                           report disk usage\n"
               "  list [--flow F] [--status S] [--limit N]\n"
               "  show <run_id> [--markdown]\n"
               "  stats                           aggregate token and cost statistics\n"
               "  search <query> [--case-sensitive] [--max N]\n";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return usage_error("No command provided.", "missing_command");
        }

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        RawCliOptions raw;
        auto take_value = [&args](std::size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--base-dir") {
                if (!take_value(i, raw.base_dir)) return usage_error("Missing value for --base-dir", "missing_value");
            } else if (arg == "--config") {
                if (!take_value(i, raw.config)) return usage_error("Missing value for --config", "missing_value");
            } else if (arg == "--flow") {
                if (!take_value(i, raw.flow)) return usage_error("Missing value for --flow", "missing_value");
            } else if (arg == "--status") {
                if (!take_value(i, raw.status)) return usage_error("Missing value for --status", "missing_value");
            } else if (arg == "--limit") {
                if (!take_value(i, raw.limit)) return usage_error("Missing value for --limit", "missing_value");
            } else if (arg == "--max") {
                if (!take_value(i, raw.max)) return usage_error("Missing value for --max", "missing_value");
            } else if (arg == "--verbose" || arg == "-v") {
                raw.verbose = true;
            } else if (arg == "--dry-run") {
                raw.dry_run = true;
            } else if (arg == "--case-sensitive") {
                raw.case_sensitive = true;
            } else if (arg == "--markdown") {
                raw.markdown = true;
            } else if (arg == "--") {
                for (++i; i < args.size(); ++i) {
                    raw.positionals.push_back(args[i]);
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                return usage_error("Unknown argument: " + arg, "unknown_argument");
            } else if (!raw.command.has_value()) {
                raw.command = arg;
            } else {
                raw.positionals.push_back(arg);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (!raw.command.has_value()) {
            return usage_error("No command provided.", "missing_command");
        }
        const auto found = command_table().find(raw.command.value());
        if (found == command_table().end()) {
            return usage_error("Unknown command: " + raw.command.value(), "unknown_command");
        }

        CliRequest req;
        req.command = found->second;
        req.verbose = raw.verbose;
        if (raw.base_dir) {
            if (raw.base_dir->empty()) return usage_error("--base-dir cannot be empty", "invalid_path");
            req.base_dir = std::filesystem::path(raw.base_dir.value());
        }
        if (raw.config) req.config_path = std::filesystem::path(raw.config.value());

        const std::size_t expected_positionals =
            (takes_run_id(req.command) || req.command == CliCommand::Search) ? 1 : 0;
        if (raw.positionals.size() < expected_positionals) {
            return usage_error("Missing argument for '" + raw.command.value() + "'", "missing_argument");
        }
        if (raw.positionals.size() > expected_positionals) {
            return usage_error("Unexpected argument: " + raw.positionals[expected_positionals], "unexpected_argument");
        }
        if (takes_run_id(req.command)) {
            req.run_id = raw.positionals.front();
        }
        if (req.command == CliCommand::Search) {
            req.query = raw.positionals.front();
            if (req.query.empty()) return usage_error("Search query cannot be empty", "empty_query");
        }

        // Flags only make sense for the commands that read them
        const bool is_cleanup = req.command == CliCommand::Cleanup || req.command == CliCommand::CleanupArchives;
        if (raw.dry_run && !is_cleanup) {
            return usage_error("--dry-run applies only to cleanup commands", "conflicting_flags");
        }
        req.dry_run = raw.dry_run;

        if ((raw.flow || raw.status || raw.limit) && req.command != CliCommand::List) {
            return usage_error("--flow, --status and --limit apply only to 'list'", "conflicting_flags");
        }
        if (raw.flow) req.flow_id = raw.flow.value();
        if (raw.status) {
            req.status = runvault::protocol::parse_run_status(raw.status.value());
            if (!req.status.has_value()) {
                return StoreError{ErrorCategory::Input, "Invalid value for --status: " + raw.status.value(), "invalid_status", "Use running, completed, failed or canceled."};
            }
        }
        if (raw.limit) {
            auto limit = parse_count("--limit", raw.limit.value());
            if (is_error(limit)) return get_error(limit);
            req.limit = get_value(limit);
        }

        if ((raw.case_sensitive || raw.max) && req.command != CliCommand::Search) {
            return usage_error("--case-sensitive and --max apply only to 'search'", "conflicting_flags");
        }
        req.case_sensitive = raw.case_sensitive;
        if (raw.max) {
            auto max = parse_count("--max", raw.max.value());
            if (is_error(max)) return get_error(max);
            req.max_results = get_value(max);
        }

        if (raw.markdown && req.command != CliCommand::Show) {
            return usage_error("--markdown applies only to 'show'", "conflicting_flags");
        }
        req.markdown = raw.markdown;

        return req;
    }

} // namespace runvault::app::cli
