#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/commands.hpp"
#include "core/config/store_config.hpp"
#include "core/errors/store_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

    void log_error(const std::string& context, const runvault::core::errors::StoreError& err) {
        LOG_ERROR(context + " [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
    }

    bool wants_help(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h" || arg == "help") return true;
        }
        return false;
    }

}  // namespace

int main(int argc, char* argv[]) {
    using namespace runvault::core::errors;
    using runvault::core::logging::Logger;
    using runvault::core::logging::LogLevel;

    // 1. Diagnostics go to stderr, command output to stdout
    Logger::get().set_sink(std::cerr);
    Logger::get().set_component("runvault");

    if (wants_help(argc, argv)) {
        std::cout << runvault::app::cli::usage_text();
        return 0;
    }

    // 2. Parse CLI input and return normalized input errors
    auto parsed = runvault::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        log_error("Input error", get_error(parsed));
        std::cerr << runvault::app::cli::usage_text();
        return 2;
    }
    const auto& req = get_value(parsed);

    // 3. Resolve configuration; flags override the file
    runvault::core::config::StoreConfig config;
    if (req.config_path.has_value()) {
        auto loaded = runvault::core::config::load_store_config(req.config_path.value());
        if (is_error(loaded)) {
            log_error("Config error", get_error(loaded));
            return 2;
        }
        config = get_value(loaded);
    }
    if (req.base_dir.has_value()) {
        config.base_dir = req.base_dir.value();
    }
    Logger::get().set_min_level(req.verbose ? LogLevel::DEBUG : config.log_level);
    LOG_DEBUG("Store root: " + config.base_dir.string());

    // 4. Execute
    auto executed = runvault::app::run_command(req, config, std::cout);
    if (is_error(executed)) {
        log_error("Command failed", get_error(executed));
        return 1;
    }
    LOG_DEBUG("Command finished with " + std::to_string(get_value(executed)) + " item(s)");
    return 0;
}
