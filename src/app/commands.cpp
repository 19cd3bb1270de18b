#include "commands.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "session/metadata_codec.hpp"
#include "session/lifecycle_manager.hpp"
#include "session/transcript_search.hpp"
#include "session/transcript_store.hpp"
#include "session/transcript_view.hpp"

namespace runvault::app {

    using namespace runvault::core::errors;
    using runvault::core::config::StoreConfig;
    using runvault::protocol::CliCommand;
    using runvault::protocol::CliRequest;
    using nlohmann::json;

    namespace {

        json cleanup_to_json(const session::CleanupResult& result, const bool dry_run) {
            return json{
                {"dryRun", dry_run},
                {"archived", result.archived},
                {"deleted", result.deleted},
                {"kept", result.kept},
                {"errors", result.errors},
                {"spaceSaved", result.space_saved},
                {"archivedBytes", result.archived_bytes},
            };
        }

        Result<std::size_t> run_cleanup(const CliRequest& req, const session::LifecycleManager& lifecycle,
                                        std::ostream& out) {
            auto cleaned = req.command == CliCommand::Cleanup ? lifecycle.cleanup(req.dry_run)
                                                              : lifecycle.cleanup_archives(req.dry_run);
            if (is_error(cleaned)) return get_error(cleaned);
            const auto& result = get_value(cleaned);
            for (const auto& failure : result.errors) {
                LOG_WARN("Cleanup skipped " + failure);
            }
            out << session::dump_json(cleanup_to_json(result, req.dry_run)) << "\n";
            return result.archived.size() + result.deleted.size();
        }

        Result<std::size_t> run_list(const CliRequest& req, const StoreConfig& config, std::ostream& out) {
            session::TranscriptStore store(config.base_dir, config.transcript_compress_above);
            session::ListFilter filter;
            filter.flow_id = req.flow_id;
            filter.status = req.status;
            filter.limit = req.limit;
            auto listed = store.list(filter);
            if (is_error(listed)) return get_error(listed);
            out << session::format_meta_list(get_value(listed));
            return get_value(listed).size();
        }

        Result<std::size_t> run_show(const CliRequest& req, const StoreConfig& config, std::ostream& out) {
            session::TranscriptStore store(config.base_dir, config.transcript_compress_above);
            auto loaded = store.load(req.run_id);
            if (is_error(loaded)) return get_error(loaded);
            const auto& transcript = get_value(loaded);
            out << (req.markdown ? session::export_markdown(transcript) : session::render_full(transcript));
            return transcript.turns.size();
        }

        Result<std::size_t> run_search(const CliRequest& req, const StoreConfig& config, std::ostream& out) {
            session::TranscriptSearcher searcher(config.base_dir);
            if (searcher.backend() != nullptr) {
                LOG_DEBUG("Search backend: " + searcher.backend()->name());
            }
            session::SearchOptions options;
            options.case_sensitive = req.case_sensitive;
            options.max_results = req.max_results;
            auto found = searcher.search_content(req.query, options);
            if (is_error(found)) return get_error(found);
            for (const auto& match : get_value(found)) {
                out << match.run_id;
                if (match.line_number.has_value()) {
                    out << ":" << match.line_number.value();
                }
                out << ": " << match.text << "\n";
            }
            return get_value(found).size();
        }

    }  // namespace

    Result<std::size_t> run_command(const CliRequest& req, const StoreConfig& config, std::ostream& out) {
        session::LifecycleManager lifecycle(config.base_dir, config.retention);

        switch (req.command) {
            case CliCommand::Cleanup:
            case CliCommand::CleanupArchives:
                return run_cleanup(req, lifecycle, out);

            case CliCommand::Archive: {
                auto archived = lifecycle.archive_run(req.run_id);
                if (is_error(archived)) return get_error(archived);
                LOG_INFO("Archived " + req.run_id);
                out << get_value(archived).string() << "\n";
                return std::size_t{1};
            }

            case CliCommand::Restore: {
                auto restored = lifecycle.restore_archive(req.run_id);
                if (is_error(restored)) return get_error(restored);
                LOG_INFO("Restored " + req.run_id);
                out << get_value(restored).string() << "\n";
                return std::size_t{1};
            }

            case CliCommand::Archives: {
                auto archives = lifecycle.list_archives();
                if (is_error(archives)) return get_error(archives);
                for (const auto& id : get_value(archives)) {
                    out << id << "\n";
                }
                return get_value(archives).size();
            }

            case CliCommand::DeleteArchive: {
                auto deleted = lifecycle.delete_archive(req.run_id);
                if (is_error(deleted)) return get_error(deleted);
                out << "Deleted archive " << get_value(deleted) << "\n";
                return std::size_t{1};
            }

            case CliCommand::Usage: {
                auto usage = lifecycle.disk_usage();
                if (is_error(usage)) return get_error(usage);
                const auto& u = get_value(usage);
                const json report{
                    {"runCount", u.run_count},
                    {"archiveCount", u.archive_count},
                    {"activeSize", u.active_size},
                    {"archiveSize", u.archive_size},
                    {"totalSize", u.total_size},
                };
                out << session::dump_json(report) << "\n";
                return u.run_count + u.archive_count;
            }

            case CliCommand::List:
                return run_list(req, config, out);

            case CliCommand::Show:
                return run_show(req, config, out);

            case CliCommand::Stats: {
                session::TranscriptSearcher searcher(config.base_dir);
                auto stats = searcher.run_stats();
                if (is_error(stats)) return get_error(stats);
                out << session::format_stats(get_value(stats));
                return get_value(stats).total_runs;
            }

            case CliCommand::Search:
                return run_search(req, config, out);
        }

        return StoreError{ErrorCategory::Internal, "Unhandled command", "unhandled_command"};
    }

} // namespace runvault::app
