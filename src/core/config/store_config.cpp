#include "core/config/store_config.hpp"

#include <nlohmann/json.hpp>
#include "core/fs/file_io.hpp"

namespace runvault::core::config {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using nlohmann::json;

namespace {

StoreError invalid_config(const std::string& message) {
    return StoreError{ErrorCategory::Input, message, "invalid_config",
                      "Check the key types in the configuration file."};
}

bool read_days(const json& section, const char* key, int& out, std::string& error) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& value = section.at(key);
    if (!value.is_number_integer()) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    const auto days = value.get<long long>();
    if (days < 0 || days > 100000) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    out = static_cast<int>(days);
    return true;
}

bool read_size(const json& doc, const char* key, std::size_t& out, std::string& error) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = value.get<std::size_t>();
    return true;
}

}  // namespace

core::errors::Result<StoreConfig> parse_store_config(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return invalid_config(std::string("Malformed configuration JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return invalid_config("Configuration root must be a JSON object");
    }

    StoreConfig config;
    std::string error;

    if (doc.contains("baseDir")) {
        if (!doc.at("baseDir").is_string() || doc.at("baseDir").get<std::string>().empty()) {
            return invalid_config("'baseDir' must be a non-empty string");
        }
        config.base_dir = doc.at("baseDir").get<std::string>();
    }
    if (!read_size(doc, "artifactCompressAbove", config.artifact_compress_above, error) ||
        !read_size(doc, "transcriptCompressAbove", config.transcript_compress_above, error)) {
        return invalid_config(error);
    }

    if (doc.contains("logLevel")) {
        if (!doc.at("logLevel").is_string()) {
            return invalid_config("'logLevel' must be a string");
        }
        const auto level = logging::parse_log_level(doc.at("logLevel").get<std::string>());
        if (!level.has_value()) {
            return invalid_config("'logLevel' must be one of debug, info, warn, error");
        }
        config.log_level = level.value();
    }

    if (doc.contains("retention")) {
        const auto& retention = doc.at("retention");
        if (!retention.is_object()) {
            return invalid_config("'retention' must be an object");
        }
        auto& policy = config.retention;
        if (!read_days(retention, "retentionDays", policy.retention_days, error) ||
            !read_days(retention, "archiveAfterDays", policy.archive_after_days, error) ||
            !read_days(retention, "archiveRetentionDays", policy.archive_retention_days, error) ||
            !read_days(retention, "keepMinRuns", policy.keep_min_runs, error)) {
            return invalid_config(error);
        }
        if (retention.contains("keepFailed")) {
            if (!retention.at("keepFailed").is_boolean()) {
                return invalid_config("'keepFailed' must be a boolean");
            }
            policy.keep_failed = retention.at("keepFailed").get<bool>();
        }
    }

    return config;
}

core::errors::Result<StoreConfig> load_store_config(const std::filesystem::path& path) {
    auto text = core::fs::read_file(path);
    if (core::errors::is_error(text)) {
        auto err = core::errors::get_error(text);
        err.code = "config_unreadable";
        err.hint = "Pass an existing file to --config.";
        return err;
    }
    return parse_store_config(core::errors::get_value(text));
}

}  // namespace runvault::core::config
