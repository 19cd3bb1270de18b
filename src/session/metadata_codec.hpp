#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/store_errors.hpp"
#include "protocol/transcript_contract.hpp"

namespace runvault::session {

inline constexpr const char* kMetadataFile = "metadata.json";
inline constexpr const char* kTranscriptFile = "transcript.json";
inline constexpr const char* kGzipSuffix = ".gz";

nlohmann::json meta_to_json(const protocol::RunMeta& meta);
nlohmann::json turn_to_json(const protocol::Turn& turn);
nlohmann::json transcript_to_json(const protocol::Transcript& transcript);

// Decoders never throw. Missing optional keys take their zero value and a
// null or pre-1970 "endedAt" reads as unset. A missing or unrecognised
// status is rejected, since retention decisions depend on it.
core::errors::Result<protocol::RunMeta> meta_from_json(const nlohmann::json& doc);
core::errors::Result<protocol::Turn> turn_from_json(const nlohmann::json& doc);

core::errors::Result<protocol::RunMeta> decode_metadata(const std::string& text);
core::errors::Result<protocol::Transcript> decode_transcript(const std::string& text);

// Serialises with `indent` spaces (-1 for one line). Invalid UTF-8 in
// strings is written as U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json& value, int indent = 2);

std::string encode_metadata(const protocol::RunMeta& meta);
std::string encode_transcript(const protocol::Transcript& transcript);

// <run_dir>/metadata.json
core::errors::Result<protocol::RunMeta> read_metadata(const std::filesystem::path& run_dir);
core::errors::Result<std::filesystem::path> write_metadata(const std::filesystem::path& run_dir,
                                                           const protocol::RunMeta& meta);

}  // namespace runvault::session
