#include "session/metadata_codec.hpp"

#include "core/fs/file_io.hpp"

namespace runvault::session {

using core::errors::ErrorCategory;
using core::errors::StoreError;
using nlohmann::json;
using protocol::RunMeta;
using protocol::Transcript;
using protocol::Turn;

namespace {

StoreError invalid_metadata(const std::string& message) {
    return StoreError{ErrorCategory::Io, message, "invalid_metadata"};
}

StoreError invalid_transcript(const std::string& message) {
    return StoreError{ErrorCategory::Io, message, "invalid_transcript"};
}

bool is_present(const json& doc, const char* key) {
    return doc.contains(key) && !doc.at(key).is_null();
}

std::string string_field(const json& doc, const char* key) {
    return is_present(doc, key) ? doc.at(key).get<std::string>() : std::string();
}

std::int64_t int_field(const json& doc, const char* key) {
    return is_present(doc, key) ? doc.at(key).get<std::int64_t>() : 0;
}

json object_field(const json& doc, const char* key) {
    return is_present(doc, key) ? doc.at(key) : json::object();
}

// Returns false when the field is present but not a valid timestamp.
bool time_field(const json& doc, const char* key, core::time::TimePoint& out,
                std::string& error) {
    out = core::time::TimePoint{};
    if (!is_present(doc, key)) {
        return true;
    }
    auto parsed = core::time::parse_rfc3339(doc.at(key).get<std::string>());
    if (core::errors::is_error(parsed)) {
        error = std::string("'") + key + "': " + core::errors::get_error(parsed).message;
        return false;
    }
    out = core::errors::get_value(parsed);
    return true;
}

json tool_call_to_json(const protocol::ToolCall& call) {
    json doc;
    if (!call.id.empty()) {
        doc["id"] = call.id;
    }
    doc["name"] = call.name;
    doc["input"] = call.input.is_null() ? json::object() : call.input;
    if (!call.output.empty()) {
        doc["output"] = call.output;
    }
    if (!call.error.empty()) {
        doc["error"] = call.error;
    }
    return doc;
}

}  // namespace

json meta_to_json(const RunMeta& meta) {
    json doc;
    doc["runId"] = meta.run_id;
    doc["flowId"] = meta.flow_id;
    if (!meta.node_id.empty()) {
        doc["nodeId"] = meta.node_id;
    }
    if (!meta.input.is_null() && !meta.input.empty()) {
        doc["input"] = meta.input;
    }
    doc["status"] = protocol::to_string(meta.status);
    doc["startedAt"] = core::time::format_rfc3339(meta.started_at);
    if (meta.has_ended()) {
        doc["endedAt"] = core::time::format_rfc3339(meta.ended_at);
    }
    doc["totalTokensIn"] = meta.total_tokens_in;
    doc["totalTokensOut"] = meta.total_tokens_out;
    doc["totalCost"] = meta.total_cost;
    doc["turnCount"] = meta.turn_count;
    if (!meta.error.empty()) {
        doc["error"] = meta.error;
    }
    return doc;
}

json turn_to_json(const Turn& turn) {
    json doc;
    doc["id"] = turn.id;
    doc["role"] = protocol::to_string(turn.role);
    doc["content"] = turn.content;
    if (turn.tokens_in != 0) {
        doc["tokensIn"] = turn.tokens_in;
    }
    if (turn.tokens_out != 0) {
        doc["tokensOut"] = turn.tokens_out;
    }
    doc["timestamp"] = core::time::format_rfc3339(turn.timestamp);
    if (!turn.tool_calls.empty()) {
        json calls = json::array();
        for (const auto& call : turn.tool_calls) {
            calls.push_back(tool_call_to_json(call));
        }
        doc["toolCalls"] = calls;
    }
    if (turn.duration_ms.has_value()) {
        doc["durationMs"] = turn.duration_ms.value();
    }
    return doc;
}

json transcript_to_json(const Transcript& transcript) {
    json turns = json::array();
    for (const auto& turn : transcript.turns) {
        turns.push_back(turn_to_json(turn));
    }

    json doc;
    doc["runId"] = transcript.run_id;
    doc["metadata"] = meta_to_json(transcript.meta);
    doc["turns"] = turns;
    return doc;
}

core::errors::Result<RunMeta> meta_from_json(const json& doc) {
    if (!doc.is_object()) {
        return invalid_metadata("Run metadata must be a JSON object");
    }

    RunMeta meta;
    std::string error;
    try {
        meta.run_id = string_field(doc, "runId");
        meta.flow_id = string_field(doc, "flowId");
        meta.node_id = string_field(doc, "nodeId");
        meta.input = object_field(doc, "input");
        if (!meta.input.is_object()) {
            return invalid_metadata("'input' must be a JSON object");
        }
        meta.total_tokens_in = int_field(doc, "totalTokensIn");
        meta.total_tokens_out = int_field(doc, "totalTokensOut");
        meta.total_cost = is_present(doc, "totalCost") ? doc.at("totalCost").get<double>() : 0.0;
        meta.turn_count = static_cast<int>(int_field(doc, "turnCount"));
        meta.error = string_field(doc, "error");

        if (!is_present(doc, "status")) {
            return invalid_metadata("Run metadata has no status");
        }
        const auto status_text = doc.at("status").get<std::string>();
        const auto status = protocol::parse_run_status(status_text);
        if (!status.has_value()) {
            return invalid_metadata("Unknown run status: " + status_text);
        }
        meta.status = status.value();

        if (!time_field(doc, "startedAt", meta.started_at, error) ||
            !time_field(doc, "endedAt", meta.ended_at, error)) {
            return invalid_metadata(error);
        }
    } catch (const json::exception& e) {
        return invalid_metadata(std::string("Malformed run metadata: ") + e.what());
    }
    return meta;
}

core::errors::Result<Turn> turn_from_json(const json& doc) {
    if (!doc.is_object()) {
        return invalid_transcript("Turn must be a JSON object");
    }

    Turn turn;
    std::string error;
    try {
        turn.id = static_cast<int>(int_field(doc, "id"));
        const auto role_text = string_field(doc, "role");
        const auto role = protocol::parse_turn_role(role_text);
        if (!role.has_value()) {
            return invalid_transcript("Unknown turn role: " + role_text);
        }
        turn.role = role.value();
        turn.content = string_field(doc, "content");
        turn.tokens_in = int_field(doc, "tokensIn");
        turn.tokens_out = int_field(doc, "tokensOut");
        if (is_present(doc, "durationMs")) {
            turn.duration_ms = doc.at("durationMs").get<std::int64_t>();
        }
        if (!time_field(doc, "timestamp", turn.timestamp, error)) {
            return invalid_transcript(error);
        }
        if (is_present(doc, "toolCalls")) {
            for (const auto& item : doc.at("toolCalls")) {
                protocol::ToolCall call;
                call.id = string_field(item, "id");
                call.name = string_field(item, "name");
                call.input = is_present(item, "input") ? item.at("input") : json::object();
                call.output = string_field(item, "output");
                call.error = string_field(item, "error");
                turn.tool_calls.push_back(std::move(call));
            }
        }
    } catch (const json::exception& e) {
        return invalid_transcript(std::string("Malformed turn: ") + e.what());
    }
    return turn;
}

core::errors::Result<RunMeta> decode_metadata(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return invalid_metadata(std::string("Malformed run metadata JSON: ") + e.what());
    }
    return meta_from_json(doc);
}

core::errors::Result<Transcript> decode_transcript(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return invalid_transcript(std::string("Malformed transcript JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return invalid_transcript("Transcript must be a JSON object");
    }

    Transcript transcript;
    try {
        transcript.run_id = string_field(doc, "runId");
    } catch (const json::exception& e) {
        return invalid_transcript(std::string("Malformed transcript: ") + e.what());
    }

    auto meta = meta_from_json(doc.contains("metadata") ? doc.at("metadata") : json());
    if (core::errors::is_error(meta)) {
        return invalid_transcript(core::errors::get_error(meta).message);
    }
    transcript.meta = core::errors::take_value(std::move(meta));
    if (transcript.meta.run_id.empty()) {
        transcript.meta.run_id = transcript.run_id;
    }

    if (doc.contains("turns") && !doc.at("turns").is_null()) {
        if (!doc.at("turns").is_array()) {
            return invalid_transcript("'turns' must be an array");
        }
        for (const auto& item : doc.at("turns")) {
            auto turn = turn_from_json(item);
            if (core::errors::is_error(turn)) {
                return core::errors::get_error(turn);
            }
            transcript.turns.push_back(core::errors::take_value(std::move(turn)));
        }
    }
    return transcript;
}

std::string dump_json(const json& value, const int indent) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string encode_metadata(const RunMeta& meta) {
    return dump_json(meta_to_json(meta));
}

std::string encode_transcript(const Transcript& transcript) {
    return dump_json(transcript_to_json(transcript));
}

core::errors::Result<RunMeta> read_metadata(const std::filesystem::path& run_dir) {
    auto text = core::fs::read_file(run_dir / kMetadataFile);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    return decode_metadata(core::errors::get_value(text));
}

core::errors::Result<std::filesystem::path> write_metadata(const std::filesystem::path& run_dir,
                                                           const RunMeta& meta) {
    return core::fs::write_file_atomic(run_dir / kMetadataFile, encode_metadata(meta));
}

}  // namespace runvault::session
