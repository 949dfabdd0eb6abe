#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "protocol/message_contract.hpp"

namespace vidmcp::protocol {

// Parses one framed line into a Request, Notification or Response.
// Error codes: "parse_error" (not JSON), "invalid_request" (JSON but not a
// JSON-RPC 2.0 message).
core::errors::Result<Message> parse_message(const std::string& line);

// Best-effort id recovery from a line that failed to parse, so the failure
// can still be answered. Accepts integer and string ids only.
std::optional<nlohmann::json> recover_request_id(const std::string& line);

Response make_result(const nlohmann::json& id, nlohmann::json result);
Response make_error(const nlohmann::json& id, int code, const std::string& message);

// Maps a ServerError onto the JSON-RPC code reported for it.
int error_code_for(const core::errors::ServerError& error);

nlohmann::json to_json(const Response& response);

// Compact single-line serialisation; invalid UTF-8 is replaced, not thrown.
std::string serialize(const Response& response);

}  // namespace vidmcp::protocol
