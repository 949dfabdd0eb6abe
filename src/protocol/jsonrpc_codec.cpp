#include "protocol/jsonrpc_codec.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

namespace vidmcp::protocol {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

void skip_spaces(const std::string& text, std::size_t& pos) {
    while (pos < text.size() &&
           std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
}

}  // namespace

core::errors::Result<Message> parse_message(const std::string& line) {
    json document = json::parse(line, nullptr, false);
    if (document.is_discarded()) {
        return ServerError{ErrorCategory::Protocol, "Parse error: invalid JSON",
                           "parse_error"};
    }
    if (!document.is_object()) {
        return ServerError{ErrorCategory::Protocol,
                           "Invalid Request: message must be a JSON object",
                           "invalid_request"};
    }

    const auto version = document.find("jsonrpc");
    if (version == document.end() || !version->is_string() ||
        version->get<std::string>() != "2.0") {
        return ServerError{ErrorCategory::Protocol,
                           "Invalid Request: jsonrpc must be \"2.0\"",
                           "invalid_request"};
    }

    const auto method = document.find("method");
    const auto id = document.find("id");

    if (method == document.end()) {
        // Only responses carry no method.
        const bool has_result = document.contains("result");
        const bool has_error = document.contains("error");
        if (id == document.end() || has_result == has_error) {
            return ServerError{ErrorCategory::Protocol,
                               "Invalid Request: missing method",
                               "invalid_request"};
        }
        Response response;
        response.id = *id;
        if (has_result) {
            response.result = document.at("result");
        } else {
            const json& err = document.at("error");
            ResponseError error;
            if (err.is_object()) {
                const auto code = err.find("code");
                if (code != err.end() && code->is_number_integer()) {
                    error.code = code->get<int>();
                }
                const auto text = err.find("message");
                if (text != err.end() && text->is_string()) {
                    error.message = text->get<std::string>();
                }
            }
            response.error = error;
        }
        return Message{std::move(response)};
    }

    if (!method->is_string() || method->get<std::string>().empty()) {
        return ServerError{ErrorCategory::Protocol,
                           "Invalid Request: method must be a non-empty string",
                           "invalid_request"};
    }

    json params = json::object();
    const auto params_it = document.find("params");
    if (params_it != document.end() && !params_it->is_null()) {
        if (!params_it->is_object() && !params_it->is_array()) {
            return ServerError{ErrorCategory::Protocol,
                               "Invalid Request: params must be structured",
                               "invalid_request"};
        }
        params = *params_it;
    }

    if (id == document.end()) {
        return Message{Notification{method->get<std::string>(), std::move(params)}};
    }
    if (!is_valid_id(*id)) {
        return ServerError{ErrorCategory::Protocol,
                           "Invalid Request: id must be a string or integer",
                           "invalid_request"};
    }
    return Message{Request{*id, method->get<std::string>(), std::move(params)}};
}

std::optional<json> recover_request_id(const std::string& line) {
    json document = json::parse(line, nullptr, false);
    if (!document.is_discarded()) {
        if (document.is_object()) {
            const auto id = document.find("id");
            if (id != document.end() && is_valid_id(*id)) {
                return *id;
            }
        }
        return std::nullopt;
    }

    // Truncated or otherwise broken JSON: scan for a top-level-looking "id".
    std::size_t pos = line.find("\"id\"");
    while (pos != std::string::npos) {
        std::size_t cursor = pos + 4;
        skip_spaces(line, cursor);
        if (cursor < line.size() && line[cursor] == ':') {
            ++cursor;
            skip_spaces(line, cursor);
            if (cursor < line.size() && line[cursor] == '"') {
                const std::size_t close = line.find('"', cursor + 1);
                if (close != std::string::npos) {
                    return json(line.substr(cursor + 1, close - cursor - 1));
                }
            } else {
                std::size_t end = cursor;
                if (end < line.size() && line[end] == '-') {
                    ++end;
                }
                while (end < line.size() &&
                       std::isdigit(static_cast<unsigned char>(line[end])) != 0) {
                    ++end;
                }
                const std::string digits = line.substr(cursor, end - cursor);
                if (!digits.empty() && digits != "-") {
                    json number = json::parse(digits, nullptr, false);
                    if (!number.is_discarded() && is_valid_id(number)) {
                        return number;
                    }
                }
            }
        }
        pos = line.find("\"id\"", pos + 4);
    }
    return std::nullopt;
}

Response make_result(const json& id, json result) {
    Response response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

Response make_error(const json& id, const int code, const std::string& message) {
    Response response;
    response.id = id;
    response.error = ResponseError{code, message};
    return response;
}

int error_code_for(const ServerError& error) {
    if (error.code == "parse_error") {
        return error_codes::kParseError;
    }
    if (error.code == "invalid_request") {
        return error_codes::kInvalidRequest;
    }
    if (error.code == "method_not_found") {
        return error_codes::kMethodNotFound;
    }
    if (error.code == "invalid_params" || error.category == ErrorCategory::Input) {
        return error_codes::kInvalidParams;
    }
    return error_codes::kInternalError;
}

json to_json(const Response& response) {
    json payload;
    payload["jsonrpc"] = "2.0";
    payload["id"] = response.id;
    if (response.error.has_value()) {
        payload["error"] = {{"code", response.error->code},
                            {"message", response.error->message}};
    } else {
        payload["result"] = response.result.value_or(json::object());
    }
    return payload;
}

std::string serialize(const Response& response) {
    return to_json(response).dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace vidmcp::protocol
