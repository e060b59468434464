#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/message_lite.h>

#include <meshdest/core/status.h>
#include <meshdest/http/types.h>

namespace meshdest::protohttp {

// Response header flagging an application error; its value is the error
// text and the body carries one ApiError frame.
inline constexpr std::string_view kErrorHeader = "linkerd-error";
inline constexpr std::string_view kContentType = "application/octet-stream";

// HTTP status an error is reported with: 400 for invalid_argument, 404 for
// not_found, 500 otherwise.
unsigned HttpStatusFor(const Status& status);

// `msg` serialized into one frame.
Result<std::string> SerializeFrame(const google::protobuf::MessageLite& msg);

// Consumes one frame from `in` and parses it into `msg`.
Status ParseFrame(std::string_view& in, google::protobuf::MessageLite& msg);

void WriteErrorToResponse(http::Response& resp, const Status& status);

// Interprets a response: the error carried next to the error header, an
// unavailable transport error for any other non-200 status, else OK.
Status CheckResponseForError(int http_status, const std::optional<std::string>& error_header,
                             std::string_view body);

// Request bodies are bare, unframed messages.
Status HttpRequestToProto(std::string_view body, google::protobuf::MessageLite& msg);

} // namespace meshdest::protohttp
