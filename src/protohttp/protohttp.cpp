#include <meshdest/protohttp/protohttp.h>

#include <meshdest/api/error.pb.h>
#include <meshdest/core/log.h>
#include <meshdest/protohttp/framing.h>

namespace meshdest::protohttp {

namespace {

StatusCode CodeForHttpStatus(int http_status) {
    switch (http_status) {
        case 400:
            return StatusCode::invalid_argument;
        case 404:
            return StatusCode::not_found;
        case 503:
            return StatusCode::unavailable;
        default:
            return StatusCode::internal_error;
    }
}

} // namespace

unsigned HttpStatusFor(const Status& status) {
    switch (status.code()) {
        case StatusCode::invalid_argument:
            return 400;
        case StatusCode::not_found:
            return 404;
        default:
            return 500;
    }
}

Result<std::string> SerializeFrame(const google::protobuf::MessageLite& msg) {
    std::string payload;
    if (!msg.SerializeToString(&payload)) {
        return Status(StatusCode::internal_error, "failed to serialize " + msg.GetTypeName());
    }
    return SerializeAsPayload(payload);
}

Status ParseFrame(std::string_view& in, google::protobuf::MessageLite& msg) {
    auto payload = DeserializePayload(in);
    if (!payload.ok()) {
        return payload.status();
    }
    if (!msg.ParseFromString(payload.value())) {
        return Status(StatusCode::data_loss, "malformed " + msg.GetTypeName() + " frame");
    }
    return Status::Ok();
}

void WriteErrorToResponse(http::Response& resp, const Status& status) {
    api::ApiError err;
    err.set_error(status.message());

    resp.status = HttpStatusFor(status);
    resp.content_type = std::string(kContentType);
    resp.headers[std::string(kErrorHeader)] = status.message();

    auto frame = SerializeFrame(err);
    if (!frame.ok()) {
        log::error("cannot encode error response: {}", frame.status().ToString());
        resp.body.clear();
        return;
    }
    resp.body = std::move(frame).value();
}

Status CheckResponseForError(int http_status, const std::optional<std::string>& error_header,
                             std::string_view body) {
    if (error_header) {
        api::ApiError err;
        if (auto st = ParseFrame(body, err); !st.ok()) {
            return st.Annotate("response has " + std::string(kErrorHeader) + " header but the error body is unreadable");
        }
        return Status(CodeForHttpStatus(http_status), err.error());
    }
    if (http_status != 200) {
        return Status(StatusCode::unavailable,
                      "HTTP error, status Code [" + std::to_string(http_status) + "] (unexpected API response)");
    }
    return Status::Ok();
}

Status HttpRequestToProto(std::string_view body, google::protobuf::MessageLite& msg) {
    if (!msg.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
        return Status(StatusCode::invalid_argument, "cannot parse request body as " + msg.GetTypeName());
    }
    return Status::Ok();
}

} // namespace meshdest::protohttp
