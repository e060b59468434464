#include <meshdest/core/status.h>

namespace meshdest {

std::string_view StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::failed_precondition: return "failed_precondition";
        case StatusCode::resource_exhausted: return "resource_exhausted";
        case StatusCode::out_of_range: return "out_of_range";
        case StatusCode::data_loss: return "data_loss";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "ok";
    }
    std::string out(StatusCodeName(code_));
    out.append(": ");
    out.append(message_);
    return out;
}

Status Status::Annotate(std::string_view context) const {
    if (ok()) {
        return *this;
    }
    std::string message(context);
    message.append(": ");
    message.append(message_);
    return Status(code_, std::move(message));
}

} // namespace meshdest
