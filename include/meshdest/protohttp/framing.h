#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <meshdest/core/status.h>

namespace meshdest::protohttp {

// Every frame is a 4 byte little-endian payload length followed by exactly
// that many payload bytes.
inline constexpr std::size_t kFrameHeaderSize = 4;

std::string SerializeAsPayload(std::string_view payload);

// Consumes one frame from the front of `in`. `in` is left untouched on
// failure: out_of_range if it is empty, data_loss if it holds a truncated
// frame.
Result<std::string> DeserializePayload(std::string_view& in);

// Reads frames off a byte stream. Never resynchronizes: after a failure the
// stream is unusable.
class FrameReader {
public:
    // Reads up to `len` bytes into `buf`; 0 means end of stream.
    using ReadSomeFn = std::function<Result<std::size_t>(char* buf, std::size_t len)>;

    explicit FrameReader(ReadSomeFn read_some);

    // out_of_range on a clean end of stream before a frame header,
    // data_loss when the stream ends inside a frame, or the read error.
    Result<std::string> Next();

private:
    Status ReadExactly(std::size_t n, std::string& out, bool at_frame_start);

    ReadSomeFn read_some_;
};

} // namespace meshdest::protohttp
