#include <meshdest/protohttp/framing.h>

#include <algorithm>
#include <array>

namespace meshdest::protohttp {

namespace {

std::uint32_t DecodeLength(std::string_view header) {
    return static_cast<std::uint32_t>(static_cast<unsigned char>(header[0])) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(header[1])) << 8 |
           static_cast<std::uint32_t>(static_cast<unsigned char>(header[2])) << 16 |
           static_cast<std::uint32_t>(static_cast<unsigned char>(header[3])) << 24;
}

} // namespace

std::string SerializeAsPayload(std::string_view payload) {
    const auto len = static_cast<std::uint32_t>(payload.size());
    std::string out;
    out.reserve(kFrameHeaderSize + payload.size());
    out.push_back(static_cast<char>(len & 0xff));
    out.push_back(static_cast<char>((len >> 8) & 0xff));
    out.push_back(static_cast<char>((len >> 16) & 0xff));
    out.push_back(static_cast<char>((len >> 24) & 0xff));
    out.append(payload);
    return out;
}

Result<std::string> DeserializePayload(std::string_view& in) {
    if (in.empty()) {
        return Status(StatusCode::out_of_range, "no frame");
    }
    if (in.size() < kFrameHeaderSize) {
        return Status(StatusCode::data_loss, "expected to read 4 bytes for frame length, got " +
                                                 std::to_string(in.size()));
    }
    const std::size_t len = DecodeLength(in.substr(0, kFrameHeaderSize));
    if (in.size() - kFrameHeaderSize < len) {
        return Status(StatusCode::data_loss, "expected " + std::to_string(len) + " payload bytes, got " +
                                                 std::to_string(in.size() - kFrameHeaderSize));
    }
    std::string payload(in.substr(kFrameHeaderSize, len));
    in.remove_prefix(kFrameHeaderSize + len);
    return payload;
}

FrameReader::FrameReader(ReadSomeFn read_some) : read_some_(std::move(read_some)) {}

Status FrameReader::ReadExactly(std::size_t n, std::string& out, bool at_frame_start) {
    // Grows with the data actually received, so a bogus length prefix
    // cannot make us allocate up front.
    std::array<char, 4096> buf{};
    while (out.size() < n) {
        const auto want = std::min(n - out.size(), buf.size());
        auto got = read_some_(buf.data(), want);
        if (!got.ok()) {
            return got.status();
        }
        if (got.value() == 0) {
            if (at_frame_start && out.empty()) {
                return Status(StatusCode::out_of_range, "end of stream");
            }
            return Status(StatusCode::data_loss, "expected to read " + std::to_string(n) + " bytes, got " +
                                                     std::to_string(out.size()));
        }
        out.append(buf.data(), got.value());
    }
    return Status::Ok();
}

Result<std::string> FrameReader::Next() {
    std::string header;
    if (auto st = ReadExactly(kFrameHeaderSize, header, true); !st.ok()) {
        return st;
    }
    const std::size_t len = DecodeLength(header);

    std::string payload;
    if (auto st = ReadExactly(len, payload, false); !st.ok()) {
        return st;
    }
    return payload;
}

} // namespace meshdest::protohttp
