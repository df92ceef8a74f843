#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rpcstdio {

enum class Framing {
    newline,        // one JSON object per line
    content_length, // "Content-Length: N\r\n\r\n" + N bytes
};

const char* to_string(Framing framing);

/// Accepts "newline" and "content-length". Throws std::invalid_argument.
Framing parse_framing(const std::string& name);

struct DecodeResult {
    std::vector<std::string> messages;
    std::string remainder;
};

/**
 * Extract every complete payload from `buffer`.
 *
 * Never blocks and never fails: incomplete or unrecognisable data is left in
 * the remainder until more bytes arrive.
 */
DecodeResult decode_frames(std::string_view buffer, Framing framing);

/// Wrap a serialised payload for the wire.
std::string encode_frame(std::string_view payload, Framing framing);

/**
 * Accumulation buffer for one inbound stream. Not thread safe; it belongs to
 * whichever thread reads the stream.
 */
class FrameDecoder {
public:
    explicit FrameDecoder(Framing framing) : framing_(framing) {}

    /// Append a chunk and return the payloads it completed, in stream order.
    std::vector<std::string> feed(std::string_view chunk);

    Framing framing() const { return framing_; }
    std::size_t buffered() const { return buffer_.size(); }

private:
    Framing framing_;
    std::string buffer_;
};

} // namespace rpcstdio
