#include "frame_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>

namespace rpcstdio {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kContentLength = "Content-Length:";

bool is_blank(std::string_view segment) {
    return std::all_of(segment.begin(), segment.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Finds "Content-Length:" followed by optional blanks and at least one digit.
std::optional<std::size_t> parse_content_length(std::string_view header) {
    auto pos = header.find(kContentLength);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += kContentLength.size();
    while (pos < header.size() && (header[pos] == ' ' || header[pos] == '\t')) {
        ++pos;
    }

    std::size_t value = 0;
    std::size_t digits = 0;
    while (pos < header.size() && std::isdigit(static_cast<unsigned char>(header[pos]))) {
        auto digit = static_cast<std::size_t>(header[pos] - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        ++digits;
        ++pos;
    }
    if (digits == 0) {
        return std::nullopt;
    }
    return value;
}

std::size_t decode_newline(std::string_view buffer, std::vector<std::string>& out) {
    std::size_t start = 0;
    for (;;) {
        auto end = buffer.find('\n', start);
        if (end == std::string_view::npos) {
            return start;
        }
        auto segment = buffer.substr(start, end - start);
        if (!is_blank(segment)) {
            out.emplace_back(segment);
        }
        start = end + 1;
    }
}

std::size_t decode_content_length(std::string_view buffer, std::vector<std::string>& out) {
    std::size_t start = 0;
    for (;;) {
        auto rest = buffer.substr(start);
        auto header_end = rest.find(kHeaderTerminator);
        if (header_end == std::string_view::npos) {
            return start;
        }

        auto length = parse_content_length(rest.substr(0, header_end));
        if (!length) {
            return start;
        }

        std::size_t content_start = header_end + kHeaderTerminator.size();
        if (rest.size() - content_start < *length) {
            return start;
        }

        out.emplace_back(rest.substr(content_start, *length));
        start += content_start + *length;
    }
}

std::size_t decode_into(std::string_view buffer, Framing framing, std::vector<std::string>& out) {
    switch (framing) {
    case Framing::newline:
        return decode_newline(buffer, out);
    case Framing::content_length:
        return decode_content_length(buffer, out);
    }
    return 0;
}

} // namespace

const char* to_string(Framing framing) {
    switch (framing) {
    case Framing::newline:
        return "newline";
    case Framing::content_length:
        return "content-length";
    }
    return "unknown";
}

Framing parse_framing(const std::string& name) {
    if (name == "newline") {
        return Framing::newline;
    }
    if (name == "content-length") {
        return Framing::content_length;
    }
    throw std::invalid_argument("unknown framing: " + name);
}

DecodeResult decode_frames(std::string_view buffer, Framing framing) {
    DecodeResult result;
    std::size_t consumed = decode_into(buffer, framing, result.messages);
    result.remainder.assign(buffer.substr(consumed));
    return result;
}

std::string encode_frame(std::string_view payload, Framing framing) {
    std::string frame;
    if (framing == Framing::content_length) {
        // std::string length is the UTF-8 byte count
        frame.reserve(payload.size() + 32);
        frame.append(kContentLength);
        frame.push_back(' ');
        frame.append(std::to_string(payload.size()));
        frame.append(kHeaderTerminator);
        frame.append(payload);
    } else {
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
    }
    return frame;
}

std::vector<std::string> FrameDecoder::feed(std::string_view chunk) {
    buffer_.append(chunk);

    std::vector<std::string> messages;
    std::size_t consumed = decode_into(buffer_, framing_, messages);
    buffer_.erase(0, consumed);
    return messages;
}

} // namespace rpcstdio
