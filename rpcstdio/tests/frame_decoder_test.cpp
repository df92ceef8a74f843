#include <gtest/gtest.h>

#include "frame_decoder.hpp"

#include <string>
#include <vector>

using rpcstdio::DecodeResult;
using rpcstdio::FrameDecoder;
using rpcstdio::Framing;

namespace {

std::string content_length_frame(const std::string& body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::vector<std::string> feed_in_pieces(Framing framing, const std::string& stream, const std::vector<std::size_t>& cuts) {
    FrameDecoder decoder(framing);
    std::vector<std::string> messages;
    std::size_t start = 0;
    for (std::size_t cut : cuts) {
        auto batch = decoder.feed(std::string_view(stream).substr(start, cut - start));
        messages.insert(messages.end(), batch.begin(), batch.end());
        start = cut;
    }
    auto batch = decoder.feed(std::string_view(stream).substr(start));
    messages.insert(messages.end(), batch.begin(), batch.end());
    return messages;
}

} // namespace

TEST(FrameDecoder, ContentLengthWaitsForBody) {
    const std::string body = R"({"jsonrpc":"2.0","id":1,"result":"ok"})";
    FrameDecoder decoder(Framing::content_length);

    EXPECT_TRUE(decoder.feed("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n").empty());

    auto messages = decoder.feed(body);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], body);
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoder, NewlineKeepsPartialRemainder) {
    const std::string chunk = R"({"jsonrpc":"2.0","id":"a1"})" "\n" R"({"jsonrpc":"2.0","id")";
    DecodeResult result = rpcstdio::decode_frames(chunk, Framing::newline);

    ASSERT_EQ(result.messages.size(), 1u);
    EXPECT_EQ(result.messages[0], R"({"jsonrpc":"2.0","id":"a1"})");
    EXPECT_EQ(result.remainder, R"({"jsonrpc":"2.0","id")");
}

TEST(FrameDecoder, NewlineDropsBlankLines) {
    FrameDecoder decoder(Framing::newline);
    auto messages = decoder.feed("\n   \n{\"a\":1}\r\n\t\n{\"b\":2}\n");

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "{\"a\":1}\r");
    EXPECT_EQ(messages[1], "{\"b\":2}");
}

TEST(FrameDecoder, ContentLengthDecodesSeveralFramesFromOneChunk) {
    std::string stream = content_length_frame("{\"a\":1}") + content_length_frame("{\"b\":2}") +
                         content_length_frame("{\"c\":3}") + "Content-Len";
    DecodeResult result = rpcstdio::decode_frames(stream, Framing::content_length);

    ASSERT_EQ(result.messages.size(), 3u);
    EXPECT_EQ(result.messages[0], "{\"a\":1}");
    EXPECT_EQ(result.messages[1], "{\"b\":2}");
    EXPECT_EQ(result.messages[2], "{\"c\":3}");
    EXPECT_EQ(result.remainder, "Content-Len");
}

TEST(FrameDecoder, ContentLengthAcceptsExtraHeaders) {
    std::string stream = "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
                         "Content-Length: 7\r\n\r\n{\"a\":1}";
    DecodeResult result = rpcstdio::decode_frames(stream, Framing::content_length);

    ASSERT_EQ(result.messages.size(), 1u);
    EXPECT_EQ(result.messages[0], "{\"a\":1}");
    EXPECT_TRUE(result.remainder.empty());
}

TEST(FrameDecoder, ContentLengthWithoutLengthHeaderStalls) {
    std::string stream = "X-Other: 1\r\n\r\n{}" + content_length_frame("{}");
    DecodeResult result = rpcstdio::decode_frames(stream, Framing::content_length);

    EXPECT_TRUE(result.messages.empty());
    EXPECT_EQ(result.remainder, stream);
}

TEST(FrameDecoder, ContentLengthCountsBytesNotCharacters) {
    const std::string body = "{\"text\":\"h\xC3\xA9llo \xE2\x9C\x93\"}";
    std::string frame = rpcstdio::encode_frame(body, Framing::content_length);

    EXPECT_EQ(frame.rfind("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n", 0), 0u);

    FrameDecoder decoder(Framing::content_length);
    auto messages = decoder.feed(frame);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], body);
}

TEST(FrameDecoder, NewlineEncodingAppendsTerminator) {
    EXPECT_EQ(rpcstdio::encode_frame("{}", Framing::newline), "{}\n");
}

TEST(FrameDecoder, EverySplitPointYieldsSameMessages) {
    const std::vector<std::string> bodies = {
        R"({"jsonrpc":"2.0","id":1,"result":"ok"})",
        R"({"jsonrpc":"2.0","method":"note","params":{"x":[1,2]}})",
        R"({"jsonrpc":"2.0","id":"z","error":{"code":-1,"message":"no"}})",
    };

    for (Framing framing : {Framing::newline, Framing::content_length}) {
        std::string stream;
        for (const auto& body : bodies) {
            stream += rpcstdio::encode_frame(body, framing);
        }

        auto whole = rpcstdio::decode_frames(stream, framing).messages;
        ASSERT_EQ(whole, bodies) << rpcstdio::to_string(framing);

        for (std::size_t a = 0; a <= stream.size(); ++a) {
            for (std::size_t b = a; b <= stream.size(); b += 7) {
                EXPECT_EQ(feed_in_pieces(framing, stream, {a, b}), bodies)
                    << rpcstdio::to_string(framing) << " split at " << a << "," << b;
            }
        }
    }
}

TEST(FrameDecoder, ParsesFramingNames) {
    EXPECT_EQ(rpcstdio::parse_framing("newline"), Framing::newline);
    EXPECT_EQ(rpcstdio::parse_framing("content-length"), Framing::content_length);
    EXPECT_THROW(rpcstdio::parse_framing("lsp"), std::invalid_argument);
}
