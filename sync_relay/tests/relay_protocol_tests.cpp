#include "academy/sync/relay_protocol.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace academy::sync;

TEST_CASE("Channel commands carry a little-endian channel", "[sync][codec]") {
    REQUIRE(encode_command(Command{Tag::Connect}) == Bytes{'A'});
    REQUIRE(encode_command(Command{Tag::Start, 3}) == Bytes{'S', 0x03, 0x00});
    REQUIRE(encode_command(Command{Tag::Stop, 0x0102}) == Bytes{'E', 0x02, 0x01});
    REQUIRE(encode_command(Command{Tag::Reboot, 7}) == Bytes{'Y'});
}

TEST_CASE("Payload frames are eight bytes", "[sync][codec]") {
    const auto bytes = encode_frame(Frame{Tag::Edge, 3, 1, 0x01020304});
    REQUIRE(bytes == Bytes{'T', 0x03, 0x00, 0x01, 0x04, 0x03, 0x02, 0x01});
    REQUIRE(encode_frame(Frame{Tag::Disconnect}) == Bytes{'Z'});
}

TEST_CASE("FrameDecoder reassembles frames split across reads", "[sync][codec]") {
    FrameDecoder decoder;
    auto stream = encode_frame(Frame{Tag::Connect});
    const auto start = encode_frame(Frame{Tag::Start, 3, 1, 0});
    stream.insert(stream.end(), start.begin(), start.end());

    const auto first = decoder.feed(stream.data(), 4);
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].tag == Tag::Connect);
    REQUIRE_FALSE(decoder.idle());

    const auto second = decoder.feed(stream.data() + 4, stream.size() - 4);
    REQUIRE(second.size() == 1);
    REQUIRE(second[0] == Frame{Tag::Start, 3, 1, 0});
    REQUIRE(decoder.idle());
}

TEST_CASE("FrameDecoder skips noise between frames", "[sync][codec]") {
    FrameDecoder decoder;
    const auto frames = decoder.feed(Bytes{0x00, 'A', 0x7f, 'Z'});
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0].tag == Tag::Connect);
    REQUIRE(frames[1].tag == Tag::Disconnect);
    REQUIRE(decoder.skipped() == 2);
}

TEST_CASE("CommandDecoder waits for the channel bytes", "[sync][codec]") {
    CommandDecoder decoder;
    REQUIRE(decoder.feed(Bytes{'A', 'S', 0x05}).size() == 1);
    const auto rest = decoder.feed(Bytes{0x00, 'E', 0x05, 0x00});
    REQUIRE(rest.size() == 2);
    REQUIRE(rest[0] == Command{Tag::Start, 5});
    REQUIRE(rest[1] == Command{Tag::Stop, 5});
}
