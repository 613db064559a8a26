// =============================================================================
// Unit tests for the ADB host protocol codec (src/adb_protocol.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <string>
#include "adb_protocol.hpp"

using namespace snapadb;
using namespace snapadb::protocol;

// Pulls every complete snapshot currently buffered.
static std::vector<std::string> drain(TrackDevicesFramer& framer) {
    std::vector<std::string> out;
    while (true) {
        auto r = framer.next();
        EXPECT_TRUE(r.is_ok());
        if (r.is_err() || !r.value()) break;
        out.push_back(*r.value());
    }
    return out;
}

// ===========================================================================
// Length fields
// ===========================================================================

TEST(AdbProtocolTest, FormatHexLengthIsUppercaseFourDigits) {
    EXPECT_EQ(formatHexLength(0), "0000");
    EXPECT_EQ(formatHexLength(12), "000C");
    EXPECT_EQ(formatHexLength(0xABCD), "ABCD");
}

TEST(AdbProtocolTest, ParseHexLengthAcceptsEitherCase) {
    EXPECT_EQ(parseHexLength("000c").value(), 12u);
    EXPECT_EQ(parseHexLength("FFFF").value(), 0xFFFFu);
    EXPECT_FALSE(parseHexLength("00G1").has_value());
    EXPECT_FALSE(parseHexLength("001").has_value());
    EXPECT_FALSE(parseHexLength("List").has_value());
}

TEST(AdbProtocolTest, EncodeRequest) {
    auto r = encodeRequest("host:version");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "000Chost:version");

    auto track = encodeRequest(request::trackDevices());
    EXPECT_EQ(track.value(), "0014host:track-devices-l");
}

TEST(AdbProtocolTest, EncodeRequestRejectsOversize) {
    auto r = encodeRequest(std::string(kMaxRequestBytes + 1, 'a'));
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(AdbError::Kind::ProtocolFailure));
}

TEST(AdbProtocolTest, LittleEndian32) {
    uint8_t buf[4];
    writeLE32(0x01020304u, buf);
    EXPECT_EQ(buf[0], 0x04);
    EXPECT_EQ(buf[3], 0x01);
    EXPECT_EQ(readLE32(buf), 0x01020304u);
}

TEST(AdbProtocolTest, EncodeSyncRequestAppendsNul) {
    auto r = encodeSyncRequest(kSyncRecv, "/sdcard/a.mp4");
    ASSERT_TRUE(r.is_ok());
    const std::string& s = r.value();
    ASSERT_EQ(s.size(), 4u + 4u + 13u + 1u);
    EXPECT_EQ(s.substr(0, 4), "RECV");
    EXPECT_EQ(readLE32(reinterpret_cast<const uint8_t*>(s.data() + 4)), 13u);
    EXPECT_EQ(s.substr(8, 13), "/sdcard/a.mp4");
    EXPECT_EQ(s.back(), '\0');
}

TEST(AdbProtocolTest, EncodeSyncRequestRejectsBadId) {
    EXPECT_TRUE(encodeSyncRequest("RCV", "/x").is_err());
}

// ===========================================================================
// Request strings
// ===========================================================================

TEST(AdbProtocolTest, RequestStrings) {
    EXPECT_EQ(request::devicesList(), "host:devices-l");
    EXPECT_EQ(request::transport("emulator-5554"), "host:transport:emulator-5554");
    EXPECT_EQ(request::shell("getprop"), "shell:getprop");
    EXPECT_EQ(request::exec("screencap -p"), "exec:screencap -p");
    EXPECT_EQ(request::sync(), "sync:");
    EXPECT_EQ(request::forward("R5CT1", 27183, "localabstract:snapo"),
              "host-serial:R5CT1:forward:tcp:27183;localabstract:snapo");
    EXPECT_EQ(request::killForward("R5CT1", 27183), "host-serial:R5CT1:killforward:tcp:27183");
}

TEST(AdbProtocolTest, NormalizeSnapshot) {
    EXPECT_EQ(normalizeSnapshot("emulator-5554\tdevice"),
              "List of devices attached\nemulator-5554\tdevice\n");
    EXPECT_EQ(normalizeSnapshot(""), "List of devices attached\n\n");
}

// ===========================================================================
// TrackDevicesFramer - length-prefixed
// ===========================================================================

TEST(TrackDevicesFramerTest, LengthPrefixedSequence) {
    TrackDevicesFramer framer;
    framer.feed("0005abcde0004wxyz");

    auto snapshots = drain(framer);
    EXPECT_EQ(framer.mode(), TrackDevicesFramer::Mode::LengthPrefixed);
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0], "abcde");
    EXPECT_EQ(snapshots[1], "wxyz");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(TrackDevicesFramerTest, LengthPrefixedSplitAcrossFeeds) {
    TrackDevicesFramer framer;
    framer.feed("00");
    EXPECT_TRUE(drain(framer).empty());
    EXPECT_EQ(framer.mode(), TrackDevicesFramer::Mode::Undecided);
    framer.feed("05ab");
    EXPECT_TRUE(drain(framer).empty());
    framer.feed("cde0000");

    auto snapshots = drain(framer);
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0], "abcde");
    EXPECT_EQ(snapshots[1], "");
}

TEST(TrackDevicesFramerTest, LengthPrefixedTruncatedAtEof) {
    TrackDevicesFramer framer;
    framer.feed("0010abc");
    EXPECT_TRUE(drain(framer).empty());

    auto tail = framer.finish();
    ASSERT_TRUE(tail.is_err());
    EXPECT_TRUE(tail.error().is(AdbError::Kind::ProtocolFailure));
}

TEST(TrackDevicesFramerTest, LengthPrefixedBadHeaderAfterFirstFrame) {
    TrackDevicesFramer framer;
    framer.feed("0001aZZZZ");
    auto first = framer.next();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(*first.value(), "a");

    auto second = framer.next();
    ASSERT_TRUE(second.is_err());
    EXPECT_TRUE(second.error().is(AdbError::Kind::ProtocolFailure));
}

// ===========================================================================
// TrackDevicesFramer - line-delimited
// ===========================================================================

TEST(TrackDevicesFramerTest, LineDelimitedBlocks) {
    TrackDevicesFramer framer;
    framer.feed("line1\nline2\n\nline3\n\n");

    auto snapshots = drain(framer);
    EXPECT_EQ(framer.mode(), TrackDevicesFramer::Mode::LineDelimited);
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0], "line1\nline2");
    EXPECT_EQ(snapshots[1], "line3");
}

TEST(TrackDevicesFramerTest, LineDelimitedCrlf) {
    TrackDevicesFramer framer;
    framer.feed("serial1\tdevice\r\n\r\nserial2\tdevice\r\n\r\n");

    auto snapshots = drain(framer);
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0], "serial1\tdevice");
    EXPECT_EQ(snapshots[1], "serial2\tdevice");
}

TEST(TrackDevicesFramerTest, LineDelimitedExtraBlankLines) {
    TrackDevicesFramer framer;
    framer.feed("serial1\tdevice\n\n\nserial2\tdevice\n\n\n\n\nserial3\tdevice\r\n\r\n\r\n");

    auto snapshots = drain(framer);
    ASSERT_EQ(snapshots.size(), 3u);
    EXPECT_EQ(snapshots[0], "serial1\tdevice");
    EXPECT_EQ(snapshots[1], "serial2\tdevice");
    EXPECT_EQ(snapshots[2], "serial3\tdevice");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(TrackDevicesFramerTest, LineDelimitedSplitSeparator) {
    TrackDevicesFramer framer;
    framer.feed("serial1\tdevice\n");
    EXPECT_TRUE(drain(framer).empty());
    framer.feed("\nserial2");

    auto snapshots = drain(framer);
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0], "serial1\tdevice");
}

TEST(TrackDevicesFramerTest, LineDelimitedTailReturnedByFinish) {
    TrackDevicesFramer framer;
    framer.feed("first\n\nsecond\n");
    EXPECT_EQ(drain(framer).size(), 1u);

    auto tail = framer.finish();
    ASSERT_TRUE(tail.is_ok());
    ASSERT_TRUE(tail.value().has_value());
    EXPECT_EQ(*tail.value(), "second");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(TrackDevicesFramerTest, FinishOnEmptyBufferYieldsNothing) {
    TrackDevicesFramer framer;
    auto tail = framer.finish();
    ASSERT_TRUE(tail.is_ok());
    EXPECT_FALSE(tail.value().has_value());
}
