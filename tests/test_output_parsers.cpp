// =============================================================================
// Unit tests for device output parsers (src/adb_output_parsers.hpp)
// Fixtures are trimmed copies of real device output.
// =============================================================================
#include <gtest/gtest.h>
#include <string>
#include "adb_output_parsers.hpp"

using namespace snapadb;
using namespace snapadb::parse;

// ===========================================================================
// getprop
// ===========================================================================

static const char* kGetpropDump =
    "[dalvik.vm.heapsize]: [512m]\n"
    "[ro.build.version.release]: [14]\n"
    "[ro.product.model]: [Pixel 7]\n"
    "[ro.product.vendor.manufacturer]: [Google]\n"
    "[ro.empty]: []\n"
    "garbage line\n"
    "[persist.sys.locale]: [en-US]\n";

TEST(OutputParsersTest, PropertyLine) {
    auto kv = parsePropertyLine("[ro.product.model]: [Pixel 7]");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "ro.product.model");
    EXPECT_EQ(kv->second, "Pixel 7");

    EXPECT_FALSE(parsePropertyLine("ro.product.model=Pixel").has_value());
    EXPECT_FALSE(parsePropertyLine("[ro.product.model]:").has_value());
}

TEST(OutputParsersTest, PropertiesWithoutPrefix) {
    auto props = parseProperties(kGetpropDump);
    EXPECT_EQ(props.size(), 6u);
    EXPECT_EQ(props["dalvik.vm.heapsize"], "512m");
    EXPECT_EQ(props["ro.empty"], "");
}

TEST(OutputParsersTest, PropertiesWithPrefix) {
    auto props = parseProperties(kGetpropDump, "ro.");
    EXPECT_EQ(props.size(), 4u);
    EXPECT_EQ(props.count("persist.sys.locale"), 0u);
    EXPECT_EQ(props["ro.build.version.release"], "14");
}

// ===========================================================================
// Display probes
// ===========================================================================

TEST(OutputParsersTest, CurrentDisplaySize) {
    std::string dumpsys =
        "WINDOW MANAGER DISPLAY CONTENTS (dumpsys window displays)\n"
        "  Display: mDisplayId=0 rotation=0\n"
        "    init=1080x2400 420dpi cur=1080x2400 app=1080x2337 rng=1080x1017-2337x2274\n";
    EXPECT_EQ(parseCurrentDisplaySize(dumpsys).value(), "1080x2400");
    EXPECT_FALSE(parseCurrentDisplaySize("no display here").has_value());
}

TEST(OutputParsersTest, WmSizePrefersOverride) {
    EXPECT_EQ(parseWmSize("Physical size: 1440x3120\n").value(), "1440x3120");
    EXPECT_EQ(parseWmSize("Physical size: 1440x3120\nOverride size: 1080x2340\n").value(), "1080x2340");
    EXPECT_FALSE(parseWmSize("").has_value());
}

TEST(OutputParsersTest, Density) {
    EXPECT_EQ(parseDensity("Physical density: 420\n").value(), 420);
    EXPECT_EQ(parseDensity("Physical density: 560\nOverride density: 480\n").value(), 560);
    EXPECT_EQ(parseDensity("320\n").value(), 320);
    EXPECT_FALSE(parseDensity("0").has_value());
    EXPECT_FALSE(parseDensity("").has_value());
    EXPECT_FALSE(parseDensity("unknown").has_value());
}

// ===========================================================================
// Device list
// ===========================================================================

TEST(OutputParsersTest, DeviceRowWithFields) {
    auto row = parseDeviceRow(
        "R5CT123ABCD            device usb:1-1 product:a54xnaeea model:SM_A546B device:a54x transport_id:3");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->serial, "R5CT123ABCD");
    EXPECT_EQ(row->state, "device");
    EXPECT_EQ(row->fields["model"], "SM_A546B");
    EXPECT_EQ(row->fields["transport_id"], "3");
}

TEST(OutputParsersTest, DeviceRowSkipsNoiseAndBadStates) {
    EXPECT_FALSE(parseDeviceRow("").has_value());
    EXPECT_FALSE(parseDeviceRow("List of devices attached").has_value());
    EXPECT_FALSE(parseDeviceRow("* daemon started successfully").has_value());
    EXPECT_FALSE(parseDeviceRow("emulator-5556\toffline").has_value());
    EXPECT_FALSE(parseDeviceRow("R5CT1\tunauthorized usb:1-2").has_value());
    EXPECT_FALSE(parseDeviceRow("R5CT2\trecovery").has_value());
    EXPECT_FALSE(parseDeviceRow("R5CT3\tauthorizing").has_value());
}

TEST(OutputParsersTest, DeviceListDeduplicatesInOrder) {
    std::string snapshot =
        "List of devices attached\n"
        "emulator-5554\tdevice product:sdk_gphone64 model:sdk_gphone64_x86_64\n"
        "R5CT1\toffline\n"
        "192.168.0.5:5555\tdevice\n"
        "emulator-5554\tdevice\n"
        "\n";
    auto rows = parseDeviceList(snapshot);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].serial, "emulator-5554");
    EXPECT_EQ(rows[0].fields["model"], "sdk_gphone64_x86_64");
    EXPECT_EQ(rows[1].serial, "192.168.0.5:5555");
}

TEST(OutputParsersTest, EmptySnapshot) {
    EXPECT_TRUE(parseDeviceList("List of devices attached\n\n").empty());
}

// ===========================================================================
// /proc/net/unix
// ===========================================================================

TEST(OutputParsersTest, AbstractSocketsWithPrefix) {
    std::string table =
        "Num       RefCount Protocol Flags    Type St Inode Path\n"
        "0000000000000000: 00000002 00000000 00010000 0001 01 24013 @snapo_server_200\n"
        "0000000000000000: 00000002 00000000 00010000 0001 01 24014 @snapo_server_100\n"
        "0000000000000000: 00000002 00000000 00010000 0001 01 24015 @snapo_server_100\n"
        "0000000000000000: 00000002 00000000 00010000 0001 01 24016 @webview_devtools_remote\n"
        "0000000000000000: 00000002 00000000 00010000 0001 01 24017 /dev/socket/zygote\n"
        "0000000000000000: 00000003 00000000 00000000 0001 03 24018\n";
    auto names = parseAbstractSockets(table, "snapo_");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "snapo_server_100");
    EXPECT_EQ(names[1], "snapo_server_200");

    EXPECT_TRUE(parseAbstractSockets(table, "nothing_").empty());
}

// ===========================================================================
// Recording
// ===========================================================================

TEST(OutputParsersTest, Pid) {
    EXPECT_EQ(parsePid("12345\r").value(), 12345);
    EXPECT_FALSE(parsePid("").has_value());
    EXPECT_FALSE(parsePid("sh: not found").has_value());
    EXPECT_FALSE(parsePid("0").has_value());
}

TEST(OutputParsersTest, ExitTrailerUsesLastOccurrence) {
    EXPECT_EQ(parseExitTrailer("__SNAPADB_EXIT__:0\n").value(), 0);
    EXPECT_EQ(parseExitTrailer("noise\n__SNAPADB_EXIT__:1\n__SNAPADB_EXIT__:130\n").value(), 130);
    EXPECT_FALSE(parseExitTrailer("screenrecord output only\n").has_value());
    EXPECT_FALSE(parseExitTrailer("__SNAPADB_EXIT__:\n").has_value());
}

TEST(OutputParsersTest, RecordingExitClassification) {
    EXPECT_TRUE(classifyRecordingExit(0, "__SNAPADB_EXIT__:0\n").is_ok());
    EXPECT_TRUE(classifyRecordingExit(130, "__SNAPADB_EXIT__:130\n").is_ok());
    EXPECT_TRUE(classifyRecordingExit(std::nullopt, "").is_ok());

    auto failed = classifyRecordingExit(1, "Unable to open '/data/local/tmp/x.mp4'\n__SNAPADB_EXIT__:1\n");
    ASSERT_TRUE(failed.is_err());
    EXPECT_TRUE(failed.error().is(AdbError::Kind::NonZeroExit));
    EXPECT_EQ(failed.error().code, 1);
    EXPECT_EQ(failed.error().stderr_text, "Unable to open '/data/local/tmp/x.mp4'");
}

// ===========================================================================
// Misc
// ===========================================================================

TEST(OutputParsersTest, ShowTouches) {
    EXPECT_TRUE(parseShowTouches("1\n"));
    EXPECT_FALSE(parseShowTouches("0\n"));
    EXPECT_FALSE(parseShowTouches("null\n"));
}

TEST(OutputParsersTest, Trim) {
    EXPECT_EQ(trim("  a b \r\n"), "a b");
    EXPECT_EQ(trim("\t\n"), "");
}

TEST(OutputParsersTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("[ro.product.model]: [Pixel 7]\n"));
    EXPECT_TRUE(isValidUtf8("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x93\xb1"));
    EXPECT_FALSE(isValidUtf8(std::string("\xff\xfe\x80 bad", 7)));
    EXPECT_FALSE(isValidUtf8("\xc0\xaf"));           // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));       // surrogate
    EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));   // past U+10FFFF
    EXPECT_FALSE(isValidUtf8("abc\xe2\x82"));         // truncated
}
