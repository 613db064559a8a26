// =============================================================================
// Unit tests for TrackDevicesSubscription
// =============================================================================
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include "track_devices.hpp"

using namespace snapadb;

namespace {

struct TrackPair {
    std::unique_ptr<TrackDevicesSubscription> sub;
    int peer = -1;

    TrackPair() {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
            sub.reset(new TrackDevicesSubscription(Connection::adopt(fds[0])));
            peer = fds[1];
        }
    }
    ~TrackPair() { closePeer(); }

    void write(const std::string& bytes) const {
        ssize_t n = ::write(peer, bytes.data(), bytes.size());
        (void)n;
    }
    void closePeer() {
        if (peer >= 0) ::close(peer);
        peer = -1;
    }
};

} // anonymous namespace

TEST(TrackDevicesTest, LengthPrefixedSnapshotsAreNormalized) {
    TrackPair tp;
    ASSERT_TRUE(tp.sub);
    tp.write("000Femulator-5554\tdevice0000");

    auto first = tp.sub->next();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(*first.value(), "List of devices attached\nemulator-5554\tdevice\n");

    auto second = tp.sub->next();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(*second.value(), "List of devices attached\n\n");
    EXPECT_EQ(tp.sub->mode(), protocol::TrackDevicesFramer::Mode::LengthPrefixed);
}

TEST(TrackDevicesTest, LineDelimitedWithTailAtEof) {
    TrackPair tp;
    tp.write("R5CT1\tdevice\n\nR5CT2\tdevice\n");
    tp.closePeer();

    auto first = tp.sub->next();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(*first.value(), "List of devices attached\nR5CT1\tdevice\n");

    auto tail = tp.sub->next();
    ASSERT_TRUE(tail.is_ok());
    ASSERT_TRUE(tail.value().has_value());
    EXPECT_EQ(*tail.value(), "List of devices attached\nR5CT2\tdevice\n");

    auto end = tp.sub->next();
    ASSERT_TRUE(end.is_ok());
    EXPECT_FALSE(end.value().has_value());
}

TEST(TrackDevicesTest, TruncatedFrameAtEofIsProtocolFailure) {
    TrackPair tp;
    tp.write("0020R5CT1");
    tp.closePeer();

    auto r = tp.sub->next();
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(AdbError::Kind::ProtocolFailure));
}

TEST(TrackDevicesTest, NonUtf8SnapshotIsParseFailure) {
    TrackPair tp;
    tp.write(std::string("0009R5CT\xff\tdev", 13));

    auto r = tp.sub->next();
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(AdbError::Kind::ParseFailure));
}

TEST(TrackDevicesTest, CancelUnblocksNext) {
    TrackPair tp;

    auto reader = std::async(std::launch::async, [&]() { return tp.sub->next(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    tp.sub->cancel();

    ASSERT_EQ(reader.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto r = reader.get();
    EXPECT_TRUE(r.is_err() || !r.value().has_value());
}
