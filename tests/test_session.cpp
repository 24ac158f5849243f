#include "linkshare_session.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace linkshare;
using std::chrono::milliseconds;

namespace {

const Clock::time_point T0 = Clock::time_point() + std::chrono::hours(1);

} // namespace

TEST(Session, ThroughputSampledAtMostOncePerInterval) {
    TransferSession s(milliseconds(300), 5);
    s.begin(FileDescriptor{"f", 1000000, ""}, T0);
    EXPECT_FALSE(s.add_bytes(1000, T0 + milliseconds(100)));
    EXPECT_EQ(s.throughput(), 0.0);
    EXPECT_TRUE(s.add_bytes(2000, T0 + milliseconds(300)));
    EXPECT_NEAR(s.throughput(), 10000.0, 1e-6);
    EXPECT_FALSE(s.add_bytes(500, T0 + milliseconds(500)));
    EXPECT_EQ(s.bytes_transferred(), 3500u);
}

TEST(Session, ProgressIsMonotonicAndCappedUntilComplete) {
    TransferSession s(milliseconds(0), 5);
    s.begin(FileDescriptor{"f", 1000, ""}, T0);
    int last = 0;
    for (int i = 1; i <= 10; ++i) {
        s.add_bytes(100, T0 + milliseconds(i));
        EXPECT_GE(s.progress_percent(), last);
        last = s.progress_percent();
    }
    EXPECT_EQ(s.bytes_transferred(), 1000u);
    EXPECT_EQ(s.progress_percent(), 99);
    s.complete();
    EXPECT_EQ(s.progress_percent(), 100);
    EXPECT_TRUE(s.snapshot().complete);
}

TEST(Session, ProgressFloorsPercent) {
    TransferSession s(milliseconds(0), 5);
    s.begin(FileDescriptor{"f", 3, ""}, T0);
    s.add_bytes(1, T0 + milliseconds(1));
    EXPECT_EQ(s.progress_percent(), 33);
    s.add_bytes(1, T0 + milliseconds(2));
    EXPECT_EQ(s.progress_percent(), 66);
}

TEST(Session, PeakAndEta) {
    TransferSession s(milliseconds(1000), 2);
    s.begin(FileDescriptor{"f", 10000, ""}, T0);
    EXPECT_LT(s.eta_seconds(), 0);
    s.add_bytes(2000, T0 + milliseconds(1000)); // 2000 B/s
    s.add_bytes(1000, T0 + milliseconds(2000)); // 1000 B/s
    EXPECT_DOUBLE_EQ(s.peak_throughput(), 2000.0);
    // mean of the window is 1500 B/s, 7000 bytes left
    EXPECT_NEAR(s.eta_seconds(), 7000.0 / 1500.0, 1e-9);
    s.add_bytes(1000, T0 + milliseconds(3000)); // window now {1000, 1000}
    EXPECT_NEAR(s.eta_seconds(), 6.0, 1e-9);
    EXPECT_DOUBLE_EQ(s.peak_throughput(), 2000.0);
}

TEST(Session, BeginResetsEverything) {
    TransferSession s(milliseconds(0), 5);
    s.begin(FileDescriptor{"old", 10, ""}, T0);
    s.add_bytes(7, T0 + milliseconds(5));
    s.begin(FileDescriptor{"new", 20, ""}, T0 + milliseconds(10));
    EXPECT_EQ(s.descriptor().name, "new");
    EXPECT_EQ(s.bytes_transferred(), 0u);
    EXPECT_EQ(s.progress_percent(), 0);
    EXPECT_EQ(s.peak_throughput(), 0.0);
}

TEST(Session, RestartClockKeepsBytes) {
    TransferSession s(milliseconds(100), 5);
    s.begin(FileDescriptor{"f", 100, ""}, T0);
    s.restart_clock(T0 + milliseconds(5000));
    EXPECT_TRUE(s.add_bytes(50, T0 + milliseconds(5100)));
    EXPECT_NEAR(s.throughput(), 500.0, 1e-6);
    auto r = s.make_result(TransferDirection::Receive, TransferStatus::Completed, TransferError::None,
                           T0 + milliseconds(5100));
    EXPECT_NEAR(r.elapsed_seconds, 0.1, 1e-9);
    EXPECT_EQ(r.bytes, 50u);
}

TEST(Session, ResultJson) {
    TransferResult r;
    r.descriptor = FileDescriptor{"a.txt", 3, "text/plain"};
    r.direction = TransferDirection::Receive;
    r.status = TransferStatus::Skipped;
    r.error = TransferError::HandshakeTimeout;
    r.integrity = Integrity::Verified;
    nlohmann::json j = r;
    EXPECT_EQ(j["name"], "a.txt");
    EXPECT_EQ(j["direction"], "receive");
    EXPECT_EQ(j["status"], "skipped");
    EXPECT_EQ(j["error"], "handshake timeout");
    EXPECT_EQ(j["integrity"], "verified");
}
