#include "linkshare_digest.h"
#include "linkshare_receiver.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <memory>

using namespace linkshare;
using namespace linkshare::test;

namespace {

std::string hex_of(const Bytes& b) {
    return sha256_hex(std::string(b.begin(), b.end()));
}

class ReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.flush_threshold = 1000000;
        make();
    }

    void make() {
        rx.reset(new ReceiverEngine(ch, sched, cfg));
        rx->set_complete_handler([this](const TransferResult& r, ReceivedArtifact& a) {
            completed.push_back(r);
            artifact = std::move(a);
            acks_at_complete = ch.count("transfer_complete_ack");
            return store_ok;
        });
        rx->set_abort_handler([this](const TransferResult& r) { aborted.push_back(r); });
        rx->set_notice_handler([this](const std::string& n) { notices.push_back(n); });
        rx->set_offer_handler([this](const FileDescriptor& d) { offers.push_back(d); });
    }

    std::unique_ptr<RecordingDiskSink> disk() {
        return std::unique_ptr<RecordingDiskSink>(new RecordingDiskSink(sched, rec));
    }

    // Feeds `data` in `chunk`-sized pieces, letting pending completions run in between.
    void feed(const Bytes& data, std::size_t chunk = 65536) {
        for (std::size_t off = 0; off < data.size(); off += chunk) {
            const std::size_t n = std::min(chunk, data.size() - off);
            rx->on_chunk(Bytes(data.begin() + off, data.begin() + off + n));
            sched.run_ready();
        }
    }

    static FileDescriptor desc(const std::string& name, std::uint64_t size) {
        return FileDescriptor{name, size, "application/octet-stream"};
    }

    template<typename M>
    const M* last_sent() const {
        for (auto it = ch.sent_controls.rbegin(); it != ch.sent_controls.rend(); ++it)
            if (auto* m = std::get_if<M>(&*it)) return m;
        return nullptr;
    }

    const msg::Cancelled* last_cancel() const {
        for (auto it = ch.sent_controls.rbegin(); it != ch.sent_controls.rend(); ++it)
            if (auto* c = std::get_if<msg::Cancelled>(&*it)) return c;
        return nullptr;
    }

    ManualScheduler sched;
    FakeChannel ch{sched};
    Config cfg;
    std::shared_ptr<SinkRecord> rec = std::make_shared<SinkRecord>();
    std::unique_ptr<ReceiverEngine> rx;

    std::vector<FileDescriptor> offers;
    std::vector<TransferResult> completed;
    std::vector<TransferResult> aborted;
    std::vector<std::string> notices;
    ReceivedArtifact artifact;
    std::size_t acks_at_complete = 0;
    bool store_ok = true;
};

} // namespace

TEST_F(ReceiverTest, NothingIsStoredBeforeConfirmation) {
    rx->on_meta(desc("a.bin", 1000));
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].name, "a.bin");
    EXPECT_EQ(rx->state(), ReceiverState::AwaitingConfirmation);
    EXPECT_TRUE(rx->offer_pending());

    rx->on_chunk(pattern_bytes(400));
    EXPECT_EQ(rx->dropped_bytes(), 400u);
    EXPECT_EQ(rx->strategy(), nullptr);
    EXPECT_EQ(rx->session().bytes_transferred(), 0u);
    EXPECT_EQ(ch.count("ready_to_receive"), 0u);

    ASSERT_TRUE(rx->confirm(nullptr));
    EXPECT_EQ(rx->state(), ReceiverState::FallbackActive);
    EXPECT_EQ(ch.count("ready_to_receive"), 1u);
    EXPECT_FALSE(rx->confirm(nullptr));
    EXPECT_EQ(ch.count("ready_to_receive"), 1u);
}

TEST_F(ReceiverTest, InMemoryReceiveYieldsTheWholeFile) {
    const Bytes data = pattern_bytes(300000);
    rx->on_meta(desc("notes.txt", data.size()));
    ASSERT_TRUE(rx->confirm(nullptr));
    ASSERT_EQ(notices.size(), 1u);

    feed(data);
    rx->on_end(hex_of(data));
    sched.run_until_idle();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].status, TransferStatus::Completed);
    EXPECT_EQ(completed[0].bytes, data.size());
    EXPECT_EQ(completed[0].integrity, Integrity::Verified);
    EXPECT_FALSE(completed[0].degraded);
    EXPECT_EQ(artifact.sink_bytes, 0u);
    EXPECT_TRUE(artifact.sink_label.empty());
    EXPECT_EQ(artifact.memory, data);

    // the application stores the artifact before the sender hears about it
    EXPECT_EQ(acks_at_complete, 0u);
    EXPECT_EQ(ch.count("transfer_complete_ack"), 1u);
    EXPECT_EQ(rx->state(), ReceiverState::Complete);
    EXPECT_FALSE(rx->session_open());
    EXPECT_EQ(rx->session().progress_percent(), 100);
}

TEST_F(ReceiverTest, StreamingFlushesInOrderOneWriteAtATime) {
    const Bytes data = pattern_bytes(3500000, 11);
    rx->on_meta(desc("video.mp4", data.size()));
    ASSERT_TRUE(rx->confirm(disk()));
    EXPECT_EQ(rx->state(), ReceiverState::MotorActive);
    EXPECT_TRUE(notices.empty());

    feed(data);
    rx->on_end(hex_of(data));
    sched.run_until_idle();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_FALSE(completed[0].degraded);
    EXPECT_EQ(completed[0].integrity, Integrity::Verified);
    EXPECT_EQ(rec->data, data);
    EXPECT_EQ(rec->max_in_flight, 1);
    EXPECT_TRUE(rec->closed);
    EXPECT_FALSE(rec->aborted);

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < rec->write_sizes.size(); ++i) {
        sum += rec->write_sizes[i];
        if (i + 1 < rec->write_sizes.size()) EXPECT_GE(rec->write_sizes[i], cfg.flush_threshold);
    }
    EXPECT_EQ(sum, data.size());

    EXPECT_EQ(artifact.sink_bytes, data.size());
    EXPECT_TRUE(artifact.memory.empty());
    EXPECT_EQ(artifact.sink_label, "memory://sink");
    EXPECT_EQ(ch.count("transfer_complete_ack"), 1u);
}

TEST_F(ReceiverTest, WriteFailureDegradesToMemoryWithoutLosingBytes) {
    const Bytes data = pattern_bytes(10000000, 3);
    auto sink = disk();
    sink->fail_beyond_bytes = 5000000;
    rx->on_meta(desc("big.iso", data.size()));
    ASSERT_TRUE(rx->confirm(std::move(sink)));

    feed(data);
    EXPECT_EQ(rx->state(), ReceiverState::FallbackActive);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_GE(rec->failed_writes, 1);

    rx->on_end(hex_of(data));
    sched.run_until_idle();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_TRUE(completed[0].degraded);
    EXPECT_EQ(completed[0].integrity, Integrity::Verified);
    EXPECT_EQ(completed[0].bytes, data.size());

    EXPECT_LE(artifact.sink_bytes, 5000000u);
    EXPECT_EQ(artifact.sink_bytes, rec->data.size());
    EXPECT_EQ(artifact.total_bytes(), data.size());
    Bytes joined = rec->data;
    joined.insert(joined.end(), artifact.memory.begin(), artifact.memory.end());
    EXPECT_EQ(joined, data);
    EXPECT_TRUE(rec->closed);
    EXPECT_EQ(ch.count("transfer_complete_ack"), 1u);
}

TEST_F(ReceiverTest, FailedCloseAbortsTheTransfer) {
    const Bytes data = pattern_bytes(200000);
    auto sink = disk();
    sink->fail_close = true;
    rx->on_meta(desc("x.bin", data.size()));
    ASSERT_TRUE(rx->confirm(std::move(sink)));
    feed(data);
    rx->on_end(hex_of(data));
    sched.run_until_idle();

    EXPECT_TRUE(completed.empty());
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].status, TransferStatus::Failed);
    EXPECT_EQ(aborted[0].error, TransferError::SinkCloseFailed);
    ASSERT_NE(last_cancel(), nullptr);
    EXPECT_EQ(last_cancel()->origin, msg::CancelOrigin::Receiver);
    EXPECT_EQ(ch.count("transfer_complete_ack"), 0u);
}

TEST_F(ReceiverTest, DigestMismatchIsReportedButAcknowledged) {
    const Bytes data = pattern_bytes(1000);
    rx->on_meta(desc("m.bin", data.size()));
    ASSERT_TRUE(rx->confirm(nullptr));
    feed(data);
    rx->on_end(std::string(64, '0'));
    sched.run_until_idle();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].integrity, Integrity::Mismatch);
    EXPECT_EQ(completed[0].digest_hex, hex_of(data));
    EXPECT_EQ(ch.count("transfer_complete_ack"), 1u);
}

TEST_F(ReceiverTest, EndWithoutDigestStaysUnchecked) {
    rx->on_meta(desc("n.bin", 10));
    ASSERT_TRUE(rx->confirm(nullptr));
    feed(pattern_bytes(10));
    rx->on_end("");
    sched.run_until_idle();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].integrity, Integrity::Unchecked);
}

TEST_F(ReceiverTest, NewOfferSupersedesTheOpenSession) {
    rx->on_meta(desc("first.bin", 500000));
    ASSERT_TRUE(rx->confirm(disk()));
    feed(pattern_bytes(200000));

    rx->on_meta(desc("second.bin", 10));
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].descriptor.name, "first.bin");
    EXPECT_EQ(aborted[0].error, TransferError::Superseded);
    EXPECT_TRUE(rec->aborted);

    EXPECT_EQ(rx->state(), ReceiverState::AwaitingConfirmation);
    EXPECT_EQ(rx->session().descriptor().name, "second.bin");
    EXPECT_EQ(rx->session().bytes_transferred(), 0u);
    EXPECT_EQ(rx->strategy(), nullptr);

    ASSERT_TRUE(rx->confirm(nullptr));
    feed(pattern_bytes(10));
    rx->on_end("");
    sched.run_until_idle();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].bytes, 10u);
}

TEST_F(ReceiverTest, OversizedInMemoryReceiveIsRefused) {
    cfg.memory_limit = 1000;
    make();
    rx->on_meta(desc("huge.bin", 2000));
    EXPECT_FALSE(rx->confirm(nullptr));
    EXPECT_EQ(ch.count("ready_to_receive"), 0u);
    ASSERT_NE(last_cancel(), nullptr);
    EXPECT_EQ(last_cancel()->origin, msg::CancelOrigin::Receiver);
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].error, TransferError::FileTooLarge);
    EXPECT_EQ(rx->state(), ReceiverState::Idle);
}

TEST_F(ReceiverTest, DeclineTellsTheSender) {
    rx->on_meta(desc("spam.exe", 5));
    ASSERT_TRUE(rx->decline());
    ASSERT_NE(last_cancel(), nullptr);
    EXPECT_EQ(last_cancel()->origin, msg::CancelOrigin::Receiver);
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].error, TransferError::Declined);
    EXPECT_FALSE(rx->decline());
    EXPECT_FALSE(rx->confirm(nullptr));
}

TEST_F(ReceiverTest, CancelDiscardsThePartialFile) {
    rx->on_meta(desc("part.bin", 5000000));
    ASSERT_TRUE(rx->confirm(disk()));
    feed(pattern_bytes(2000000));
    ASSERT_TRUE(rx->cancel());
    EXPECT_TRUE(rec->aborted);
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].error, TransferError::LocalCancelled);
    EXPECT_EQ(rx->state(), ReceiverState::Idle);
    EXPECT_FALSE(rx->cancel());

    // late data from the sender is dropped
    rx->on_chunk(pattern_bytes(100));
    EXPECT_EQ(rx->dropped_bytes(), 100u);
}

TEST_F(ReceiverTest, RemoteCancelAndChannelCloseAbort) {
    rx->on_meta(desc("r.bin", 100));
    rx->on_cancelled("sender gave up");
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].error, TransferError::RemoteCancelled);
    EXPECT_EQ(ch.count("transfer_cancelled"), 0u);

    rx->on_meta(desc("s.bin", 100));
    ASSERT_TRUE(rx->confirm(nullptr));
    rx->on_channel_closed();
    ASSERT_EQ(aborted.size(), 2u);
    EXPECT_EQ(aborted[1].error, TransferError::ChannelClosed);

    rx->on_cancelled("");
    rx->on_channel_closed();
    EXPECT_EQ(aborted.size(), 2u);
}

TEST_F(ReceiverTest, OfferHandlerMayConfirmImmediately) {
    rx->set_offer_handler([this](const FileDescriptor&) { rx->confirm(nullptr); });
    rx->on_meta(desc("auto.bin", 20));
    EXPECT_EQ(rx->state(), ReceiverState::FallbackActive);
    EXPECT_EQ(ch.count("ready_to_receive"), 1u);
}

TEST_F(ReceiverTest, RepliesCarryTheOfferId) {
    const Bytes data = pattern_bytes(5000);
    rx->on_meta(desc("tagged.bin", data.size()), 42);
    ASSERT_TRUE(rx->confirm(nullptr));
    ASSERT_NE(last_sent<msg::ReadyToReceive>(), nullptr);
    EXPECT_EQ(last_sent<msg::ReadyToReceive>()->offer_id, 42u);

    feed(data);
    rx->on_end(hex_of(data));
    sched.run_until_idle();
    ASSERT_NE(last_sent<msg::TransferCompleteAck>(), nullptr);
    EXPECT_EQ(last_sent<msg::TransferCompleteAck>()->offer_id, 42u);
}

TEST_F(ReceiverTest, ShortStreamFailsInsteadOfCompleting) {
    rx->on_meta(desc("short.bin", 200000));
    ASSERT_TRUE(rx->confirm(nullptr));
    feed(pattern_bytes(150000));
    rx->on_end("");
    sched.run_until_idle();

    EXPECT_TRUE(completed.empty());
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].status, TransferStatus::Failed);
    EXPECT_EQ(aborted[0].error, TransferError::SizeMismatch);
    EXPECT_EQ(aborted[0].bytes, 150000u);
    ASSERT_NE(last_cancel(), nullptr);
    EXPECT_EQ(last_cancel()->origin, msg::CancelOrigin::Receiver);
    EXPECT_EQ(ch.count("transfer_complete_ack"), 0u);
    EXPECT_EQ(rx->state(), ReceiverState::Idle);
    EXPECT_LT(rx->session().progress_percent(), 100);
}

TEST_F(ReceiverTest, ChunksDroppedBeforeConfirmationFailTheFile) {
    const Bytes data = pattern_bytes(300000);
    rx->on_meta(desc("early.bin", data.size()));
    // the sender ran ahead of the confirmation
    rx->on_chunk(Bytes(data.begin(), data.begin() + 65536));
    ASSERT_TRUE(rx->confirm(disk()));
    feed(Bytes(data.begin() + 65536, data.end()));
    rx->on_end(hex_of(data));
    sched.run_until_idle();

    EXPECT_EQ(rx->dropped_bytes(), 65536u);
    EXPECT_TRUE(completed.empty());
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].error, TransferError::SizeMismatch);
    EXPECT_EQ(ch.count("transfer_complete_ack"), 0u);
}

TEST_F(ReceiverTest, LongStreamFailsToo) {
    rx->on_meta(desc("long.bin", 100));
    ASSERT_TRUE(rx->confirm(nullptr));
    feed(pattern_bytes(150));
    rx->on_end("");
    sched.run_until_idle();
    EXPECT_TRUE(completed.empty());
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].error, TransferError::SizeMismatch);
}

TEST_F(ReceiverTest, FailedStoreCancelsInsteadOfAcking) {
    store_ok = false;
    const Bytes data = pattern_bytes(100000);
    rx->on_meta(desc("nowhere.bin", data.size()));
    ASSERT_TRUE(rx->confirm(nullptr));
    feed(data);
    rx->on_end(hex_of(data));
    sched.run_until_idle();

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(ch.count("transfer_complete_ack"), 0u);
    ASSERT_NE(last_cancel(), nullptr);
    EXPECT_EQ(last_cancel()->origin, msg::CancelOrigin::Receiver);
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].status, TransferStatus::Failed);
    EXPECT_EQ(aborted[0].error, TransferError::SinkCloseFailed);
    EXPECT_EQ(rx->state(), ReceiverState::Idle);
}

TEST_F(ReceiverTest, DegradedTailOverMemoryLimitAborts) {
    cfg.memory_limit = 3000000;
    make();
    const Bytes data = pattern_bytes(10000000, 5);
    auto sink = disk();
    sink->fail_beyond_bytes = 5000000;
    rx->on_meta(desc("disk-full.iso", data.size()));
    ASSERT_TRUE(rx->confirm(std::move(sink)));

    feed(data);
    EXPECT_GE(rec->failed_writes, 1);
    EXPECT_TRUE(notices.empty());
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].status, TransferStatus::Failed);
    EXPECT_EQ(aborted[0].error, TransferError::FileTooLarge);
    EXPECT_TRUE(rec->aborted);
    ASSERT_NE(last_cancel(), nullptr);
    EXPECT_EQ(last_cancel()->origin, msg::CancelOrigin::Receiver);
    EXPECT_EQ(rx->state(), ReceiverState::Idle);
    // everything after the abort is dropped
    EXPECT_GT(rx->dropped_bytes(), 0u);

    rx->on_end(hex_of(data));
    sched.run_until_idle();
    EXPECT_TRUE(completed.empty());
    EXPECT_EQ(ch.count("transfer_complete_ack"), 0u);
}

TEST_F(ReceiverTest, ProgressIsMonotonicWhileStreaming) {
    cfg.telemetry_interval = std::chrono::milliseconds(2);
    make();
    std::vector<TelemetrySnapshot> progress;
    rx->set_progress_handler([&progress](const TelemetrySnapshot& t) { progress.push_back(t); });

    const Bytes data = pattern_bytes(2000000, 9);
    rx->on_meta(desc("stream.bin", data.size()));
    ASSERT_TRUE(rx->confirm(disk()));
    for (std::size_t off = 0; off < data.size(); off += 65536) {
        const std::size_t n = std::min<std::size_t>(65536, data.size() - off);
        rx->on_chunk(Bytes(data.begin() + off, data.begin() + off + n));
        sched.advance(std::chrono::milliseconds(1));
    }
    rx->on_end(hex_of(data));
    sched.run_until_idle();

    ASSERT_GE(progress.size(), 3u);
    for (std::size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i].progress_percent, progress[i - 1].progress_percent);
        EXPECT_GE(progress[i].bytes_transferred, progress[i - 1].bytes_transferred);
    }
    for (std::size_t i = 0; i + 1 < progress.size(); ++i) EXPECT_LT(progress[i].progress_percent, 100);
    EXPECT_EQ(progress.back().progress_percent, 100);
    EXPECT_TRUE(progress.back().complete);
    EXPECT_EQ(rec->data, data);
}
