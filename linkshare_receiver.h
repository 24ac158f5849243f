// Incoming side of a file transfer
#pragma once

#include "linkshare_channel.h"
#include "linkshare_config.h"
#include "linkshare_digest.h"
#include "linkshare_disk_sink.h"
#include "linkshare_event_loop.h"
#include "linkshare_receive_sink.h"
#include "linkshare_session.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace linkshare {

enum class ReceiverState {
    Idle,
    MetaReceived,
    AwaitingConfirmation,
    MotorActive,
    FallbackActive,
    Flushing,
    Complete,
};

const char* to_string(ReceiverState s);

// Accepts one incoming file at a time. Nothing is stored until the user
// confirms the offer; the confirmation picks the storage strategy
// (disk sink -> StreamingSink, none -> MemorySink) and only then is
// ReadyToReceive sent. The ack goes out after the strategy has drained.
//
// A Meta that arrives while a session is open aborts that session first.
class ReceiverEngine {
public:
    using OfferHandler = std::function<void(const FileDescriptor&)>;
    using ProgressHandler = std::function<void(const TelemetrySnapshot&)>;
    // Returns false when the artifact could not be stored; the peer then gets Cancelled instead of the ack.
    using CompleteHandler = std::function<bool(const TransferResult&, ReceivedArtifact&)>;
    using AbortHandler = std::function<void(const TransferResult&)>;
    using NoticeHandler = std::function<void(const std::string&)>;

    ReceiverEngine(Channel& channel, Scheduler& sched, const Config& cfg);

    ReceiverEngine(const ReceiverEngine&) = delete;
    ReceiverEngine& operator=(const ReceiverEngine&) = delete;

    // `offer_id` is echoed in ReadyToReceive and TransferCompleteAck.
    void on_meta(const FileDescriptor& d, std::uint64_t offer_id = 0);
    void on_chunk(Bytes chunk);
    void on_end(const std::string& sha256);
    void on_cancelled(const std::string& reason);
    void on_channel_closed();

    // User decisions for the pending offer. A null sink selects in-memory receive.
    bool confirm(std::unique_ptr<DiskSink> sink);
    bool decline(const std::string& reason = "declined by receiver");
    // Aborts an open session and tells the peer; false when nothing is open.
    bool cancel(const std::string& reason = "cancelled by receiver");

    void set_offer_handler(OfferHandler h) { offer_ = std::move(h); }
    void set_progress_handler(ProgressHandler h) { progress_ = std::move(h); }
    void set_complete_handler(CompleteHandler h) { complete_ = std::move(h); }
    void set_abort_handler(AbortHandler h) { aborted_ = std::move(h); }
    void set_notice_handler(NoticeHandler h) { notice_ = std::move(h); }

    ReceiverState state() const { return state_; }
    const TransferSession& session() const { return session_; }
    // True for Meta-received, awaiting confirmation, active and flushing
    bool session_open() const;
    bool offer_pending() const;
    const ReceiveSink* strategy() const { return strategy_.get(); }
    std::uint64_t dropped_bytes() const { return dropped_; }

private:
    void on_degraded(const std::string& err, std::uint64_t committed);
    void on_finished(std::uint64_t generation, bool ok, ReceivedArtifact artifact, const std::string& err);
    void abort_session(TransferStatus status, TransferError err);
    void send_cancel(const std::string& reason);
    void notice(const std::string& text);

    Channel& channel_;
    Scheduler& sched_;
    Config cfg_;

    TransferSession session_;
    Sha256 digest_;
    std::unique_ptr<ReceiveSink> strategy_;

    ReceiverState state_ = ReceiverState::Idle;
    std::uint64_t generation_ = 0;
    std::uint64_t offer_id_ = 0;
    std::uint64_t dropped_ = 0;
    std::string expected_digest_;
    bool overrun_reported_ = false;

    OfferHandler offer_;
    ProgressHandler progress_;
    CompleteHandler complete_;
    AbortHandler aborted_;
    NoticeHandler notice_;
};

} // namespace linkshare
